#pragma once

#include <evalctx/fwd/filespec.h>
#include <evalctx/fwd/pathnormalizer.h>

#include <evalctx/base/fmt.h>
#include <evalctx/base/path.h>
#include <evalctx/base/stringview.h>

#include <string>

namespace evalctx
{
    // Identifies one glob expansion: the absolute normalized directory the expansion starts from (the fixed
    // directory root) and the wildcard part of the spec relative to it. Two specs spelled differently share a key
    // whenever they resolve to the same root and remainder.
    struct GlobCacheKey
    {
        Path fixed_directory_root;
        std::string pattern_remainder;

        std::string to_string() const;
        void to_string(std::string& out) const;

        friend bool operator==(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept;
        friend bool operator!=(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept;
        friend bool operator<(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept;
    };

    namespace PathNormalizer
    {
        // '\' becomes '/', repeated separators collapse, "." and "x/.." segments are removed lexically, and a
        // trailing separator is dropped unless the result is the root.
        Path normalize(StringView path);

        // Resolves `path` against `base_directory` (which must be absolute) and normalizes the result.
        Path resolve(const Path& base_directory, StringView path);

        GlobCacheKey make_glob_cache_key(const Path& base_directory, const FileSpecParts& parts);
    }
}

EVALCTX_FORMAT_WITH_TO_STRING(evalctx::GlobCacheKey);
