#pragma once

#include <evalctx/fwd/filespec.h>

#include <evalctx/base/stringview.h>

#include <string>

namespace evalctx
{
    // A file spec such as "src/**/obj/*.cs" split at its first wildcard:
    //   fixed_directory_part    "src/"
    //   wildcard_directory_part "**/obj/"
    //   filename_part           "*.cs"
    // Directory parts keep their trailing '/'; any part may be empty.
    struct FileSpecParts
    {
        std::string fixed_directory_part;
        std::string wildcard_directory_part;
        std::string filename_part;
    };

    // Rewrites every '\' as '/'.
    std::string normalize_file_spec_separators(StringView spec);

    bool has_wildcards(StringView spec) noexcept;

    // `spec` must already use '/' separators.
    FileSpecParts split_file_spec(StringView spec);

    // A spec is illegal when a "**" does not make up a whole path segment or when ".." follows the first wildcard.
    // Illegal specs are never expanded.
    bool is_legal_file_spec(const FileSpecParts& parts);

    // Matches a single path segment; '*' matches any run of characters and '?' exactly one.
    bool wildcard_match(StringView pattern, StringView text) noexcept;

    // Matches a '/'-separated path against a '/'-separated spec, segment by segment. A "**" segment matches zero or
    // more segments, and a trailing "**" matches any non-empty remainder. "." segments are ignored on both sides.
    bool file_spec_matches(StringView spec, StringView path);
}
