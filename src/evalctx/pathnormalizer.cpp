#include <evalctx/base/checks.h>
#include <evalctx/base/strings.h>

#include <evalctx/filespec.h>
#include <evalctx/pathnormalizer.h>

namespace evalctx
{
    std::string GlobCacheKey::to_string() const { return adapt_to_string(*this); }
    void GlobCacheKey::to_string(std::string& out) const
    {
        Strings::append(out, fixed_directory_root, '|', pattern_remainder);
    }

    bool operator==(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept
    {
        return lhs.fixed_directory_root.native() == rhs.fixed_directory_root.native() &&
               lhs.pattern_remainder == rhs.pattern_remainder;
    }

    bool operator!=(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept { return !(lhs == rhs); }

    bool operator<(const GlobCacheKey& lhs, const GlobCacheKey& rhs) noexcept
    {
        const auto& left_root = lhs.fixed_directory_root.native();
        const auto& right_root = rhs.fixed_directory_root.native();
        if (left_root != right_root)
        {
            return left_root < right_root;
        }

        return lhs.pattern_remainder < rhs.pattern_remainder;
    }

    Path PathNormalizer::normalize(StringView path)
    {
        auto text = Path(normalize_file_spec_separators(path)).lexically_normal().native();
        if (text.size() > 1 && text.back() == '/')
        {
            text.pop_back();
        }

        return text;
    }

    Path PathNormalizer::resolve(const Path& base_directory, StringView path)
    {
        Checks::check_exit(EVALCTX_LINE_INFO, base_directory.is_absolute(), "base directory must be absolute");
        return normalize((base_directory / normalize_file_spec_separators(path)).native());
    }

    GlobCacheKey PathNormalizer::make_glob_cache_key(const Path& base_directory, const FileSpecParts& parts)
    {
        GlobCacheKey key;
        key.fixed_directory_root = resolve(base_directory, parts.fixed_directory_part);
        key.pattern_remainder = parts.wildcard_directory_part;
        // a filename of "**" means every file below the root
        if (parts.filename_part == "**")
        {
            key.pattern_remainder.append("**/*");
        }
        else
        {
            key.pattern_remainder.append(parts.filename_part);
        }

        return key;
    }
}
