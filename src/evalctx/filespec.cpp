#include <evalctx/base/strings.h>

#include <evalctx/filespec.h>

#include <algorithm>
#include <vector>

namespace
{
    using namespace evalctx;

    constexpr StringLiteral RecursiveDirectoryMatch = "**";

    bool is_wildcard(char c) noexcept { return c == '*' || c == '?'; }

    std::vector<std::string> split_segments(StringView path)
    {
        auto segments = Strings::split(path, '/');
        segments.erase(std::remove(segments.begin(), segments.end(), "."), segments.end());
        return segments;
    }

    bool match_segments(const std::vector<std::string>& pattern,
                        size_t pattern_index,
                        const std::vector<std::string>& path,
                        size_t path_index)
    {
        while (pattern_index < pattern.size())
        {
            if (pattern[pattern_index] == RecursiveDirectoryMatch)
            {
                if (pattern_index + 1 == pattern.size())
                {
                    return path_index < path.size();
                }

                for (size_t skipped = path_index; skipped <= path.size(); ++skipped)
                {
                    if (match_segments(pattern, pattern_index + 1, path, skipped))
                    {
                        return true;
                    }
                }

                return false;
            }

            if (path_index == path.size() || !wildcard_match(pattern[pattern_index], path[path_index]))
            {
                return false;
            }

            ++pattern_index;
            ++path_index;
        }

        return path_index == path.size();
    }

    bool is_legal_segment(StringView segment)
    {
        if (segment == RecursiveDirectoryMatch)
        {
            return true;
        }

        const auto first = segment.begin();
        const auto last = segment.end();
        if (std::adjacent_find(first, last, [](char a, char b) { return a == '*' && b == '*'; }) != last)
        {
            return false;
        }

        return segment != "..";
    }
}

namespace evalctx
{
    std::string normalize_file_spec_separators(StringView spec)
    {
        auto result = spec.to_string();
        Strings::inplace_replace_all(result, '\\', '/');
        return result;
    }

    bool has_wildcards(StringView spec) noexcept { return std::any_of(spec.begin(), spec.end(), is_wildcard); }

    FileSpecParts split_file_spec(StringView spec)
    {
        FileSpecParts parts;
        const auto first = spec.begin();
        const auto last = spec.end();
        const auto first_wildcard = std::find_if(first, last, is_wildcard);

        // the fixed part ends at the last separator before the first wildcard
        auto fixed_end = first_wildcard;
        while (fixed_end != first && fixed_end[-1] != '/')
        {
            --fixed_end;
        }

        auto filename_start = last;
        while (filename_start != fixed_end && filename_start[-1] != '/')
        {
            --filename_start;
        }

        parts.fixed_directory_part.assign(first, fixed_end);
        parts.wildcard_directory_part.assign(fixed_end, filename_start);
        parts.filename_part.assign(filename_start, last);
        return parts;
    }

    bool is_legal_file_spec(const FileSpecParts& parts)
    {
        for (auto&& segment : Strings::split(parts.wildcard_directory_part, '/'))
        {
            if (!is_legal_segment(segment))
            {
                return false;
            }
        }

        return is_legal_segment(parts.filename_part);
    }

    bool wildcard_match(StringView pattern, StringView text) noexcept
    {
        size_t p = 0;
        size_t t = 0;
        size_t star = std::string::npos;
        size_t star_text = 0;
        while (t < text.size())
        {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]))
            {
                ++p;
                ++t;
            }
            else if (p < pattern.size() && pattern[p] == '*')
            {
                star = p++;
                star_text = t;
            }
            else if (star != std::string::npos)
            {
                // let the last '*' swallow one more character
                p = star + 1;
                t = ++star_text;
            }
            else
            {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*')
        {
            ++p;
        }

        return p == pattern.size();
    }

    bool file_spec_matches(StringView spec, StringView path)
    {
        return match_segments(split_segments(spec), 0, split_segments(path), 0);
    }
}
