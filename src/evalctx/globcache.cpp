#include <evalctx/base/files.h>
#include <evalctx/base/strings.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/existencecache.h>
#include <evalctx/filespec.h>
#include <evalctx/globcache.h>

#include <algorithm>
#include <set>

namespace
{
    using namespace evalctx;

    struct GlobTraversal
    {
        const ExistenceCache& existence;
        const std::vector<std::string>& directory_patterns;
        const std::string& filename_pattern;
        std::vector<std::string> results;
        std::set<std::string> seen;

        void add_result(std::string&& relative)
        {
            if (seen.insert(relative).second)
            {
                results.push_back(std::move(relative));
            }
        }

        void walk(const Path& directory, const std::string& relative_prefix, size_t pattern_index)
        {
            const auto& maybe_entries = existence.directory_entries(directory);
            const auto entries = maybe_entries.get();
            if (!entries)
            {
                Debug::println("Skipping ", directory, ": ", maybe_entries.error());
                return;
            }

            if (pattern_index == directory_patterns.size())
            {
                for (auto&& entry : *entries)
                {
                    if (entry.type != FileType::directory && wildcard_match(filename_pattern, entry.name))
                    {
                        add_result(relative_prefix + entry.name);
                    }
                }

                return;
            }

            const auto& directory_pattern = directory_patterns[pattern_index];
            if (directory_pattern == "**")
            {
                // zero directories first, then one more level below each subdirectory
                walk(directory, relative_prefix, pattern_index + 1);
                for (auto&& entry : *entries)
                {
                    if (entry.type == FileType::directory)
                    {
                        walk(directory / entry.name, Strings::concat(relative_prefix, entry.name, '/'), pattern_index);
                    }
                }

                return;
            }

            for (auto&& entry : *entries)
            {
                if (entry.type == FileType::directory && wildcard_match(directory_pattern, entry.name))
                {
                    walk(directory / entry.name, Strings::concat(relative_prefix, entry.name, '/'), pattern_index + 1);
                }
            }
        }
    };
}

namespace evalctx
{
    std::vector<std::string> traverse_glob(const GlobCacheKey& key, const ExistenceCache& existence)
    {
        const auto last_separator = key.pattern_remainder.rfind('/');
        std::vector<std::string> directory_patterns;
        std::string filename_pattern;
        if (last_separator == std::string::npos)
        {
            filename_pattern = key.pattern_remainder;
        }
        else
        {
            directory_patterns = Strings::split(StringView{key.pattern_remainder}.substr(0, last_separator), '/');
            filename_pattern = key.pattern_remainder.substr(last_separator + 1);
        }

        // "." segments do not change the directory
        directory_patterns.erase(std::remove(directory_patterns.begin(), directory_patterns.end(), "."),
                                 directory_patterns.end());
        // consecutive "**" segments match the same directories as one
        directory_patterns.erase(
            std::unique(directory_patterns.begin(),
                        directory_patterns.end(),
                        [](const std::string& lhs, const std::string& rhs) { return lhs == "**" && rhs == "**"; }),
            directory_patterns.end());

        GlobTraversal traversal{existence, directory_patterns, filename_pattern, {}, {}};
        traversal.walk(key.fixed_directory_root, std::string(), 0);
        return std::move(traversal.results);
    }

    std::vector<std::string> GlobExpansionCache::expand(StringView file_spec,
                                                        const Path& base_directory,
                                                        const ExistenceCache& existence) const
    {
        if (!has_wildcards(file_spec))
        {
            return {file_spec.to_string()};
        }

        const auto parts = split_file_spec(normalize_file_spec_separators(file_spec));
        if (!is_legal_file_spec(parts))
        {
            Debug::println("Not expanding illegal file spec ", file_spec);
            return {file_spec.to_string()};
        }

        const auto key = PathNormalizer::make_glob_cache_key(base_directory, parts);
        const auto& relative_matches = get_or_traverse(key, existence);
        std::vector<std::string> results;
        results.reserve(relative_matches.size());
        for (auto&& relative_match : relative_matches)
        {
            results.push_back(parts.fixed_directory_part + relative_match);
        }

        return results;
    }

    const std::vector<std::string>& GlobExpansionCache::get_or_traverse(const GlobCacheKey& key,
                                                                       const ExistenceCache& existence) const
    {
        return m_entries.get_lazy(key, [&]() {
            Debug::println("Glob ", key, " is not cached in this evaluation context");
            return traverse_glob(key, existence);
        });
    }

    size_t GlobExpansionCache::size() const { return m_entries.size(); }
}
