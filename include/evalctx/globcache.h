#pragma once

#include <evalctx/fwd/existencecache.h>
#include <evalctx/fwd/globcache.h>

#include <evalctx/base/cache.h>
#include <evalctx/base/path.h>
#include <evalctx/base/stringview.h>

#include <evalctx/pathnormalizer.h>

#include <string>
#include <vector>

namespace evalctx
{
    // Walks `fixed_directory_root` according to `pattern_remainder` and returns the matching files relative to the
    // root, in traversal order: the files of a directory come before the contents of its subdirectories, and entries
    // keep the order the filesystem enumerates them in. Directories that cannot be listed contribute nothing.
    std::vector<std::string> traverse_glob(const GlobCacheKey& key, const ExistenceCache& existence);

    // Memoizes glob expansions for the lifetime of the owning EvaluationContext.
    struct GlobExpansionCache
    {
        GlobExpansionCache() = default;
        GlobExpansionCache(const GlobExpansionCache&) = delete;
        GlobExpansionCache& operator=(const GlobExpansionCache&) = delete;

        // Expands `file_spec` relative to `base_directory` (absolute). Results are spelled as the spec's fixed
        // directory part as written followed by the match relative to that part, so relative specs produce relative
        // results and absolute specs absolute ones. A spec without wildcards, or an illegal one, is returned unchanged
        // as the only element without consulting the cache or the filesystem.
        std::vector<std::string> expand(StringView file_spec,
                                        const Path& base_directory,
                                        const ExistenceCache& existence) const;

        // The memoized entry for `key`; matches are relative to key.fixed_directory_root.
        const std::vector<std::string>& get_or_traverse(const GlobCacheKey& key, const ExistenceCache& existence) const;

        size_t size() const;

    private:
        Cache<GlobCacheKey, std::vector<std::string>> m_entries;
    };
}
