#pragma once

#include <evalctx/base/fwd/files.h>

#include <evalctx/fwd/existencecache.h>

#include <evalctx/base/cache.h>
#include <evalctx/base/expected.h>
#include <evalctx/base/files.h>
#include <evalctx/base/path.h>

#include <string>
#include <vector>

namespace evalctx
{
    // Memoizes filesystem probes for the lifetime of the owning EvaluationContext. Each distinct path is probed at
    // most once for its status and at most once for its directory entries; later changes on disk are not observed.
    struct ExistenceCache
    {
        explicit ExistenceCache(const ReadOnlyFilesystem& fs);
        ExistenceCache(const ExistenceCache&) = delete;
        ExistenceCache& operator=(const ExistenceCache&) = delete;

        const ReadOnlyFilesystem& file_system() const noexcept { return m_fs; }

        // A path whose status cannot be determined is reported as FileType::none, which does not exist.
        FileType status(const Path& target) const;
        bool exists(const Path& target) const;
        bool is_directory(const Path& target) const;
        bool is_regular_file(const Path& target) const;

        // Enumeration failures (a missing directory, a permission error) are memoized as failures.
        const ExpectedL<std::vector<DirectoryEntry>>& directory_entries(const Path& dir) const;

        size_t status_entry_count() const;
        size_t directory_entry_count() const;

    private:
        const ReadOnlyFilesystem& m_fs;
        Cache<std::string, FileType> m_status;
        Cache<std::string, ExpectedL<std::vector<DirectoryEntry>>> m_entries;
    };
}
