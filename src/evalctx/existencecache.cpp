#include <evalctx/base/messages.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/existencecache.h>
#include <evalctx/pathnormalizer.h>

namespace evalctx
{
    ExistenceCache::ExistenceCache(const ReadOnlyFilesystem& fs) : m_fs(fs) { }

    FileType ExistenceCache::status(const Path& target) const
    {
        const auto normalized = PathNormalizer::normalize(target);
        return m_status.get_lazy(normalized.native(), [&]() {
            std::error_code ec;
            auto type = m_fs.status(normalized, ec);
            if (ec)
            {
                Debug::println("status(", normalized, ") failed: ", ec.message());
                return FileType::none;
            }

            return type;
        });
    }

    bool ExistenceCache::exists(const Path& target) const { return evalctx::exists(status(target)); }

    bool ExistenceCache::is_directory(const Path& target) const { return evalctx::is_directory(status(target)); }

    bool ExistenceCache::is_regular_file(const Path& target) const
    {
        return evalctx::is_regular_file(status(target));
    }

    const ExpectedL<std::vector<DirectoryEntry>>& ExistenceCache::directory_entries(const Path& dir) const
    {
        const auto normalized = PathNormalizer::normalize(dir);
        return m_entries.get_lazy(normalized.native(), [&]() -> ExpectedL<std::vector<DirectoryEntry>> {
            std::error_code ec;
            auto entries = m_fs.get_directory_entries(normalized, ec);
            if (ec)
            {
                Debug::println("get_directory_entries(", normalized, ") failed: ", ec.message());
                return msg::format(msgDirectoryEnumerationFailed,
                                   msg::path = normalized,
                                   msg::error_msg = ec.message());
            }

            return entries;
        });
    }

    size_t ExistenceCache::status_entry_count() const { return m_status.size(); }

    size_t ExistenceCache::directory_entry_count() const { return m_entries.size(); }
}
