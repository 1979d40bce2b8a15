#include <evalctx-test/mockfilesystem.h>

#include <evalctx/base/checks.h>

#include <evalctx/pathnormalizer.h>

#include <errno.h>

#include <algorithm>
#include <numeric>

namespace
{
    using namespace evalctx;

    std::string key_for(StringView path) { return PathNormalizer::normalize(path).native(); }

    size_t total_calls(const std::map<std::string, size_t>& calls)
    {
        return std::accumulate(
            calls.begin(), calls.end(), size_t{}, [](size_t sum, const auto& entry) { return sum + entry.second; });
    }

    size_t calls_for(const std::map<std::string, size_t>& calls, StringView path)
    {
        auto it = calls.find(key_for(path));
        return it == calls.end() ? 0 : it->second;
    }
}

namespace evalctx::Test
{
    MockFilesystem::MockFilesystem(Path current_directory) : m_current_directory(std::move(current_directory))
    {
        m_nodes.emplace("/", Node{FileType::directory, {}});
    }

    void MockFilesystem::add_file(StringView path)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        add_node(key_for(path), FileType::regular);
    }

    void MockFilesystem::add_directory(StringView path)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        add_node(key_for(path), FileType::directory);
    }

    void MockFilesystem::remove(StringView path)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        const auto key = key_for(path);
        remove_node(key);
        const auto parent = Path(key).parent_path().to_string();
        auto parent_it = m_nodes.find(parent);
        if (parent_it != m_nodes.end())
        {
            auto& siblings = parent_it->second.children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), Path(key).filename().to_string()),
                           siblings.end());
        }
    }

    void MockFilesystem::deny_listing(StringView path)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_denied.insert(key_for(path));
    }

    void MockFilesystem::add_node(const std::string& path, FileType type)
    {
        Checks::check_exit(EVALCTX_LINE_INFO, Path(path).is_absolute(), "mock filesystem paths must be absolute");
        if (m_nodes.count(path) != 0)
        {
            return;
        }

        const auto parent = Path(path).parent_path().to_string();
        add_node(parent, FileType::directory);
        m_nodes.emplace(path, Node{type, {}});
        m_nodes[parent].children.push_back(Path(path).filename().to_string());
    }

    void MockFilesystem::remove_node(const std::string& path)
    {
        auto it = m_nodes.find(path);
        if (it == m_nodes.end())
        {
            return;
        }

        const auto children = it->second.children;
        for (auto&& child : children)
        {
            remove_node((Path(path) / child).native());
        }

        m_nodes.erase(path);
    }

    FileType MockFilesystem::status(const Path& target, std::error_code& ec) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        const auto key = key_for(target);
        ++m_status_calls[key];
        ec.clear();
        auto it = m_nodes.find(key);
        return it == m_nodes.end() ? FileType::not_found : it->second.type;
    }

    std::vector<DirectoryEntry> MockFilesystem::get_directory_entries(const Path& dir, std::error_code& ec) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        const auto key = key_for(dir);
        ++m_directory_entries_calls[key];
        std::vector<DirectoryEntry> result;
        auto it = m_nodes.find(key);
        if (it == m_nodes.end())
        {
            ec.assign(ENOENT, std::generic_category());
            return result;
        }

        if (it->second.type != FileType::directory)
        {
            ec.assign(ENOTDIR, std::generic_category());
            return result;
        }

        if (m_denied.count(key) != 0)
        {
            ec.assign(EACCES, std::generic_category());
            return result;
        }

        ec.clear();
        for (auto&& child : it->second.children)
        {
            result.push_back(DirectoryEntry{child, m_nodes.at((Path(key) / child).native()).type});
        }

        return result;
    }

    Path MockFilesystem::current_path(std::error_code& ec) const
    {
        ec.clear();
        return m_current_directory;
    }

    size_t MockFilesystem::status_calls() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return total_calls(m_status_calls);
    }

    size_t MockFilesystem::status_calls(StringView path) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return calls_for(m_status_calls, path);
    }

    size_t MockFilesystem::directory_entries_calls() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return total_calls(m_directory_entries_calls);
    }

    size_t MockFilesystem::directory_entries_calls(StringView path) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return calls_for(m_directory_entries_calls, path);
    }
}
