#pragma once

#include <evalctx/base/files.h>
#include <evalctx/base/path.h>
#include <evalctx/base/stringview.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace evalctx::Test
{
    // An in-memory filesystem rooted at "/" that counts how often each path is probed. Directory entries are
    // enumerated in the order they were added.
    struct MockFilesystem final : ReadOnlyFilesystem
    {
        explicit MockFilesystem(Path current_directory = "/");

        // Creates the file and any missing parent directories.
        void add_file(StringView path);
        void add_directory(StringView path);
        // Removes the path and everything below it.
        void remove(StringView path);
        // Listing `path` fails with a permission error from now on.
        void deny_listing(StringView path);

        virtual FileType status(const Path& target, std::error_code& ec) const override;
        virtual std::vector<DirectoryEntry> get_directory_entries(const Path& dir, std::error_code& ec) const override;
        virtual Path current_path(std::error_code& ec) const override;

        size_t status_calls() const;
        size_t status_calls(StringView path) const;
        size_t directory_entries_calls() const;
        size_t directory_entries_calls(StringView path) const;

    private:
        struct Node
        {
            FileType type;
            std::vector<std::string> children;
        };

        void add_node(const std::string& path, FileType type);
        void remove_node(const std::string& path);

        mutable std::mutex m_mutex;
        std::map<std::string, Node> m_nodes;
        std::set<std::string> m_denied;
        mutable std::map<std::string, size_t> m_status_calls;
        mutable std::map<std::string, size_t> m_directory_entries_calls;
        Path m_current_directory;
    };
}
