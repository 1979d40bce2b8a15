#pragma once

#include <evalctx/base/fwd/files.h>

#include <evalctx/base/expected.h>
#include <evalctx/base/lineinfo.h>
#include <evalctx/base/path.h>
#include <evalctx/base/stringview.h>

#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

namespace evalctx
{
    bool is_regular_file(FileType s);
    bool is_directory(FileType s);
    bool exists(FileType s);

    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);

    // One name inside a directory; `type` follows symbolic links where the target exists.
    struct DirectoryEntry
    {
        std::string name;
        FileType type;

        friend bool operator==(const DirectoryEntry& lhs, const DirectoryEntry& rhs) noexcept
        {
            return lhs.name == rhs.name && lhs.type == rhs.type;
        }
        friend bool operator!=(const DirectoryEntry& lhs, const DirectoryEntry& rhs) noexcept
        {
            return !(lhs == rhs);
        }
    };

    struct ReadOnlyFilesystem
    {
        // A missing target is FileType::not_found and not an error.
        virtual FileType status(const Path& target, std::error_code& ec) const = 0;
        FileType status(const Path& target, LineInfo li) const noexcept;

        bool exists(const Path& target, std::error_code& ec) const;
        bool exists(const Path& target, LineInfo li) const;

        bool is_directory(const Path& target) const;
        bool is_regular_file(const Path& target) const;

        // Entries other than "." and "..", in the order the underlying directory enumeration produces them.
        virtual std::vector<DirectoryEntry> get_directory_entries(const Path& dir, std::error_code& ec) const = 0;
        std::vector<DirectoryEntry> get_directory_entries(const Path& dir, LineInfo li) const;
        ExpectedL<std::vector<DirectoryEntry>> try_get_directory_entries(const Path& dir) const;

        virtual Path current_path(std::error_code& ec) const = 0;
        Path current_path(LineInfo li) const;

        // Lexically resolves `target` against current_path() and normalizes it; never touches the target.
        Path almost_canonical(const Path& target, std::error_code& ec) const;
        Path almost_canonical(const Path& target, LineInfo li) const;

    protected:
        ReadOnlyFilesystem() = default;
        ReadOnlyFilesystem(const ReadOnlyFilesystem&) = default;
        ReadOnlyFilesystem& operator=(const ReadOnlyFilesystem&) = default;
        ~ReadOnlyFilesystem() = default;
    };

    struct Filesystem : ReadOnlyFilesystem
    {
        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents(const Path& file_path, StringView data, LineInfo li) const;

        // Creates `new_directory` and every missing parent; returns whether `new_directory` was created.
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;
        bool create_directories(const Path& new_directory, LineInfo li) const;

        virtual void remove_all(const Path& base, std::error_code& ec) const = 0;
        void remove_all(const Path& base, LineInfo li) const;

    protected:
        Filesystem() = default;
        Filesystem(const Filesystem&) = default;
        Filesystem& operator=(const Filesystem&) = default;
        ~Filesystem() = default;
    };
}
