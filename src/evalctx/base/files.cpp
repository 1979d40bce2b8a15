#include <evalctx/base/checks.h>
#include <evalctx/base/files.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/strings.h>
#include <evalctx/base/system.debug.h>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <memory>

namespace
{
    using namespace evalctx;

    bool is_slash(char c) noexcept { return c == '/'; }

    bool is_dot(StringView sv) { return sv.size() == 1 && sv[0] == '.'; }
    bool is_dot_dot(StringView sv) { return sv.size() == 2 && sv[0] == '.' && sv[1] == '.'; }

    bool is_dot_or_dot_dot(const char* ntbs)
    {
        return ntbs[0] == '.' && (ntbs[1] == '\0' || (ntbs[1] == '.' && ntbs[2] == '\0'));
    }

    const char* find_relative_path(const char* const first, const char* const last) noexcept
    {
        // attempt to parse [first, last) as a path and return the start of relative-path
        return std::find_if_not(first, last, is_slash);
    }

    StringView parse_parent_path(const StringView str) noexcept
    {
        // attempt to parse str as a path and return the parent_path if it exists; otherwise, an empty view
        const auto first = str.data();
        auto last = first + str.size();
        const auto relative_path = find_relative_path(first, last);
        // remove the trailing filename, then the separators before it
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        while (relative_path != last && is_slash(last[-1]))
        {
            --last;
        }

        return StringView(first, static_cast<size_t>(last - first));
    }

    const char* find_filename(const char* const first, const char* last) noexcept
    {
        // attempt to parse [first, last) as a path and return the start of filename if it exists; otherwise, last
        const auto relative_path = find_relative_path(first, last);
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        return last;
    }

    FileType posix_translate_stat_mode_to_file_type(mode_t mode) noexcept
    {
        if (S_ISBLK(mode))
        {
            return FileType::block;
        }

        if (S_ISCHR(mode))
        {
            return FileType::character;
        }

        if (S_ISDIR(mode))
        {
            return FileType::directory;
        }

        if (S_ISFIFO(mode))
        {
            return FileType::fifo;
        }

        if (S_ISREG(mode))
        {
            return FileType::regular;
        }

        if (S_ISLNK(mode))
        {
            return FileType::symlink;
        }

        if (S_ISSOCK(mode))
        {
            return FileType::socket;
        }

        return FileType::unknown;
    }

    struct ReadDirOp
    {
        DIR* dirp;

        ReadDirOp(const Path& base, std::error_code& ec) : dirp(opendir(base.c_str()))
        {
            if (dirp)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
        }

        ReadDirOp(const ReadDirOp&) = delete;
        ReadDirOp& operator=(const ReadDirOp&) = delete;

        const dirent* read(std::error_code& ec) const
        {
            errno = 0;
            const dirent* result = readdir(dirp);
            if (result || errno == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }

            return result;
        }

        ~ReadDirOp()
        {
            if (dirp)
            {
                Checks::check_exit(EVALCTX_LINE_INFO, closedir(dirp) == 0);
            }
        }
    };

    FileType stat_file_type(const char* target, std::error_code& ec) noexcept
    {
        struct stat s;
        if (::stat(target, &s) == 0)
        {
            ec.clear();
            return posix_translate_stat_mode_to_file_type(s.st_mode);
        }

        if (errno == ENOENT || errno == ENOTDIR)
        {
            ec.clear();
            return FileType::not_found;
        }

        ec.assign(errno, std::generic_category());
        return FileType::none;
    }

#if defined(_DIRENT_HAVE_D_TYPE)
    // Returns `FileType::none` when readdir did not report a usable type and the entry must be stat-ed.
    FileType get_d_type(const struct dirent* d) noexcept
    {
        switch (d->d_type)
        {
            case DT_REG: return FileType::regular;
            case DT_DIR: return FileType::directory;
            case DT_FIFO: return FileType::fifo;
            case DT_SOCK: return FileType::socket;
            case DT_CHR: return FileType::character;
            case DT_BLK: return FileType::block;
            default: return FileType::none;
        }
    }
#else  // ^^^ _DIRENT_HAVE_D_TYPE // !_DIRENT_HAVE_D_TYPE vvv
    FileType get_d_type(const struct dirent*) noexcept { return FileType::none; }
#endif // ^^^ !_DIRENT_HAVE_D_TYPE

    void mark_recursive_error(const Path& base, std::error_code& ec)
    {
        Debug::println("Attempt to remove ", base, " failed: ", ec.message());
    }

    void remove_all_inner(const Path& base, std::error_code& ec)
    {
        struct stat s;
        if (::lstat(base.c_str(), &s) != 0)
        {
            if (errno == ENOENT)
            {
                ec.clear();
                return;
            }

            ec.assign(errno, std::generic_category());
            mark_recursive_error(base, ec);
            return;
        }

        if (S_ISDIR(s.st_mode))
        {
            {
                ReadDirOp op{base, ec};
                if (ec)
                {
                    mark_recursive_error(base, ec);
                    return;
                }

                for (;;)
                {
                    auto entry = op.read(ec);
                    if (ec)
                    {
                        mark_recursive_error(base, ec);
                        return;
                    }

                    if (!entry)
                    {
                        break;
                    }

                    if (is_dot_or_dot_dot(entry->d_name))
                    {
                        continue;
                    }

                    remove_all_inner(base / entry->d_name, ec);
                    if (ec)
                    {
                        return;
                    }
                }
            }

            if (::rmdir(base.c_str()) != 0)
            {
                ec.assign(errno, std::generic_category());
                mark_recursive_error(base, ec);
            }

            return;
        }

        if (::unlink(base.c_str()) != 0)
        {
            ec.assign(errno, std::generic_category());
            mark_recursive_error(base, ec);
        }
    }

    struct RealFilesystem final : Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const override
        {
            return stat_file_type(target.c_str(), ec);
        }

        virtual std::vector<DirectoryEntry> get_directory_entries(const Path& dir,
                                                                  std::error_code& ec) const override
        {
            std::vector<DirectoryEntry> result;
            ReadDirOp op{dir, ec};
            if (ec)
            {
                return result;
            }

            for (;;)
            {
                auto entry = op.read(ec);
                if (ec)
                {
                    result.clear();
                    return result;
                }

                if (!entry)
                {
                    return result;
                }

                if (is_dot_or_dot_dot(entry->d_name))
                {
                    continue;
                }

                auto type = get_d_type(entry);
                if (type == FileType::none)
                {
                    // DT_UNKNOWN or DT_LNK; ask stat, which follows symbolic links. An entry that cannot be
                    // stat-ed (a symlink loop, no search permission) is still listed, as unknown.
                    const auto full_path = dir / entry->d_name;
                    std::error_code entry_ec;
                    type = stat_file_type(full_path.c_str(), entry_ec);
                    if (entry_ec)
                    {
                        type = FileType::unknown;
                    }
                }

                result.push_back(DirectoryEntry{entry->d_name, type});
            }
        }

        virtual Path current_path(std::error_code& ec) const override
        {
            std::string buf;
            buf.resize(256);
            for (;;)
            {
                if (::getcwd(&buf[0], buf.size()))
                {
                    buf.resize(strlen(buf.c_str()));
                    ec.clear();
                    return buf;
                }

                if (errno != ERANGE)
                {
                    ec.assign(errno, std::generic_category());
                    return Path();
                }

                buf.resize(buf.size() * 2);
            }
        }

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            const int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
            if (fd < 0)
            {
                ec.assign(errno, std::generic_category());
                return;
            }

            auto first = data.data();
            auto remaining = data.size();
            ec.clear();
            while (remaining != 0)
            {
                const auto written = ::write(fd, first, remaining);
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }

                    ec.assign(errno, std::generic_category());
                    break;
                }

                first += written;
                remaining -= static_cast<size_t>(written);
            }

            if (::close(fd) != 0 && !ec)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            const auto normal = new_directory.lexically_normal();
            const auto& native = normal.native();
            bool created = false;
            size_t position = 0;
            for (;;)
            {
                position = native.find('/', position + 1);
                const auto prefix = native.substr(0, position);
                if (::mkdir(prefix.c_str(), 0777) == 0)
                {
                    created = true;
                }
                else if (errno != EEXIST)
                {
                    ec.assign(errno, std::generic_category());
                    return false;
                }
                else if (position == std::string::npos && stat_file_type(prefix.c_str(), ec) != FileType::directory)
                {
                    if (!ec)
                    {
                        ec.assign(EEXIST, std::generic_category());
                    }

                    return false;
                }

                if (position == std::string::npos)
                {
                    ec.clear();
                    return created;
                }
            }
        }

        virtual void remove_all(const Path& base, std::error_code& ec) const override { remove_all_inner(base, ec); }
    };

    const RealFilesystem real_filesystem_instance;
}

namespace evalctx
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        auto arguments = args.size() == 0 ? "()" : "(\"" + Strings::join("\", \"", args.begin(), args.end()) + "\")";
        return LocalizedString::from_raw(Strings::concat(call_name, arguments, ": ", ec.message()));
    }

    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        Checks::msg_exit_with_message(li, format_filesystem_call_error(ec, call_name, args));
    }

    Path::Path(const StringView sv) : m_str(sv.to_string()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }

    const std::string& Path::native() const& noexcept { return m_str; }
    std::string&& Path::native() && noexcept { return std::move(m_str); }
    Path::operator StringView() const noexcept { return m_str; }

    const char* Path::c_str() const noexcept { return m_str.c_str(); }


    bool Path::empty() const noexcept { return m_str.empty(); }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        result /= sv;
        return result;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path Path::operator+(StringView sv) const&
    {
        Path result = *this;
        result.m_str.append(sv.data(), sv.size());
        return result;
    }

    Path Path::operator+(StringView sv) &&
    {
        m_str.append(sv.data(), sv.size());
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        // set *this to the path lexically resolved by sv relative to *this
        // examples:
        //  path("cat") / "c:/dog"; // yields "c:/dog" on POSIX
        //  path("/cat") / "/dog"; // yields "/dog"
        //  path("cat") / ""; // yields "cat/"
        if (!sv.empty() && is_slash(sv[0]))
        {
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        if (!m_str.empty() && !is_slash(m_str.back()))
        {
            m_str.push_back('/');
        }

        m_str.append(sv.data(), sv.size());
        return *this;
    }

    Path& Path::operator+=(StringView sv)
    {
        m_str.append(sv.data(), sv.size());
        return *this;
    }

    void Path::make_generic()
    {
        // collapse runs of separators
        std::string result;
        result.reserve(m_str.size());
        for (char c : m_str)
        {
            if (is_slash(c) && !result.empty() && is_slash(result.back()))
            {
                continue;
            }

            result.push_back(c);
        }

        m_str = std::move(result);
    }

    void Path::clear() { m_str.clear(); }

    Path Path::lexically_normal() const
    {
        // "." segments are dropped, "x/.." pairs cancel, and ".." directly below the root is dropped
        if (m_str.empty())
        {
            return Path();
        }

        const auto first = m_str.data();
        const auto last = first + m_str.size();
        const auto relative_path = find_relative_path(first, last);
        const bool has_root_directory = relative_path != first;

        std::vector<StringView> segments;
        bool trailing_separator = false;
        auto cursor = relative_path;
        while (cursor != last)
        {
            const auto next_slash = std::find_if(cursor, last, is_slash);
            const StringView segment(cursor, static_cast<size_t>(next_slash - cursor));
            cursor = std::find_if_not(next_slash, last, is_slash);
            // "x/" and a last segment of "." or ".." both denote a directory
            trailing_separator = next_slash != last || is_dot(segment) || is_dot_dot(segment);
            if (is_dot(segment))
            {
                continue;
            }

            if (is_dot_dot(segment))
            {
                if (!segments.empty() && !is_dot_dot(segments.back()))
                {
                    segments.pop_back();
                    continue;
                }

                if (has_root_directory)
                {
                    continue;
                }
            }

            segments.push_back(segment);
        }

        std::string normal;
        if (has_root_directory)
        {
            normal.push_back('/');
        }

        normal.append(Strings::join("/", segments));
        if (normal.empty())
        {
            normal.push_back('.');
        }
        else if (trailing_separator && !segments.empty() && !is_dot_dot(segments.back()))
        {
            normal.push_back('/');
        }

        return normal;
    }

    StringView Path::parent_path() const { return parse_parent_path(m_str); }
    StringView Path::filename() const { return parse_filename(m_str); }

    bool Path::is_absolute() const { return !m_str.empty() && is_slash(m_str[0]); }

    bool Path::is_relative() const { return !is_absolute(); }

    StringView parse_filename(const StringView str) noexcept
    {
        const auto first = str.data();
        const auto last = first + str.size();
        const auto filename = find_filename(first, last);
        return StringView(filename, static_cast<size_t>(last - filename));
    }

    bool is_regular_file(FileType s) { return s == FileType::regular; }
    bool is_directory(FileType s) { return s == FileType::directory; }
    bool exists(FileType s) { return s != FileType::not_found && s != FileType::none; }

    FileType ReadOnlyFilesystem::status(const Path& target, LineInfo li) const noexcept
    {
        std::error_code ec;
        auto result = this->status(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    bool ReadOnlyFilesystem::exists(const Path& target, std::error_code& ec) const
    {
        return evalctx::exists(this->status(target, ec));
    }

    bool ReadOnlyFilesystem::exists(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->exists(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    bool ReadOnlyFilesystem::is_directory(const Path& target) const
    {
        std::error_code ec;
        return evalctx::is_directory(this->status(target, ec));
    }

    bool ReadOnlyFilesystem::is_regular_file(const Path& target) const
    {
        std::error_code ec;
        return evalctx::is_regular_file(this->status(target, ec));
    }

    std::vector<DirectoryEntry> ReadOnlyFilesystem::get_directory_entries(const Path& dir, LineInfo li) const
    {
        std::error_code ec;
        auto maybe_entries = this->get_directory_entries(dir, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {dir});
        }

        return maybe_entries;
    }

    ExpectedL<std::vector<DirectoryEntry>> ReadOnlyFilesystem::try_get_directory_entries(const Path& dir) const
    {
        std::error_code ec;
        auto maybe_entries = this->get_directory_entries(dir, ec);
        if (ec)
        {
            return format_filesystem_call_error(ec, __func__, {dir});
        }

        return maybe_entries;
    }

    Path ReadOnlyFilesystem::current_path(LineInfo li) const
    {
        std::error_code ec;
        auto result = this->current_path(ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {});
        }

        return result;
    }

    Path ReadOnlyFilesystem::almost_canonical(const Path& target, std::error_code& ec) const
    {
        if (target.is_absolute())
        {
            ec.clear();
            return target.lexically_normal();
        }

        auto base = this->current_path(ec);
        if (ec)
        {
            return Path();
        }

        return (std::move(base) / target).lexically_normal();
    }

    Path ReadOnlyFilesystem::almost_canonical(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->almost_canonical(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    void Filesystem::write_contents(const Path& file_path, StringView data, LineInfo li) const
    {
        std::error_code ec;
        this->write_contents(file_path, data, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }
    }

    bool Filesystem::create_directories(const Path& new_directory, LineInfo li) const
    {
        std::error_code ec;
        bool result = this->create_directories(new_directory, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {new_directory});
        }

        return result;
    }

    void Filesystem::remove_all(const Path& base, LineInfo li) const
    {
        std::error_code ec;
        this->remove_all(base, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {base});
        }
    }

    const Filesystem& real_filesystem = real_filesystem_instance;
}
