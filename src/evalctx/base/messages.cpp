#include <evalctx/base/checks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/system.debug.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>
#include <utility>

using namespace evalctx;

namespace evalctx
{
    LocalizedString::operator StringView() const noexcept { return m_data; }
    const std::string& LocalizedString::data() const noexcept { return m_data; }
    const std::string& LocalizedString::to_string() const noexcept { return m_data; }

    template<class T, std::enable_if_t<std::is_same<char, T>::value, int>>
    LocalizedString LocalizedString::from_raw(std::basic_string<T>&& s) noexcept
    {
        return LocalizedString(std::move(s));
    }
    template LocalizedString LocalizedString::from_raw<char>(std::basic_string<char>&& s) noexcept;
    LocalizedString LocalizedString::from_raw(StringView s) { return LocalizedString(s); }

    LocalizedString& LocalizedString::append_raw(char c) &
    {
        m_data.push_back(c);
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(char c) && { return std::move(append_raw(c)); }

    LocalizedString& LocalizedString::append_raw(StringView s) &
    {
        m_data.append(s.begin(), s.size());
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(StringView s) && { return std::move(append_raw(s)); }

    LocalizedString& LocalizedString::append(const LocalizedString& s) &
    {
        m_data.append(s.m_data);
        return *this;
    }

    LocalizedString&& LocalizedString::append(const LocalizedString& s) && { return std::move(append(s)); }

    LocalizedString& LocalizedString::append_indent(size_t indent) &
    {
        m_data.append(indent * 2, ' ');
        return *this;
    }

    LocalizedString&& LocalizedString::append_indent(size_t indent) && { return std::move(append_indent(indent)); }

    bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() == rhs.data();
    }

    bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() != rhs.data();
    }

    bool operator<(const LocalizedString& lhs, const LocalizedString& rhs) noexcept { return lhs.data() < rhs.data(); }

    bool LocalizedString::empty() const noexcept { return m_data.empty(); }
    void LocalizedString::clear() noexcept { m_data.clear(); }

    LocalizedString::LocalizedString(StringView data) : m_data(data.data(), data.size()) { }
    LocalizedString::LocalizedString(std::string&& data) noexcept : m_data(std::move(data)) { }

    LocalizedString error_prefix() { return LocalizedString::from_raw(ErrorPrefix); }
    LocalizedString internal_error_prefix() { return LocalizedString::from_raw(InternalErrorPrefix); }
    LocalizedString warning_prefix() { return LocalizedString::from_raw(WarningPrefix); }
}

#define DECLARE_MSG_ARG(NAME, EXAMPLE) const StringLiteral evalctx::msg::NAME##_t::name = #NAME;
#include <evalctx/base/message-args.inc.h>
#undef DECLARE_MSG_ARG

namespace evalctx
{
    namespace
    {
        struct MessageData
        {
            StringLiteral name;
            StringLiteral builtin_message;
        };

        constexpr MessageData message_data[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, __VA_ARGS__},
#include <evalctx/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };

        constexpr size_t number_of_messages = sizeof(message_data) / sizeof(message_data[0]);

        enum class message_index
        {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <evalctx/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };
    }

    namespace msg
    {
        void detail::format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args)
        {
            if (index >= number_of_messages) Checks::unreachable(EVALCTX_LINE_INFO);
            const auto format_string = message_data[index].builtin_message;
            try
            {
                fmt::vformat_to(std::back_inserter(s.m_data), {format_string.data(), format_string.size()}, args);
                return;
            }
            catch (const fmt::format_error&)
            {
            }

            msg::write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("INTERNAL ERROR: failed to format message {}\nformat string: {}\n",
                            message_data[index].name,
                            format_string));
            Checks::exit_fail(EVALCTX_LINE_INFO);
        }

        LocalizedString detail::format_message_by_index(size_t index, fmt::format_args args)
        {
            LocalizedString s;
            format_message_by_index_to(s, index, args);
            return s;
        }
    }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::evalctx::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(message_index::NAME)};

#include <evalctx/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace evalctx::msg
{
    static void write_all(const char* ptr, size_t to_write, int fd)
    {
        while (to_write != 0)
        {
            auto written = ::write(fd, ptr, to_write);
            if (written == -1)
            {
                if (errno == EINTR) continue;
                ::fprintf(stderr, "[DEBUG] Failed to write to fd %d: %d\n", fd, errno);
                std::abort();
            }
            ptr += written;
            to_write -= static_cast<size_t>(written);
        }
    }

    static void write_unlocalized_text_impl(Color c, StringView sv, int fd, bool is_a_tty)
    {
        static constexpr char reset_color_sequence[] = {'\033', '[', '0', 'm'};

        if (sv.empty()) return;

        bool reset_color = false;
        if (is_a_tty && c != Color::none)
        {
            reset_color = true;

            const char set_color_sequence[] = {'\033', '[', '9', static_cast<char>(c), 'm'};
            write_all(set_color_sequence, sizeof(set_color_sequence), fd);
        }

        write_all(sv.data(), sv.size(), fd);

        if (reset_color)
        {
            write_all(reset_color_sequence, sizeof(reset_color_sequence), fd);
        }
    }

    void write_unlocalized_text_to_stdout(Color c, StringView sv)
    {
        static bool is_a_tty = ::isatty(STDOUT_FILENO);
        return write_unlocalized_text_impl(c, sv, STDOUT_FILENO, is_a_tty);
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static bool is_a_tty = ::isatty(STDERR_FILENO);
        return write_unlocalized_text_impl(c, sv, STDERR_FILENO, is_a_tty);
    }

    void write_unlocalized_text(Color c, StringView sv) { write_unlocalized_text_to_stdout(c, sv); }

    LocalizedString format_error(const LocalizedString& s) { return error_prefix().append(s); }
    LocalizedString format_warning(const LocalizedString& s) { return warning_prefix().append(s); }
}
