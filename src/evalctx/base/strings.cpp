#include <evalctx/base/strings.h>

#include <errno.h>
#include <limits.h>
#include <stdlib.h>

using namespace evalctx;

namespace
{
    constexpr struct
    {
        char operator()(char c) const noexcept { return (c < 'A' || c > 'Z') ? c : c - 'A' + 'a'; }
    } tolower_char;

    constexpr struct
    {
        bool operator()(char a, char b) const noexcept { return tolower_char(a) == tolower_char(b); }
    } icase_eq;

    constexpr struct
    {
        bool operator()(char a, char b) const noexcept { return tolower_char(a) < tolower_char(b); }
    } icase_less;
}

void Strings::details::append_internal(std::string& into, char c) { into.push_back(c); }
void Strings::details::append_internal(std::string& into, const char* v) { into.append(v); }
void Strings::details::append_internal(std::string& into, const std::string& s) { into.append(s); }
void Strings::details::append_internal(std::string& into, StringView s) { into.append(s.begin(), s.end()); }

bool Strings::case_insensitive_ascii_equals(StringView left, StringView right) noexcept
{
    return std::equal(left.begin(), left.end(), right.begin(), right.end(), icase_eq);
}

bool Strings::case_insensitive_ascii_less(StringView left, StringView right) noexcept
{
    return std::lexicographical_compare(left.begin(), left.end(), right.begin(), right.end(), icase_less);
}

std::string Strings::ascii_to_lowercase(StringView s)
{
    std::string result;
    std::transform(s.begin(), s.end(), std::back_inserter(result), tolower_char);
    return result;
}

bool Strings::starts_with(StringView s, StringView pattern) { return s.starts_with(pattern); }

bool Strings::ends_with(StringView s, StringView pattern) { return s.ends_with(pattern); }

void Strings::inplace_replace_all(std::string& s, char search, char rep) noexcept
{
    std::replace(s.begin(), s.end(), search, rep);
}

std::vector<std::string> Strings::split(StringView s, const char delimiter)
{
    std::vector<std::string> output;
    auto first = s.begin();
    const auto last = s.end();
    for (;;)
    {
        first = std::find_if(first, last, [=](const char c) { return c != delimiter; });
        if (first == last)
        {
            return output;
        }

        auto next = std::find(first, last, delimiter);
        output.emplace_back(first, next);
        first = next;
    }
}

Optional<int> Strings::strto_int(StringView sv)
{
    if (sv.empty() || !std::all_of(sv.begin(), sv.end(), [](char c) { return c >= '0' && c <= '9'; }))
    {
        return nullopt;
    }

    // strtol needs a null terminated buffer
    const auto as_string = sv.to_string();
    errno = 0;
    char* endptr = nullptr;
    const long value = strtol(as_string.c_str(), &endptr, 10);
    if (errno == ERANGE || value > INT_MAX)
    {
        return nullopt;
    }

    return static_cast<int>(value);
}
