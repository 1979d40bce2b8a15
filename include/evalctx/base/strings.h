#pragma once

#include <evalctx/base/optional.h>
#include <evalctx/base/stringview.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace evalctx::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }

    static constexpr struct IdentityTransformer
    {
        template<class T>
        T&& operator()(T&& t) const noexcept
        {
            return static_cast<T&&>(t);
        }
    } identity_transformer;
}

namespace evalctx::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;
    bool case_insensitive_ascii_less(StringView left, StringView right) noexcept;

    // Comparator for maps keyed by property or value names
    struct CaseInsensitiveAsciiLess
    {
        using is_transparent = void;
        bool operator()(StringView left, StringView right) const noexcept
        {
            return case_insensitive_ascii_less(left, right);
        }
    };

    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    bool starts_with(StringView s, StringView pattern);
    bool ends_with(StringView s, StringView pattern);

    template<class InputIterator, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter,
                                   InputIterator first,
                                   InputIterator last,
                                   Transformer transformer)
    {
        std::string output;
        if (first == last)
        {
            return output;
        }

        for (;;)
        {
            Strings::append(output, transformer(*first));
            if (++first == last)
            {
                return output;
            }

            output.append(delimiter.data(), delimiter.size());
        }
    }

    template<class Container, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v, Transformer transformer)
    {
        return join(delimiter, std::begin(v), std::end(v), transformer);
    }

    template<class InputIterator>
    [[nodiscard]] std::string join(StringLiteral delimiter, InputIterator first, InputIterator last)
    {
        return join(delimiter, first, last, details::identity_transformer);
    }

    template<class Container>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v)
    {
        return join(delimiter, std::begin(v), std::end(v), details::identity_transformer);
    }

    void inplace_replace_all(std::string& s, char search, char rep) noexcept;

    // Splits on `delimiter`, dropping empty pieces
    [[nodiscard]] std::vector<std::string> split(StringView s, const char delimiter);

    // Returns `nullopt` unless the whole of `sv` is a base 10 integer that fits in an int.
    Optional<int> strto_int(StringView sv);
}
