#pragma once

#include <evalctx/base/stringview.h>

#include <string>

namespace evalctx
{
    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);

        const std::string& native() const& noexcept;
        std::string&& native() && noexcept;
        operator StringView() const noexcept;

        const char* c_str() const noexcept;

        bool empty() const noexcept;

        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;
        Path operator+(StringView sv) const&;
        Path operator+(StringView sv) &&;

        Path& operator/=(StringView sv);
        Path& operator+=(StringView sv);

        void make_generic();
        void clear();
        Path lexically_normal() const;

        StringView parent_path() const;
        StringView filename() const;

        bool is_absolute() const;
        bool is_relative() const;

    private:
        std::string m_str;
    };

    // attempt to parse str as a path and return the filename if it exists; otherwise, an empty view
    StringView parse_filename(StringView str) noexcept;
}

EVALCTX_FORMAT_AS(evalctx::Path, evalctx::StringView);
