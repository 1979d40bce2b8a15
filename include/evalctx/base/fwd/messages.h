#pragma once

#include <evalctx/base/fwd/stringview.h>

namespace evalctx
{
    enum class Color : char
    {
        none = 0,
        success = '2', // [with 9] bright green
        error = '1',   // [with 9] bright red
        warning = '3', // [with 9] bright yellow
    };

    struct LocalizedString;
    struct MessageSink;

    namespace msg
    {
        template<class... Tags>
        struct MessageT;

        template<class Tag, class Type>
        struct TagArg;
    }
}

namespace evalctx::msg
{
    void write_unlocalized_text(Color c, evalctx::StringView sv);
    void write_unlocalized_text_to_stdout(Color c, evalctx::StringView sv);
    void write_unlocalized_text_to_stderr(Color c, evalctx::StringView sv);
}
