#pragma once

#include <evalctx/base/fwd/fmt.h>

#include <string>

namespace evalctx
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define EVALCTX_LINE_INFO                                                                                              \
    evalctx::LineInfo { __LINE__, __FILE__, __func__ }

EVALCTX_FORMAT_WITH_TO_STRING(evalctx::LineInfo);
