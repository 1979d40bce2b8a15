#pragma once

#include <evalctx/base/fwd/fmt.h>

#include <fmt/format.h>

#include <string>

template<class T>
std::string adapt_to_string(const T& val)
{
    std::string result;
    val.to_string(result);
    return result;
}
