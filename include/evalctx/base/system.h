#pragma once

#include <evalctx/base/optional.h>
#include <evalctx/base/stringview.h>

#include <string>

namespace evalctx
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<std::string> value) noexcept;
}
