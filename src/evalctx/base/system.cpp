#include <evalctx/base/system.debug.h>
#include <evalctx/base/system.h>

#include <stdlib.h>

namespace evalctx
{
    std::atomic<bool> Debug::g_debugging(false);

    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
        const auto v = getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
    }

    void set_environment_variable(ZStringView varname, Optional<std::string> value) noexcept
    {
        if (auto v = value.get())
        {
            Checks::check_exit(EVALCTX_LINE_INFO, setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(EVALCTX_LINE_INFO, unsetenv(varname.c_str()) == 0);
        }
    }
}
