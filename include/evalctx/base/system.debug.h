#pragma once

#include <evalctx/base/fwd/messages.h>

#include <evalctx/base/lineinfo.h>
#include <evalctx/base/strings.h>

#include <atomic>

namespace evalctx::Debug
{
    extern std::atomic<bool> g_debugging;

    template<class... Args>
    void println(const Args&... args)
    {
        if (g_debugging) msg::write_unlocalized_text(Color::none, Strings::concat("[DEBUG] ", args..., '\n'));
    }
}
