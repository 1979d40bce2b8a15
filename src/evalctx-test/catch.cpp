#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <evalctx/base/checks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/system.debug.h>
#include <evalctx/base/system.h>

namespace evalctx::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (evalctx::get_environment_variable("EVALCTX_DEBUG").value_or("") == "1") evalctx::Debug::g_debugging = true;

    return Catch::Session().run(argc, argv);
}
