#pragma once

#include <evalctx/base/lineinfo.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/stringview.h>

namespace evalctx::Checks
{
    // This function is a link seam called by final_cleanup_and_exit; the embedding program supplies it.
    void on_final_cleanup_and_exit();

    [[noreturn]] void final_cleanup_and_exit(const int exit_code);

    // Indicate that an internal error has occurred and exit. This should be used when invariants have been
    // broken.
    [[noreturn]] void unreachable(const LineInfo& line_info);

    // Exit without an error message.
    [[noreturn]] void exit_fail(const LineInfo& line_info);

    // Display an error message to the user and exit.
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message);
    template<EVALCTX_DECL_MSG_TEMPLATE>
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, EVALCTX_DECL_MSG_ARGS)
    {
        msg_exit_with_message(line_info, msg::format(EVALCTX_EXPAND_MSG_ARGS));
    }

    // If expression is false, call exit_fail.
    void check_exit(const LineInfo& line_info, bool expression);

    // If expression is false, report an internal error with error_message and exit.
    void check_exit(const LineInfo& line_info, bool expression, StringView error_message);
    void check_exit(const LineInfo& line_info, bool expression, const LocalizedString&) = delete;
}
