#pragma once

#include <evalctx/base/fwd/message_sinks.h>

#include <evalctx/base/messages.h>

namespace evalctx
{
    struct MessageSink
    {
        virtual void println(Color c, const LocalizedString& s) = 0;

        void println(const LocalizedString& s) { println(Color::none, s); }

        template<EVALCTX_DECL_MSG_TEMPLATE>
        void println(EVALCTX_DECL_MSG_ARGS)
        {
            this->println(Color::none, msg::format(EVALCTX_EXPAND_MSG_ARGS));
        }

        template<EVALCTX_DECL_MSG_TEMPLATE>
        void println(Color c, EVALCTX_DECL_MSG_ARGS)
        {
            this->println(c, msg::format(EVALCTX_EXPAND_MSG_ARGS));
        }

        // Writes `warning: <message>` in the warning color
        void println_warning(const LocalizedString& s);

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };
}
