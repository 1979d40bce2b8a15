#include <evalctx/base/message_sinks.h>

namespace
{
    using namespace evalctx;

    struct NullMessageSink final : MessageSink
    {
        using MessageSink::println;
        virtual void println(Color, const LocalizedString&) override { }
    };

    NullMessageSink null_sink_instance;
}

namespace evalctx
{
    void MessageSink::println_warning(const LocalizedString& s) { println(Color::warning, msg::format_warning(s)); }

    MessageSink& null_sink = null_sink_instance;
}
