#pragma once

namespace evalctx
{
    struct MessageSink;

    extern MessageSink& null_sink;
}
