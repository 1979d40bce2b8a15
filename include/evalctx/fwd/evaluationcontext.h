#pragma once

namespace evalctx
{
    enum class SharingPolicy
    {
        Shared,
        Isolated,
    };

    struct EvaluationContext;
}
