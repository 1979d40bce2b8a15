#pragma once

namespace evalctx
{
    struct SubToolsetVersion;
    struct SubToolset;
    struct SubToolsetVersionInputs;
    struct Toolset;

    enum class ToolsetValueKind
    {
        String,
        DWord,
        MultiString,
    };

    struct ToolsetDefinitionValue;
    struct ToolsetDefinitionKey;
    struct ToolsetReadResult;
}
