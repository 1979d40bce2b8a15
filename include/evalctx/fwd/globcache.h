#pragma once

namespace evalctx
{
    struct GlobExpansionCache;
}
