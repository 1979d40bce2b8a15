#pragma once

namespace evalctx
{
    struct GlobCacheKey;
}
