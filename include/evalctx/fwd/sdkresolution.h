#pragma once

namespace evalctx
{
    struct SdkReference;
    struct SdkResult;
    struct SdkCacheKey;
    struct SdkResolver;
    struct ISdkResolverService;
    struct SdkResolverService;
    struct SdkResolutionCache;
    struct CachingSdkResolverService;
}
