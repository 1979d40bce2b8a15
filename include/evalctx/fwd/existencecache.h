#pragma once

namespace evalctx
{
    struct ExistenceCache;
}
