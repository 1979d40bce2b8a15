#pragma once

namespace evalctx
{
    struct NullOpt;

    template<class T>
    struct Optional;
}
