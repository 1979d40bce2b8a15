#pragma once

namespace evalctx
{
    template<class T>
    struct LockGuarded;

    template<class T>
    struct LockGuardPtr;
}
