#pragma once

namespace evalctx
{
    struct FileSpecParts;
}
