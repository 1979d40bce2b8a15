#pragma once

namespace evalctx
{
    struct StringView;
    struct ZStringView;
    struct StringLiteral;
}
