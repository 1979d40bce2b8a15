#pragma once

namespace evalctx
{
    struct ItemSpec;
    struct ProjectDefinition;
    struct ProjectEvaluationResult;
    struct Project;
}
