#pragma once

#include <evalctx/base/fwd/message_sinks.h>

#include <evalctx/fwd/projectevaluation.h>
#include <evalctx/fwd/sdkresolution.h>

#include <evalctx/base/expected.h>
#include <evalctx/base/optional.h>
#include <evalctx/base/path.h>

#include <evalctx/evaluationcontext.h>
#include <evalctx/sdkresolution.h>

#include <string>
#include <vector>

namespace evalctx
{
    struct ItemSpec
    {
        // A file spec, possibly with wildcards, relative to the project directory or absolute.
        std::string include;
        // Specs whose matches are removed from the include's results. They do not take part in glob caching.
        std::vector<std::string> excludes;
    };

    struct ProjectDefinition
    {
        // Absolute directory that relative specs are resolved against.
        Path project_directory;
        std::vector<ItemSpec> items;
        std::vector<std::string> imports;
        std::vector<SdkReference> sdks;
    };

    struct ProjectEvaluationResult
    {
        std::vector<SdkResult> sdks;
        // Absolute normalized paths of the imported files.
        std::vector<Path> imports;
        // Item paths as the include specs spelled them.
        std::vector<std::string> items;
    };

    // A project definition together with the evaluation context it was last evaluated with.
    struct Project
    {
        // Evaluates the project. With a context, the project uses context->context_for_new_project(); without one it
        // gets a fresh Isolated context of its own.
        Project(ProjectDefinition definition,
                Optional<EvaluationContext> context,
                const ISdkResolverService& sdk_resolver,
                MessageSink& warning_sink);

        Project(const Project&) = delete;
        Project& operator=(const Project&) = delete;

        // Evaluates the project again. Without a context, or with the context supplied last time, the previous
        // evaluation context is reused so that cached results stay visible. A different context is adopted through
        // its context_for_new_project() and kept for later re-evaluations.
        const ExpectedL<ProjectEvaluationResult>& reevaluate(Optional<EvaluationContext> context = nullopt);

        const ExpectedL<ProjectEvaluationResult>& last_evaluation() const noexcept { return m_last_evaluation; }
        const EvaluationContext& context() const noexcept { return m_context; }
        const ProjectDefinition& definition() const noexcept { return m_definition; }

    private:
        ExpectedL<ProjectEvaluationResult> evaluate() const;

        ProjectDefinition m_definition;
        const ISdkResolverService& m_sdk_resolver;
        MessageSink& m_warning_sink;
        Optional<EvaluationContext> m_supplied_context;
        EvaluationContext m_context;
        ExpectedL<ProjectEvaluationResult> m_last_evaluation;
    };
}
