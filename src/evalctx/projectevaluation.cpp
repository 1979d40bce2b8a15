#include <evalctx/base/checks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/existencecache.h>
#include <evalctx/filespec.h>
#include <evalctx/globcache.h>
#include <evalctx/pathnormalizer.h>
#include <evalctx/projectevaluation.h>

#include <algorithm>

namespace
{
    using namespace evalctx;

    EvaluationContext context_for_first_evaluation(const Optional<EvaluationContext>& context)
    {
        if (auto supplied = context.get())
        {
            return supplied->context_for_new_project();
        }

        return EvaluationContext::create(SharingPolicy::Isolated).value_or_exit(EVALCTX_LINE_INFO);
    }

    // Items and excludes are both resolved against the project directory first, so an exclude matches however it
    // is spelled: relative, absolute, or through another directory.
    bool is_excluded(const Path& project_directory, const std::string& item, const std::vector<std::string>& excludes)
    {
        const auto resolved_item = PathNormalizer::resolve(project_directory, item);
        return std::any_of(excludes.begin(), excludes.end(), [&](const std::string& exclude) {
            const auto resolved_exclude = PathNormalizer::resolve(project_directory, exclude);
            if (has_wildcards(resolved_exclude.native()))
            {
                return file_spec_matches(resolved_exclude.native(), resolved_item.native());
            }

            return resolved_exclude.native() == resolved_item.native();
        });
    }
}

namespace evalctx
{
    Project::Project(ProjectDefinition definition,
                     Optional<EvaluationContext> context,
                     const ISdkResolverService& sdk_resolver,
                     MessageSink& warning_sink)
        : m_definition(std::move(definition))
        , m_sdk_resolver(sdk_resolver)
        , m_warning_sink(warning_sink)
        , m_supplied_context(std::move(context))
        , m_context(context_for_first_evaluation(m_supplied_context))
        , m_last_evaluation(evaluate())
    {
    }

    const ExpectedL<ProjectEvaluationResult>& Project::reevaluate(Optional<EvaluationContext> context)
    {
        if (auto supplied = context.get())
        {
            if (*supplied != m_context && m_supplied_context != *supplied)
            {
                m_context = supplied->context_for_new_project();
                m_supplied_context = std::move(context);
            }
        }

        m_last_evaluation = evaluate();
        return m_last_evaluation;
    }

    ExpectedL<ProjectEvaluationResult> Project::evaluate() const
    {
        Debug::println("Evaluating project in ", m_definition.project_directory);
        const auto& project_directory = m_definition.project_directory;
        const auto& existence = m_context.existence_cache();
        const auto& globs = m_context.glob_cache();
        const auto sdk_service = m_context.sdk_resolver_service(m_sdk_resolver);

        ProjectEvaluationResult result;
        for (auto&& sdk : m_definition.sdks)
        {
            auto maybe_sdk = sdk_service.resolve_sdk(sdk, m_warning_sink);
            if (auto resolved = maybe_sdk.get())
            {
                result.sdks.push_back(std::move(*resolved));
            }
            else
            {
                return std::move(maybe_sdk).error();
            }
        }

        for (auto&& import_spec : m_definition.imports)
        {
            const bool is_glob = has_wildcards(import_spec);
            for (auto&& entry : globs.expand(import_spec, project_directory, existence))
            {
                auto import_path = PathNormalizer::resolve(project_directory, entry);
                // glob matches exist by construction; literal imports, including illegal specs, must be checked
                if ((!is_glob || has_wildcards(entry)) && !existence.exists(import_path))
                {
                    return msg::format_error(msgImportNotFound, msg::path = import_path, msg::pattern = import_spec);
                }

                result.imports.push_back(std::move(import_path));
            }
        }

        for (auto&& item : m_definition.items)
        {
            for (auto&& entry : globs.expand(item.include, project_directory, existence))
            {
                if (!is_excluded(project_directory, entry, item.excludes))
                {
                    result.items.push_back(std::move(entry));
                }
            }
        }

        return result;
    }
}
