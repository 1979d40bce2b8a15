#include <evalctx/base/checks.h>
#include <evalctx/base/files.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/evaluationcontext.h>
#include <evalctx/existencecache.h>
#include <evalctx/globcache.h>
#include <evalctx/sdkresolution.h>

namespace evalctx
{
    StringLiteral to_string_literal(SharingPolicy policy) noexcept
    {
        switch (policy)
        {
            case SharingPolicy::Shared: return "Shared";
            case SharingPolicy::Isolated: return "Isolated";
            default: Checks::unreachable(EVALCTX_LINE_INFO);
        }
    }

    namespace
    {
        const ReadOnlyFilesystem& file_system_or_real(const ReadOnlyFilesystem* fs) noexcept
        {
            if (fs)
            {
                return *fs;
            }

            return real_filesystem;
        }
    }

    struct EvaluationContext::State
    {
        State(SharingPolicy policy, const ReadOnlyFilesystem* fs)
            : policy(policy)
            , file_system_override(fs)
            , existence(file_system_or_real(fs))
            , sdks()
            , globs()
        {
        }

        const SharingPolicy policy;
        const ReadOnlyFilesystem* const file_system_override;
        ExistenceCache existence;
        SdkResolutionCache sdks;
        GlobExpansionCache globs;
    };

    EvaluationContext::EvaluationContext(std::shared_ptr<const State>&& state) noexcept : m_state(std::move(state))
    {
    }

    ExpectedL<EvaluationContext> EvaluationContext::create(SharingPolicy policy, const ReadOnlyFilesystem* fs)
    {
        if (fs && policy != SharingPolicy::Shared)
        {
            return msg::format_error(msgFilesystemOverrideRequiresSharedPolicy);
        }

        Debug::println("Creating ", to_string_literal(policy), " evaluation context");
        return EvaluationContext{std::make_shared<const State>(policy, fs)};
    }

    EvaluationContext EvaluationContext::context_for_new_project() const
    {
        if (m_state->policy == SharingPolicy::Shared)
        {
            return *this;
        }

        Debug::println("Creating Isolated evaluation context for a new project");
        return EvaluationContext{std::make_shared<const State>(m_state->policy, m_state->file_system_override)};
    }

    SharingPolicy EvaluationContext::policy() const noexcept { return m_state->policy; }

    const ReadOnlyFilesystem& EvaluationContext::file_system() const noexcept { return m_state->existence.file_system(); }

    bool EvaluationContext::has_file_system_override() const noexcept
    {
        return m_state->file_system_override != nullptr;
    }

    const ExistenceCache& EvaluationContext::existence_cache() const noexcept { return m_state->existence; }

    const SdkResolutionCache& EvaluationContext::sdk_cache() const noexcept { return m_state->sdks; }

    const GlobExpansionCache& EvaluationContext::glob_cache() const noexcept { return m_state->globs; }

    CachingSdkResolverService EvaluationContext::sdk_resolver_service(const ISdkResolverService& underlying) const
    {
        return CachingSdkResolverService{m_state->sdks, underlying};
    }
}
