#pragma once

#include <evalctx/base/fwd/files.h>

#include <evalctx/fwd/evaluationcontext.h>
#include <evalctx/fwd/existencecache.h>
#include <evalctx/fwd/globcache.h>
#include <evalctx/fwd/sdkresolution.h>

#include <evalctx/base/expected.h>
#include <evalctx/base/stringview.h>

#include <memory>

namespace evalctx
{
    StringLiteral to_string_literal(SharingPolicy policy) noexcept;

    // Handle to the caches used while evaluating projects. Copies of a handle refer to the same caches; two handles
    // compare equal exactly when they do. The caches live until the last handle referring to them is destroyed.
    //
    // Under SharingPolicy::Shared every project evaluated with the context pools its filesystem, glob and SDK
    // lookups. Under SharingPolicy::Isolated each new project receives a fresh context with empty caches.
    struct EvaluationContext
    {
        // A filesystem override (non-null `fs`) is only accepted together with SharingPolicy::Shared. `fs` must
        // outlive the context.
        static ExpectedL<EvaluationContext> create(SharingPolicy policy, const ReadOnlyFilesystem* fs = nullptr);

        // The context a previously unseen project should use: this same context under Shared, a brand-new one with
        // empty caches under Isolated.
        EvaluationContext context_for_new_project() const;

        SharingPolicy policy() const noexcept;

        // The override passed to create(), or real_filesystem.
        const ReadOnlyFilesystem& file_system() const noexcept;
        bool has_file_system_override() const noexcept;

        const ExistenceCache& existence_cache() const noexcept;
        const SdkResolutionCache& sdk_cache() const noexcept;
        const GlobExpansionCache& glob_cache() const noexcept;

        // A resolver service that memoizes `underlying` in this context's SDK cache. The returned service refers to
        // this context's cache and must not outlive it.
        CachingSdkResolverService sdk_resolver_service(const ISdkResolverService& underlying) const;

        friend bool operator==(const EvaluationContext& lhs, const EvaluationContext& rhs) noexcept
        {
            return lhs.m_state == rhs.m_state;
        }
        friend bool operator!=(const EvaluationContext& lhs, const EvaluationContext& rhs) noexcept
        {
            return !(lhs == rhs);
        }

    private:
        struct State;

        explicit EvaluationContext(std::shared_ptr<const State>&& state) noexcept;

        std::shared_ptr<const State> m_state;
    };
}
