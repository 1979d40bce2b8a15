#pragma once

#include <evalctx/base/optional.h>

#include <evalctx/sdkresolution.h>

#include <atomic>
#include <chrono>
#include <map>
#include <string>

namespace evalctx::Test
{
    // Resolves the SDK names in `results` and counts every call.
    struct MockSdkResolver final : SdkResolver
    {
        MockSdkResolver(std::string name, int priority);

        virtual StringView name() const override;
        virtual int priority() const override;
        virtual ExpectedL<SdkResult> resolve(const SdkReference& sdk, MessageSink& warning_sink) const override;

        int calls() const noexcept { return m_calls.load(); }

        std::map<std::string, SdkResult> results;
        // Written to the warning sink on every call.
        Optional<std::string> warning;
        // How long each call takes; lets concurrent callers overlap.
        std::chrono::milliseconds delay{0};

    private:
        std::string m_name;
        int m_priority;
        mutable std::atomic<int> m_calls{0};
    };

    // An ISdkResolverService over a single MockSdkResolver.
    struct MockSdkResolverService final : ISdkResolverService
    {
        virtual ExpectedL<SdkResult> resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const override;

        int calls() const noexcept { return resolver.calls(); }

        MockSdkResolver resolver{"MockSdkResolver", 0};
    };
}
