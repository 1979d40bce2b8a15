#pragma once

#include <evalctx/base/fwd/message_sinks.h>

#include <evalctx/fwd/sdkresolution.h>

#include <evalctx/base/cache.h>
#include <evalctx/base/expected.h>
#include <evalctx/base/fmt.h>
#include <evalctx/base/lockguarded.h>
#include <evalctx/base/optional.h>
#include <evalctx/base/path.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace evalctx
{
    // An SDK as a project references it; an absent version accepts whatever the resolvers find.
    struct SdkReference
    {
        std::string name;
        Optional<std::string> version;

        std::string to_string() const;
        void to_string(std::string& out) const;

        friend bool operator==(const SdkReference& lhs, const SdkReference& rhs) noexcept;
        friend bool operator!=(const SdkReference& lhs, const SdkReference& rhs) noexcept;
    };

    struct SdkResult
    {
        Path path;
        std::string version;

        friend bool operator==(const SdkResult& lhs, const SdkResult& rhs) noexcept;
        friend bool operator!=(const SdkResult& lhs, const SdkResult& rhs) noexcept;
    };

    // (name, version) pair under which SdkResolutionCache memoizes; an unversioned reference has an empty version.
    struct SdkCacheKey
    {
        std::string name;
        std::string version;

        explicit SdkCacheKey(const SdkReference& sdk);

        friend bool operator==(const SdkCacheKey& lhs, const SdkCacheKey& rhs) noexcept;
        friend bool operator<(const SdkCacheKey& lhs, const SdkCacheKey& rhs) noexcept;
    };

    // One resolution strategy. Resolvers report recoverable trouble to `warning_sink` and return the failure
    // description when they cannot produce the SDK.
    struct SdkResolver
    {
        virtual StringView name() const = 0;

        // Lower values are consulted first.
        virtual int priority() const = 0;

        virtual ExpectedL<SdkResult> resolve(const SdkReference& sdk, MessageSink& warning_sink) const = 0;

        virtual ~SdkResolver() = default;
    };

    // True when `version` satisfies the version `sdk` asks for. An unversioned reference accepts any version; versions
    // otherwise compare as text, ignoring ASCII case.
    bool is_reference_same_version(const SdkReference& sdk, StringView version) noexcept;

    struct ISdkResolverService
    {
        virtual ExpectedL<SdkResult> resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const = 0;

        virtual ~ISdkResolverService() = default;
    };

    // Consults resolvers in ascending priority order (stable for equal priorities); the first success wins. When every
    // resolver fails the error lists each resolver's message. A result whose version differs from the referenced one is
    // still used, with a warning.
    struct SdkResolverService final : ISdkResolverService
    {
        explicit SdkResolverService(std::vector<std::unique_ptr<SdkResolver>>&& resolvers);

        virtual ExpectedL<SdkResult> resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const override;

        const std::vector<std::unique_ptr<SdkResolver>>& resolvers() const noexcept { return m_resolvers; }

    private:
        std::vector<std::unique_ptr<SdkResolver>> m_resolvers;
    };

    // Memoizes SDK resolution outcomes, successes and failures alike, for the lifetime of the owning context.
    struct SdkResolutionCache
    {
        SdkResolutionCache() = default;
        SdkResolutionCache(const SdkResolutionCache&) = delete;
        SdkResolutionCache& operator=(const SdkResolutionCache&) = delete;

        // The first request for a (name, version) pair runs `underlying`; every later request for that pair returns
        // the same outcome. Asking for an already resolved name at a different version writes a warning to
        // `warning_sink` and resolves the new pair separately.
        const ExpectedL<SdkResult>& resolve(const SdkReference& sdk,
                                            const ISdkResolverService& underlying,
                                            MessageSink& warning_sink) const;

        size_t size() const;

    private:
        void warn_on_version_mismatch(const SdkCacheKey& key, MessageSink& warning_sink) const;

        Cache<SdkCacheKey, ExpectedL<SdkResult>> m_results;
        mutable LockGuarded<std::map<std::string, std::vector<std::string>>> m_versions_by_name;
    };

    // Routes every request through an SdkResolutionCache in front of `underlying`.
    struct CachingSdkResolverService final : ISdkResolverService
    {
        CachingSdkResolverService(const SdkResolutionCache& cache, const ISdkResolverService& underlying);

        virtual ExpectedL<SdkResult> resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const override;

    private:
        const SdkResolutionCache& m_cache;
        const ISdkResolverService& m_underlying;
    };
}

EVALCTX_FORMAT_WITH_TO_STRING(evalctx::SdkReference);
