#include <evalctx/base/message_sinks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/strings.h>
#include <evalctx/base/system.debug.h>

#include <evalctx/sdkresolution.h>

#include <algorithm>

namespace evalctx
{
    std::string SdkReference::to_string() const { return adapt_to_string(*this); }
    void SdkReference::to_string(std::string& out) const
    {
        out.append(name);
        if (auto v = version.get())
        {
            Strings::append(out, '/', *v);
        }
    }

    bool operator==(const SdkReference& lhs, const SdkReference& rhs) noexcept
    {
        return lhs.name == rhs.name && lhs.version == rhs.version;
    }
    bool operator!=(const SdkReference& lhs, const SdkReference& rhs) noexcept { return !(lhs == rhs); }

    bool operator==(const SdkResult& lhs, const SdkResult& rhs) noexcept
    {
        return lhs.path.native() == rhs.path.native() && lhs.version == rhs.version;
    }
    bool operator!=(const SdkResult& lhs, const SdkResult& rhs) noexcept { return !(lhs == rhs); }

    SdkCacheKey::SdkCacheKey(const SdkReference& sdk) : name(sdk.name), version(sdk.version.value_or(std::string()))
    {
    }

    bool operator==(const SdkCacheKey& lhs, const SdkCacheKey& rhs) noexcept
    {
        return lhs.name == rhs.name && lhs.version == rhs.version;
    }

    bool operator<(const SdkCacheKey& lhs, const SdkCacheKey& rhs) noexcept
    {
        if (lhs.name != rhs.name)
        {
            return lhs.name < rhs.name;
        }

        return lhs.version < rhs.version;
    }

    bool is_reference_same_version(const SdkReference& sdk, StringView version) noexcept
    {
        const auto referenced = sdk.version.get();
        if (!referenced || referenced->empty())
        {
            return true;
        }

        return Strings::case_insensitive_ascii_equals(*referenced, version);
    }

    SdkResolverService::SdkResolverService(std::vector<std::unique_ptr<SdkResolver>>&& resolvers)
        : m_resolvers(std::move(resolvers))
    {
        std::stable_sort(m_resolvers.begin(), m_resolvers.end(), [](const auto& lhs, const auto& rhs) {
            return lhs->priority() < rhs->priority();
        });
    }

    ExpectedL<SdkResult> SdkResolverService::resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const
    {
        if (m_resolvers.empty())
        {
            return msg::format(msgNoSdkResolvers);
        }

        LocalizedString failures;
        for (auto&& resolver : m_resolvers)
        {
            Debug::println("Resolving SDK ", sdk, " with ", resolver->name());
            auto result = resolver->resolve(sdk, warning_sink);
            if (auto resolved = result.get())
            {
                if (!is_reference_same_version(sdk, resolved->version))
                {
                    warning_sink.println_warning(msg::format(msgSdkResultVersionDifferentThanReference,
                                                             msg::sdk_name = sdk.name,
                                                             msg::version = sdk.version.value_or(""),
                                                             msg::actual_version = resolved->version));
                }

                return result;
            }

            failures.append_raw('\n')
                .append(msgSdkResolverFailed, msg::resolver_name = resolver->name())
                .append_raw('\n')
                .append_indent()
                .append(result.error());
        }

        auto error =
            msg::format(msgFailedToResolveSdk, msg::sdk_name = sdk.name, msg::version = sdk.version.value_or(""));
        error.append(failures);
        return error;
    }

    const ExpectedL<SdkResult>& SdkResolutionCache::resolve(const SdkReference& sdk,
                                                            const ISdkResolverService& underlying,
                                                            MessageSink& warning_sink) const
    {
        SdkCacheKey key(sdk);
        warn_on_version_mismatch(key, warning_sink);
        return m_results.get_lazy(key, [&]() {
            Debug::println("SDK ", sdk, " is not cached in this evaluation context");
            return underlying.resolve_sdk(sdk, warning_sink);
        });
    }

    size_t SdkResolutionCache::size() const { return m_results.size(); }

    void SdkResolutionCache::warn_on_version_mismatch(const SdkCacheKey& key, MessageSink& warning_sink) const
    {
        // unversioned references accept whatever was resolved before
        if (key.version.empty())
        {
            return;
        }

        Optional<LocalizedString> warning;
        {
            LockGuardPtr<std::map<std::string, std::vector<std::string>>> versions_by_name(m_versions_by_name);
            auto& known_versions = (*versions_by_name)[key.name];
            if (std::find(known_versions.begin(), known_versions.end(), key.version) != known_versions.end())
            {
                return;
            }

            if (!known_versions.empty())
            {
                warning = msg::format(msgSdkVersionMismatch,
                                      msg::sdk_name = key.name,
                                      msg::version = key.version,
                                      msg::old_version = known_versions.front());
            }

            known_versions.push_back(key.version);
        }

        if (auto w = warning.get())
        {
            warning_sink.println_warning(*w);
        }
    }

    CachingSdkResolverService::CachingSdkResolverService(const SdkResolutionCache& cache,
                                                         const ISdkResolverService& underlying)
        : m_cache(cache), m_underlying(underlying)
    {
    }

    ExpectedL<SdkResult> CachingSdkResolverService::resolve_sdk(const SdkReference& sdk,
                                                                MessageSink& warning_sink) const
    {
        return m_cache.resolve(sdk, m_underlying, warning_sink);
    }
}
