#include <evalctx-test/mocksdkresolver.h>

#include <evalctx/base/message_sinks.h>
#include <evalctx/base/messages.h>
#include <evalctx/base/strings.h>

#include <thread>

namespace evalctx::Test
{
    MockSdkResolver::MockSdkResolver(std::string name, int priority) : m_name(std::move(name)), m_priority(priority)
    {
    }

    StringView MockSdkResolver::name() const { return m_name; }

    int MockSdkResolver::priority() const { return m_priority; }

    ExpectedL<SdkResult> MockSdkResolver::resolve(const SdkReference& sdk, MessageSink& warning_sink) const
    {
        ++m_calls;
        if (delay.count() != 0)
        {
            std::this_thread::sleep_for(delay);
        }

        if (auto w = warning.get())
        {
            warning_sink.println_warning(LocalizedString::from_raw(*w));
        }

        auto it = results.find(sdk.name);
        if (it == results.end())
        {
            return LocalizedString::from_raw(Strings::concat(m_name, " does not know ", sdk));
        }

        return it->second;
    }

    ExpectedL<SdkResult> MockSdkResolverService::resolve_sdk(const SdkReference& sdk, MessageSink& warning_sink) const
    {
        return resolver.resolve(sdk, warning_sink);
    }
}
