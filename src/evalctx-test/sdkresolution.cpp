#include <evalctx-test/mocksdkresolver.h>
#include <evalctx-test/util.h>

#include <evalctx/sdkresolution.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace evalctx;
using Test::CapturingMessageSink;
using Test::MockSdkResolver;
using Test::MockSdkResolverService;

namespace
{
    struct ResolverSet
    {
        std::vector<std::unique_ptr<SdkResolver>> resolvers;

        MockSdkResolver& add(std::string name, int priority)
        {
            auto resolver = std::make_unique<MockSdkResolver>(std::move(name), priority);
            auto& result = *resolver;
            resolvers.push_back(std::move(resolver));
            return result;
        }
    };

    SdkReference sdk(std::string name) { return SdkReference{std::move(name), nullopt}; }
    SdkReference sdk(std::string name, std::string version) { return SdkReference{std::move(name), std::move(version)}; }
}

TEST_CASE ("SdkReference formatting", "[sdkresolution]")
{
    CHECK(sdk("Foo").to_string() == "Foo");
    CHECK(sdk("Foo", "1.0").to_string() == "Foo/1.0");
    CHECK(fmt::format("{}", sdk("Foo", "1.0")) == "Foo/1.0");
    CHECK(sdk("Foo") != sdk("Foo", "1.0"));
    CHECK(SdkCacheKey(sdk("Foo")) == SdkCacheKey(sdk("Foo", "")));
    CHECK(SdkCacheKey(sdk("Foo")) < SdkCacheKey(sdk("Foo", "1.0")));
}

TEST_CASE ("resolvers are consulted in priority order", "[sdkresolution]")
{
    ResolverSet set;
    auto& late = set.add("Late", 100);
    auto& early = set.add("Early", 1);
    auto& tie_first = set.add("TieFirst", 50);
    auto& tie_second = set.add("TieSecond", 50);
    late.results.emplace("Foo", SdkResult{"/late/Foo", "1.0"});
    tie_first.results.emplace("Foo", SdkResult{"/tie-first/Foo", "1.0"});
    tie_second.results.emplace("Foo", SdkResult{"/tie-second/Foo", "1.0"});

    SdkResolverService service(std::move(set.resolvers));
    REQUIRE(service.resolvers().size() == 4);
    CHECK(service.resolvers()[0]->name() == "Early");
    CHECK(service.resolvers()[1]->name() == "TieFirst");
    CHECK(service.resolvers()[2]->name() == "TieSecond");
    CHECK(service.resolvers()[3]->name() == "Late");

    auto result = service.resolve_sdk(sdk("Foo"), null_sink);
    REQUIRE(result.has_value());
    CHECK(*result.get() == SdkResult{"/tie-first/Foo", "1.0"});
    CHECK(early.calls() == 1);
    CHECK(tie_first.calls() == 1);
    CHECK(tie_second.calls() == 0);
    CHECK(late.calls() == 0);
}

TEST_CASE ("every resolver failing aggregates the errors", "[sdkresolution]")
{
    ResolverSet set;
    set.add("Second", 2);
    set.add("First", 1);
    SdkResolverService service(std::move(set.resolvers));

    auto result = service.resolve_sdk(sdk("Foo", "2.0"), null_sink);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().data() == "Could not resolve SDK \"Foo\" 2.0. Every registered resolver failed:\n"
                                   "First could not resolve the SDK:\n"
                                   "  First does not know Foo/2.0\n"
                                   "Second could not resolve the SDK:\n"
                                   "  Second does not know Foo/2.0");
}

TEST_CASE ("no resolvers", "[sdkresolution]")
{
    SdkResolverService service(std::vector<std::unique_ptr<SdkResolver>>{});
    auto result = service.resolve_sdk(sdk("Foo"), null_sink);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().data() == "No SDK resolvers are registered.");
}

TEST_CASE ("resolver warnings reach the sink", "[sdkresolution]")
{
    ResolverSet set;
    auto& resolver = set.add("Noisy", 0);
    resolver.warning = "the SDK cache is stale";
    resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});
    SdkResolverService service(std::move(set.resolvers));

    CapturingMessageSink sink;
    CHECK(service.resolve_sdk(sdk("Foo"), sink).has_value());
    CHECK(sink.lines() == std::vector<std::string>{"warning: the SDK cache is stale"});
}

TEST_CASE ("is_reference_same_version", "[sdkresolution]")
{
    CHECK(is_reference_same_version(sdk("Foo"), "1.0"));
    CHECK(is_reference_same_version(sdk("Foo", ""), "1.0"));
    CHECK(is_reference_same_version(sdk("Foo", "1.0"), "1.0"));
    CHECK(is_reference_same_version(sdk("Foo", "1.0-preview"), "1.0-PrEvIeW"));
    CHECK_FALSE(is_reference_same_version(sdk("Foo", "1.0"), "1.0.0"));
    CHECK_FALSE(is_reference_same_version(sdk("Foo", "1.0.0"), "1.0.0.0"));
    CHECK_FALSE(is_reference_same_version(sdk("Foo", "1.2.3.4"), "1.2.3.0"));
}

TEST_CASE ("a result at another version warns", "[sdkresolution]")
{
    ResolverSet set;
    set.add("Mismatched", 0).results.emplace("Foo", SdkResult{"/sdks/Foo", "2.0.0"});
    SdkResolverService service(std::move(set.resolvers));

    CapturingMessageSink sink;
    auto result = service.resolve_sdk(sdk("Foo", "1.0.0"), sink);
    REQUIRE(result.has_value());
    CHECK(result.get()->path.native() == "/sdks/Foo");
    CHECK(sink.lines() ==
          std::vector<std::string>{"warning: The SDK reference \"Foo\" version \"1.0.0\" was resolved to version "
                                   "\"2.0.0\" instead. You could be using a different version than expected if you do "
                                   "not update the referenced version to match."});

    // an unversioned reference or one differing only in case accepts the result silently
    CapturingMessageSink quiet;
    CHECK(service.resolve_sdk(sdk("Foo"), quiet).has_value());
    CHECK(service.resolve_sdk(sdk("Foo", "2.0.0"), quiet).has_value());
    CHECK(quiet.lines().empty());
}

TEST_CASE ("the resolution cache memoizes successes and failures", "[sdkresolution]")
{
    MockSdkResolverService underlying;
    underlying.resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});
    SdkResolutionCache cache;

    const auto& first = cache.resolve(sdk("Foo"), underlying, null_sink);
    const auto& second = cache.resolve(sdk("Foo"), underlying, null_sink);
    CHECK(&first == &second);
    REQUIRE(first.has_value());
    CHECK(*first.get() == SdkResult{"/sdks/Foo", "1.0"});
    CHECK(underlying.calls() == 1);

    const auto& missing = cache.resolve(sdk("Bar"), underlying, null_sink);
    CHECK_FALSE(missing.has_value());
    // a resolver that learns about Bar later is not consulted again
    underlying.resolver.results.emplace("Bar", SdkResult{"/sdks/Bar", "1.0"});
    CHECK_FALSE(cache.resolve(sdk("Bar"), underlying, null_sink).has_value());
    CHECK(underlying.calls() == 2);

    // SDK names are case sensitive
    CHECK_FALSE(cache.resolve(sdk("foo"), underlying, null_sink).has_value());
    CHECK(underlying.calls() == 3);
    CHECK(cache.size() == 3);
}

TEST_CASE ("requesting a second version of an SDK warns", "[sdkresolution]")
{
    MockSdkResolverService underlying;
    underlying.resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});
    SdkResolutionCache cache;
    CapturingMessageSink sink;

    CHECK(cache.resolve(sdk("Foo", "1.0"), underlying, sink).has_value());
    CHECK(cache.resolve(sdk("Foo"), underlying, sink).has_value());
    CHECK(cache.resolve(sdk("Foo", "1.0"), underlying, sink).has_value());
    CHECK(sink.lines().empty());

    CHECK(cache.resolve(sdk("Foo", "2.0"), underlying, sink).has_value());
    CHECK(cache.resolve(sdk("Foo", "2.0"), underlying, sink).has_value());
    CHECK(sink.lines() ==
          std::vector<std::string>{"warning: SDK \"Foo\" was requested at version 2.0, but this evaluation context "
                                   "already resolved it at version 1.0."});
    CHECK(underlying.calls() == 3);
}

TEST_CASE ("concurrent requests resolve once", "[sdkresolution]")
{
    MockSdkResolverService underlying;
    underlying.resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});
    underlying.resolver.delay = std::chrono::milliseconds(20);
    SdkResolutionCache cache;
    CachingSdkResolverService service(cache, underlying);

    std::vector<std::thread> threads;
    std::vector<int> succeeded(8);
    for (size_t idx = 0; idx < succeeded.size(); ++idx)
    {
        threads.emplace_back([&, idx] {
            auto result = service.resolve_sdk(sdk("Foo", "1.0"), null_sink);
            succeeded[idx] = result.has_value() ? 1 : 0;
        });
    }

    for (auto&& t : threads)
    {
        t.join();
    }

    CHECK(underlying.calls() == 1);
    for (int s : succeeded)
    {
        CHECK(s == 1);
    }
}
