#include <evalctx-test/mockfilesystem.h>
#include <evalctx-test/mocksdkresolver.h>
#include <evalctx-test/util.h>

#include <evalctx/evaluationcontext.h>
#include <evalctx/existencecache.h>
#include <evalctx/globcache.h>
#include <evalctx/sdkresolution.h>

using namespace evalctx;

TEST_CASE ("sharing policy names", "[evaluationcontext]")
{
    CHECK(to_string_literal(SharingPolicy::Shared) == "Shared");
    CHECK(to_string_literal(SharingPolicy::Isolated) == "Isolated");
}

TEST_CASE ("shared contexts hand out themselves", "[evaluationcontext]")
{
    auto context = EvaluationContext::create(SharingPolicy::Shared).value_or_exit(EVALCTX_LINE_INFO);
    CHECK(context.policy() == SharingPolicy::Shared);
    CHECK_FALSE(context.has_file_system_override());
    CHECK(&context.file_system() == &real_filesystem);

    auto first = context.context_for_new_project();
    auto second = context.context_for_new_project();
    CHECK(first == context);
    CHECK(second == context);
    CHECK(&first.existence_cache() == &context.existence_cache());
    CHECK(&first.glob_cache() == &context.glob_cache());
    CHECK(&first.sdk_cache() == &context.sdk_cache());
}

TEST_CASE ("isolated contexts hand out fresh caches", "[evaluationcontext]")
{
    auto context = EvaluationContext::create(SharingPolicy::Isolated).value_or_exit(EVALCTX_LINE_INFO);
    auto first = context.context_for_new_project();
    auto second = context.context_for_new_project();
    CHECK(first != context);
    CHECK(second != context);
    CHECK(first != second);
    CHECK(first.policy() == SharingPolicy::Isolated);
    CHECK(&first.existence_cache() != &second.existence_cache());
    CHECK(&first.glob_cache() != &second.glob_cache());
    CHECK(&first.sdk_cache() != &second.sdk_cache());

    auto copy = first;
    CHECK(copy == first);
}

TEST_CASE ("separately created contexts are distinct", "[evaluationcontext]")
{
    auto a = EvaluationContext::create(SharingPolicy::Shared).value_or_exit(EVALCTX_LINE_INFO);
    auto b = EvaluationContext::create(SharingPolicy::Shared).value_or_exit(EVALCTX_LINE_INFO);
    CHECK(a != b);
}

TEST_CASE ("filesystem overrides require the shared policy", "[evaluationcontext]")
{
    Test::MockFilesystem fs;
    auto isolated = EvaluationContext::create(SharingPolicy::Isolated, &fs);
    REQUIRE_FALSE(isolated.has_value());
    CHECK(isolated.error().data() ==
          "error: A filesystem override can only be supplied to an evaluation context with the Shared policy.");

    auto shared = EvaluationContext::create(SharingPolicy::Shared, &fs).value_or_exit(EVALCTX_LINE_INFO);
    CHECK(shared.has_file_system_override());
    CHECK(&shared.file_system() == &fs);
    CHECK(&shared.existence_cache().file_system() == &fs);
    CHECK(&shared.context_for_new_project().file_system() == &fs);
}

TEST_CASE ("the context's caches see the override", "[evaluationcontext]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    auto context = EvaluationContext::create(SharingPolicy::Shared, &fs).value_or_exit(EVALCTX_LINE_INFO);

    CHECK(context.existence_cache().exists("/A/a.cs"));
    CHECK(context.glob_cache().expand("*.cs", "/A", context.existence_cache()) == std::vector<std::string>{"a.cs"});
    CHECK(fs.status_calls() == 1);
    CHECK(fs.directory_entries_calls() == 1);
}

TEST_CASE ("the context's SDK resolver service caches", "[evaluationcontext]")
{
    Test::MockSdkResolverService underlying;
    underlying.resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});
    auto context = EvaluationContext::create(SharingPolicy::Shared).value_or_exit(EVALCTX_LINE_INFO);

    auto service = context.sdk_resolver_service(underlying);
    CHECK(service.resolve_sdk(SdkReference{"Foo", nullopt}, null_sink).has_value());
    CHECK(context.sdk_resolver_service(underlying).resolve_sdk(SdkReference{"Foo", nullopt}, null_sink).has_value());
    CHECK(underlying.calls() == 1);
    CHECK(context.sdk_cache().size() == 1);
}
