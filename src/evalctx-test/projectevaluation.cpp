#include <evalctx-test/mockfilesystem.h>
#include <evalctx-test/mocksdkresolver.h>
#include <evalctx-test/util.h>

#include <evalctx/globcache.h>
#include <evalctx/projectevaluation.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace evalctx;

namespace
{
    using strings = std::vector<std::string>;

    ProjectDefinition project_with_items(Path directory, std::string include)
    {
        ProjectDefinition definition;
        definition.project_directory = std::move(directory);
        definition.items.push_back(ItemSpec{std::move(include), {}});
        return definition;
    }

    const strings& items_of(const Project& project)
    {
        return project.last_evaluation().value_or_exit(EVALCTX_LINE_INFO).items;
    }

    EvaluationContext make_context(SharingPolicy policy, const Test::MockFilesystem& fs)
    {
        if (policy == SharingPolicy::Shared)
        {
            return EvaluationContext::create(policy, &fs).value_or_exit(EVALCTX_LINE_INFO);
        }

        return EvaluationContext::create(policy).value_or_exit(EVALCTX_LINE_INFO);
    }
}

TEST_CASE ("a shared context keeps serving cached globs", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    auto context = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    Project first(project_with_items("/A", "*.cs"), context, resolver, null_sink);
    CHECK(items_of(first) == strings{"a.cs"});

    fs.add_file("/A/b.cs");
    Project second(project_with_items("/A", "*.cs"), context, resolver, null_sink);
    CHECK(items_of(second) == strings{"a.cs"});
    CHECK(second.context() == context);
    CHECK(fs.directory_entries_calls("/A") == 1);

    // a context of its own observes the change
    auto fresh = make_context(SharingPolicy::Shared, fs);
    Project third(project_with_items("/A", "*.cs"), fresh, resolver, null_sink);
    CHECK(items_of(third) == strings{"a.cs", "b.cs"});
}

TEST_CASE ("re-evaluation keeps a shared context", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    auto shared = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    Project project(project_with_items("/A", "*.cs"), shared, resolver, null_sink);
    CHECK(items_of(project) == strings{"a.cs"});

    fs.add_file("/A/b.cs");
    project.reevaluate();
    CHECK(items_of(project) == strings{"a.cs"});
    project.reevaluate(shared);
    CHECK(items_of(project) == strings{"a.cs"});
    CHECK(project.context() == shared);

    auto other = make_context(SharingPolicy::Shared, fs);
    project.reevaluate(other);
    CHECK(project.context() == other);
    CHECK(items_of(project) == strings{"a.cs", "b.cs"});
}

TEST_CASE ("re-evaluation reuses the project's isolated context", "[projectevaluation]")
{
    const auto temp_dir = Test::base_temporary_directory() / "reevaluate";
    const Filesystem& fs = real_filesystem;
    fs.remove_all(temp_dir, EVALCTX_LINE_INFO);
    fs.create_directories(temp_dir, EVALCTX_LINE_INFO);
    fs.write_contents(temp_dir / "a.cs", "", EVALCTX_LINE_INFO);

    auto isolated = EvaluationContext::create(SharingPolicy::Isolated).value_or_exit(EVALCTX_LINE_INFO);
    Test::MockSdkResolverService resolver;
    Project first(project_with_items(temp_dir, "*.cs"), isolated, resolver, null_sink);
    CHECK(items_of(first) == strings{"a.cs"});
    const auto first_context = first.context();

    fs.write_contents(temp_dir / "b.cs", "", EVALCTX_LINE_INFO);

    // a new project gets new caches and sees the new file
    Project second(project_with_items(temp_dir, "*.cs"), isolated, resolver, null_sink);
    auto second_items = items_of(second);
    std::sort(second_items.begin(), second_items.end());
    CHECK(second_items == strings{"a.cs", "b.cs"});
    CHECK(second.context() != first_context);

    // re-evaluating the first project keeps its context and its stale view
    first.reevaluate();
    CHECK(items_of(first) == strings{"a.cs"});
    CHECK(first.context() == first_context);
    first.reevaluate(isolated);
    CHECK(items_of(first) == strings{"a.cs"});
    CHECK(first.context() == first_context);

    // a different context is adopted
    auto other = EvaluationContext::create(SharingPolicy::Isolated).value_or_exit(EVALCTX_LINE_INFO);
    first.reevaluate(other);
    CHECK(first.context() != first_context);
    auto refreshed_items = items_of(first);
    std::sort(refreshed_items.begin(), refreshed_items.end());
    CHECK(refreshed_items == strings{"a.cs", "b.cs"});

    fs.remove_all(temp_dir, EVALCTX_LINE_INFO);
}

TEST_CASE ("projects without a context are isolated", "[projectevaluation]")
{
    Test::MockSdkResolverService resolver;
    ProjectDefinition definition;
    definition.project_directory = "/";
    Project project(std::move(definition), nullopt, resolver, null_sink);
    CHECK(project.context().policy() == SharingPolicy::Isolated);
    CHECK(project.last_evaluation().has_value());
}

TEST_CASE ("glob cones of different projects stay apart", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    fs.add_file("/A/sub/a2.cs");
    fs.add_file("/B/b.cs");
    auto context = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    Project in_a(project_with_items("/A", "**/*.cs"), context, resolver, null_sink);
    Project in_b(project_with_items("/B", "**/*.cs"), context, resolver, null_sink);
    CHECK(items_of(in_a) == strings{"a.cs", "sub/a2.cs"});
    CHECK(items_of(in_b) == strings{"b.cs"});
    CHECK(context.glob_cache().size() == 2);

    // an absolute spelling of A's cone from B reuses A's entry
    Project from_b(project_with_items("/B", "/A/**/*.cs"), context, resolver, null_sink);
    CHECK(items_of(from_b) == strings{"/A/a.cs", "/A/sub/a2.cs"});
    CHECK(context.glob_cache().size() == 2);
}

TEST_CASE ("SDKs resolve once per shared context", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_directory("/A");
    Test::MockSdkResolverService resolver;
    resolver.resolver.results.emplace("Foo", SdkResult{"/sdks/Foo", "1.0"});

    ProjectDefinition definition;
    definition.project_directory = "/A";
    definition.sdks.push_back(SdkReference{"Foo", nullopt});

    SECTION ("shared")
    {
        auto context = make_context(SharingPolicy::Shared, fs);
        Project first(definition, context, resolver, null_sink);
        Project second(definition, context, resolver, null_sink);
        REQUIRE(second.last_evaluation().has_value());
        CHECK(second.last_evaluation().get()->sdks == std::vector<SdkResult>{SdkResult{"/sdks/Foo", "1.0"}});
        CHECK(resolver.calls() == 1);
    }

    SECTION ("isolated")
    {
        auto context = make_context(SharingPolicy::Isolated, fs);
        Project first(definition, context, resolver, null_sink);
        Project second(definition, context, resolver, null_sink);
        CHECK(resolver.calls() == 2);
        first.reevaluate();
        CHECK(resolver.calls() == 2);
    }
}

TEST_CASE ("SDK failures fail the evaluation", "[projectevaluation]")
{
    Test::MockSdkResolverService resolver;
    ProjectDefinition definition;
    definition.project_directory = "/A";
    definition.sdks.push_back(SdkReference{"Missing", nullopt});
    Project project(std::move(definition), nullopt, resolver, null_sink);
    REQUIRE_FALSE(project.last_evaluation().has_value());
    CHECK(project.last_evaluation().error().data() == "MockSdkResolver does not know Missing");
}

TEST_CASE ("imports", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/Directory.Build.props");
    fs.add_file("/A/imports/one.targets");
    fs.add_file("/A/imports/two.targets");
    auto context = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    ProjectDefinition definition;
    definition.project_directory = "/A/src";

    SECTION ("literal and glob imports")
    {
        definition.imports = {"../Directory.Build.props", "..\\imports\\*.targets", "../none/*.targets"};
        Project project(definition, context, resolver, null_sink);
        REQUIRE(project.last_evaluation().has_value());
        const auto& imports = project.last_evaluation().get()->imports;
        REQUIRE(imports.size() == 3);
        CHECK(imports[0] == "/A/Directory.Build.props");
        CHECK(imports[1] == "/A/imports/one.targets");
        CHECK(imports[2] == "/A/imports/two.targets");
    }

    SECTION ("missing literal import")
    {
        definition.imports = {"../Missing.props"};
        Project project(definition, context, resolver, null_sink);
        REQUIRE_FALSE(project.last_evaluation().has_value());
        CHECK(project.last_evaluation().error().data() ==
              "error: The imported project \"/A/Missing.props\" was not found. The import was written as "
              "\"../Missing.props\".");
    }

    SECTION ("illegal glob imports are treated literally")
    {
        definition.imports = {"../imports/a**.targets"};
        Project project(definition, context, resolver, null_sink);
        REQUIRE_FALSE(project.last_evaluation().has_value());
    }
}

TEST_CASE ("excludes", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    fs.add_file("/A/b.cs");
    fs.add_file("/A/obj/gen.cs");
    fs.add_file("/A/sub/c.cs");
    auto context = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    ProjectDefinition definition;
    definition.project_directory = "/A";
    definition.items.push_back(ItemSpec{"**/*.cs", {"obj/**", ".\\b.cs"}});
    definition.items.push_back(ItemSpec{"a.cs", {"*.cs"}});
    Project project(std::move(definition), context, resolver, null_sink);
    CHECK(items_of(project) == strings{"a.cs", "sub/c.cs"});
}

TEST_CASE ("excludes resolve against the project directory", "[projectevaluation]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    fs.add_file("/A/b.cs");
    fs.add_file("/A/c.cs");
    fs.add_file("/A/sub/d.cs");
    fs.add_file("/A/sub/e.txt");
    auto context = make_context(SharingPolicy::Shared, fs);
    Test::MockSdkResolverService resolver;

    ProjectDefinition definition;
    definition.project_directory = "/A";
    definition.items.push_back(ItemSpec{"*.cs", {"/A/b.cs", "sub/../c.cs"}});
    definition.items.push_back(ItemSpec{"sub/*", {"/A/sub/*.cs"}});
    definition.items.push_back(ItemSpec{"/A/*.cs", {"a.cs", "../A/c.cs"}});
    Project project(std::move(definition), context, resolver, null_sink);
    CHECK(items_of(project) == strings{"a.cs", "sub/e.txt", "/A/b.cs"});
}
