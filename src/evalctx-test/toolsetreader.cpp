#include <evalctx-test/mocktoolsetdefinitionkey.h>
#include <evalctx-test/util.h>

#include <evalctx/toolsetreader.h>

using namespace evalctx;
using Test::MockToolsetDefinitionKey;

TEST_CASE ("read toolsets with sub-toolsets", "[toolsetreader]")
{
    MockToolsetDefinitionKey tools_versions("ToolsVersions");
    tools_versions.set_string("IgnoredOnRoot", "x");
    tools_versions.add_subkey("2.0").set_string("MSBuildBinPath", "/msbuild/2.0").set_string("a", "a2");
    auto current = tools_versions.add_subkey("Current");
    current.set_string("MSBuildToolsPath", "/msbuild/current").set_string("a", "a1").set_string("b", "b1");
    current.add_subkey("v11.0").set_string("b", "b2").set_string("c", "c2");
    current.add_subkey("v12.0");

    MockToolsetDefinitionKey current_version("CurrentVersion");
    current_version.set_string("DefaultToolsVersion", "Current");
    current_version.set_string("MSBuildOverrideTasksPath", "/msbuild/override");
    current_version.set_value("SomethingElse", ToolsetValueKind::DWord, "1");

    PropertyMap global{{"g", "global"}};
    PropertyMap environment{{"e", "environment"}};
    auto maybe_result = read_toolsets(tools_versions, &current_version, global, environment);
    REQUIRE(maybe_result.has_value());
    auto& result = *maybe_result.get();

    REQUIRE(result.toolsets.size() == 2);
    CHECK(result.default_tools_version == "Current");
    CHECK(result.override_tasks_path == "/msbuild/override");
    CHECK_FALSE(result.default_override_tools_version.has_value());

    auto& old = result.toolsets.at("2.0");
    CHECK(old.tools_version() == "2.0");
    CHECK(old.tools_path() == "/msbuild/2.0");
    CHECK(old.properties() == PropertyMap{{"a", "a2"}});
    CHECK(old.sub_toolsets().empty());

    auto& toolset = result.toolsets.at("current");
    CHECK(toolset.tools_path() == "/msbuild/current");
    CHECK(toolset.global_properties() == global);
    CHECK(toolset.environment_properties() == environment);
    REQUIRE(toolset.sub_toolsets().size() == 2);
    CHECK(toolset.sub_toolsets()[0].name == "v11.0");
    CHECK(toolset.sub_toolsets()[1].name == "v12.0");
    CHECK(toolset.get_property("a", "v11.0") == "a1");
    CHECK(toolset.get_property("b", "v11.0") == "b2");
    CHECK(toolset.get_property("c", "v11.0") == "c2");
    CHECK(toolset.get_property("b", "v12.0") == "b1");
    CHECK(toolset.default_sub_toolset_version() == "v12.0");
}

TEST_CASE ("toolsets without a tools path are skipped", "[toolsetreader]")
{
    MockToolsetDefinitionKey tools_versions("ToolsVersions");
    tools_versions.add_subkey("NoPath").set_string("a", "a1");
    tools_versions.add_subkey("EmptyPath").set_string("MSBuildToolsPath", "");
    tools_versions.add_subkey("4.0").set_string("MSBuildToolsPath", "/msbuild/4.0");

    auto maybe_result = read_toolsets(tools_versions, nullptr, {}, {});
    REQUIRE(maybe_result.has_value());
    auto& result = *maybe_result.get();
    REQUIRE(result.toolsets.size() == 1);
    CHECK(result.toolsets.count("4.0") == 1);
    CHECK_FALSE(result.default_tools_version.has_value());
}

TEST_CASE ("matching tools and bin paths are accepted", "[toolsetreader]")
{
    MockToolsetDefinitionKey tools_versions("ToolsVersions");
    tools_versions.add_subkey("4.0")
        .set_string("MSBuildToolsPath", "/MSBuild/4.0")
        .set_string("MSBuildBinPath", "/msbuild/4.0");

    auto maybe_result = read_toolsets(tools_versions, nullptr, {}, {});
    REQUIRE(maybe_result.has_value());
    CHECK(maybe_result.get()->toolsets.at("4.0").tools_path() == "/MSBuild/4.0");
}

TEST_CASE ("invalid toolset definitions", "[toolsetreader]")
{
    SECTION ("conflicting tools paths")
    {
        MockToolsetDefinitionKey tools_versions("ToolsVersions");
        tools_versions.add_subkey("4.0")
            .set_string("MSBuildToolsPath", "/msbuild/a")
            .set_string("MSBuildBinPath", "/msbuild/b");
        auto maybe_result = read_toolsets(tools_versions, nullptr, {}, {});
        REQUIRE_FALSE(maybe_result.has_value());
        CHECK(maybe_result.error().data() ==
              "error: Toolset 4.0 sets MSBuildToolsPath and MSBuildBinPath to different values. Remove one of them or "
              "make them equal.");
    }

    SECTION ("tools path in a sub-toolset")
    {
        MockToolsetDefinitionKey tools_versions("ToolsVersions");
        auto toolset = tools_versions.add_subkey("4.0");
        toolset.set_string("MSBuildToolsPath", "/msbuild/4.0");
        toolset.add_subkey("v11.0").set_string("MSBuildBinPath", "/msbuild/sub");
        auto maybe_result = read_toolsets(tools_versions, nullptr, {}, {});
        REQUIRE_FALSE(maybe_result.has_value());
        CHECK(maybe_result.error().data() ==
              "error: Sub-toolset v11.0 of toolset 4.0 sets MSBuildToolsPath. Only the toolset itself may define the "
              "tools path.");
    }

    SECTION ("non-string property")
    {
        MockToolsetDefinitionKey tools_versions("ToolsVersions");
        tools_versions.add_subkey("4.0")
            .set_string("MSBuildToolsPath", "/msbuild/4.0")
            .set_value("Count", ToolsetValueKind::DWord, "4");
        auto maybe_result = read_toolsets(tools_versions, nullptr, {}, {});
        REQUIRE_FALSE(maybe_result.has_value());
        CHECK(maybe_result.error().data() ==
              "error: The value \"Count\" of the toolset definition \"ToolsVersions\\4.0\" is not a string.");
    }

    SECTION ("non-string default tools version")
    {
        MockToolsetDefinitionKey tools_versions("ToolsVersions");
        MockToolsetDefinitionKey current_version("CurrentVersion");
        current_version.set_value("DefaultToolsVersion", ToolsetValueKind::MultiString, "4.0\n12.0");
        auto maybe_result = read_toolsets(tools_versions, &current_version, {}, {});
        REQUIRE_FALSE(maybe_result.has_value());
        CHECK(maybe_result.error().data() ==
              "error: The value \"DefaultToolsVersion\" of the toolset definition \"CurrentVersion\" is not a string.");
    }
}
