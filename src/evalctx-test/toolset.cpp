#include <evalctx-test/util.h>

#include <evalctx/base/system.h>

#include <evalctx/toolset.h>

using namespace evalctx;

namespace
{
    SubToolsetVersion version(StringView name) { return SubToolsetVersion::parse(name).value_or_exit(EVALCTX_LINE_INFO); }

    Toolset make_toolset(std::vector<SubToolset> sub_toolsets,
                         PropertyMap global_properties = {},
                         PropertyMap environment_properties = {})
    {
        return Toolset{"Current",
                       "/msbuild/bin",
                       PropertyMap{{"a", "a1"}, {"b", "b1"}},
                       std::move(sub_toolsets),
                       std::move(global_properties),
                       std::move(environment_properties)};
    }

    std::vector<SubToolset> sub_toolsets_named(std::vector<std::string> names)
    {
        std::vector<SubToolset> result;
        for (auto&& name : names)
        {
            result.push_back(SubToolset{name, {}});
        }

        return result;
    }
}

TEST_CASE ("SubToolsetVersion::parse", "[toolset]")
{
    auto v11 = SubToolsetVersion::parse("v11.0");
    REQUIRE(v11.has_value());
    CHECK(v11.get()->version_major == 11);
    CHECK(v11.get()->version_minor == 0);

    auto full = SubToolsetVersion::parse("1.2.3.4");
    REQUIRE(full.has_value());
    CHECK(full.get()->version_major == 1);
    CHECK(full.get()->version_minor == 2);
    CHECK(full.get()->build == 3);
    CHECK(full.get()->revision == 4);

    CHECK(SubToolsetVersion::parse("12") == version("12.0"));
    CHECK(SubToolsetVersion::parse("V12.0") == version("12.0"));

    CHECK_FALSE(SubToolsetVersion::parse("").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("v").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("FakeSubToolset").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("1..2").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("1.2.").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("1.2.3.4.5").has_value());
    CHECK_FALSE(SubToolsetVersion::parse("-1.0").has_value());

    CHECK(version("v11.0") < version("12.0"));
    CHECK(version("12.0") < version("12.0.1"));
    CHECK_FALSE(version("12.0") < version("12"));

    CHECK(version("12.0").build == -1);
    CHECK(version("12.0").revision == -1);
    CHECK(version("12.0") != version("12.0.0"));
    CHECK(version("12.0") < version("12.0.0"));
    CHECK(version("12.0.0") != version("12.0.0.0"));
}

TEST_CASE ("the solution version only matches a two part sub-toolset", "[toolset]")
{
    auto toolset = make_toolset({SubToolset{"12.0.0", {}}, SubToolset{"11.0", {}}});
    SubToolsetVersionInputs inputs;
    inputs.solution_file_version = 13;
    CHECK(toolset.generate_sub_toolset_version(inputs) == "12.0.0");

    auto two_part = make_toolset({SubToolset{"12.0.0", {}}, SubToolset{"12.0", {}}, SubToolset{"11.0", {}}});
    CHECK(two_part.generate_sub_toolset_version(inputs) == "12.0");
}

TEST_CASE ("sub-toolset properties override the toolset", "[toolset]")
{
    auto toolset = make_toolset({SubToolset{"v11.0", PropertyMap{{"b", "b2"}, {"c", "c2"}}}});

    CHECK(toolset.get_property("a", "v11.0") == "a1");
    CHECK(toolset.get_property("b", "v11.0") == "b2");
    CHECK(toolset.get_property("c", "v11.0") == "c2");
    CHECK_FALSE(toolset.get_property("d", "v11.0").has_value());

    CHECK(toolset.get_property("b", "") == "b1");
    CHECK_FALSE(toolset.get_property("c", "").has_value());
    CHECK(toolset.get_property("b", "v12.0") == "b1");

    // property and sub-toolset names are case insensitive
    CHECK(toolset.get_property("B", "V11.0") == "b2");
    REQUIRE(toolset.find_sub_toolset("V11.0").has_value());
    CHECK(toolset.find_sub_toolset("V11.0").get()->name == "v11.0");
    CHECK_FALSE(toolset.find_sub_toolset("v12.0").has_value());
}

TEST_CASE ("an empty sub-toolset value still overrides", "[toolset]")
{
    auto toolset = make_toolset({SubToolset{"v11.0", PropertyMap{{"a", ""}}}});
    CHECK(toolset.get_property("a", "v11.0") == "");
}

TEST_CASE ("default sub-toolset version", "[toolset]")
{
    CHECK(make_toolset(sub_toolsets_named({"v11.0", "12.0", "v13.0", "FakeSubToolset"}))
              .default_sub_toolset_version() == "v13.0");
    CHECK(make_toolset(sub_toolsets_named({"v13.0", "12.0"})).default_sub_toolset_version() == "v13.0");
    CHECK(make_toolset(sub_toolsets_named({"13.0", "v13"})).default_sub_toolset_version() == "13.0");
    CHECK(make_toolset(sub_toolsets_named({"Fake", "OtherFake"})).default_sub_toolset_version() == "OtherFake");
    CHECK_FALSE(make_toolset({}).default_sub_toolset_version().has_value());
}

TEST_CASE ("sub-toolset version precedence", "[toolset]")
{
    const auto names = sub_toolsets_named({"v11.0", "v12.0", "v14.0"});

    SubToolsetVersionInputs inputs;
    CHECK(make_toolset(names).generate_sub_toolset_version(inputs) == "v14.0");

    inputs.solution_file_version = 13;
    CHECK(make_toolset(names).generate_sub_toolset_version(inputs) == "v12.0");

    // no sub-toolset matches the solution's version
    inputs.solution_file_version = 16;
    CHECK(make_toolset(names).generate_sub_toolset_version(inputs) == "v14.0");

    inputs.solution_file_version = 1;
    CHECK(make_toolset(names).generate_sub_toolset_version(inputs) == "v14.0");

    inputs.solution_file_version = 13;
    inputs.environment_properties.emplace("VisualStudioVersion", "11.0");
    CHECK(make_toolset(names).generate_sub_toolset_version(inputs) == "11.0");

    CHECK(make_toolset(names, {}, PropertyMap{{"visualstudioversion", "10.0"}}).generate_sub_toolset_version(inputs) ==
          "10.0");
    CHECK(make_toolset(names, PropertyMap{{"VisualStudioVersion", "9.0"}}, PropertyMap{{"VisualStudioVersion", "10.0"}})
              .generate_sub_toolset_version(inputs) == "9.0");

    inputs.explicit_global_properties.emplace("VisualStudioVersion", "99.0");
    CHECK(make_toolset(names, PropertyMap{{"VisualStudioVersion", "9.0"}}).generate_sub_toolset_version(inputs) ==
          "99.0");
}

TEST_CASE ("environment_properties", "[toolset]")
{
    set_environment_variable("EVALCTX_TEST_TOOLSET_PROPERTY", std::string("from-environment"));
    set_environment_variable("EVALCTX_TEST_TOOLSET_UNSET", nullopt);
    auto properties = environment_properties({"EVALCTX_TEST_TOOLSET_PROPERTY", "EVALCTX_TEST_TOOLSET_UNSET"});
    CHECK(properties.size() == 1);
    CHECK(properties["evalctx_test_toolset_property"] == "from-environment");
    set_environment_variable("EVALCTX_TEST_TOOLSET_PROPERTY", nullopt);
}
