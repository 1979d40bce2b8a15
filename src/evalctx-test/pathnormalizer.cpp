#include <evalctx-test/util.h>

#include <evalctx/filespec.h>
#include <evalctx/pathnormalizer.h>

using namespace evalctx;

TEST_CASE ("PathNormalizer::normalize", "[pathnormalizer]")
{
    CHECK(PathNormalizer::normalize("/A/./b/../c/").native() == "/A/c");
    CHECK(PathNormalizer::normalize("\\A\\b\\\\c").native() == "/A/b/c");
    CHECK(PathNormalizer::normalize("/").native() == "/");
    CHECK(PathNormalizer::normalize("/..").native() == "/");
    CHECK(PathNormalizer::normalize("a/b/..").native() == "a");
    CHECK(PathNormalizer::normalize("a/..").native() == ".");
    CHECK(PathNormalizer::normalize("../x/").native() == "../x");
}

TEST_CASE ("PathNormalizer::resolve", "[pathnormalizer]")
{
    CHECK(PathNormalizer::resolve("/A", "Glob").native() == "/A/Glob");
    CHECK(PathNormalizer::resolve("/A", "../B/Glob/").native() == "/B/Glob");
    CHECK(PathNormalizer::resolve("/A", "/C/Glob").native() == "/C/Glob");
    CHECK(PathNormalizer::resolve("/A/", "").native() == "/A");
    CHECK(PathNormalizer::resolve("/A", "sub\\file.cs").native() == "/A/sub/file.cs");
}

TEST_CASE ("glob cache keys are shared by equivalent specs", "[pathnormalizer]")
{
    const auto relative = PathNormalizer::make_glob_cache_key("/A", split_file_spec("Glob/**/*.cs"));
    const auto absolute = PathNormalizer::make_glob_cache_key("/B", split_file_spec("/A/Glob/**/*.cs"));
    const auto roundabout = PathNormalizer::make_glob_cache_key("/A/sub", split_file_spec("../Glob/./**/*.cs"));
    CHECK(relative.fixed_directory_root.native() == "/A/Glob");
    CHECK(relative.pattern_remainder == "**/*.cs");
    CHECK(relative == absolute);
    CHECK(relative == roundabout);
    CHECK(relative.to_string() == "/A/Glob|**/*.cs");
}

TEST_CASE ("glob cache keys keep cones apart", "[pathnormalizer]")
{
    // the same spec evaluated from two project directories covers two different cones
    const auto in_a = PathNormalizer::make_glob_cache_key("/A", split_file_spec("**/*.cs"));
    const auto in_b = PathNormalizer::make_glob_cache_key("/B", split_file_spec("**/*.cs"));
    CHECK(in_a.fixed_directory_root.native() == "/A");
    CHECK(in_b.fixed_directory_root.native() == "/B");
    CHECK(in_a != in_b);
    CHECK((in_a < in_b) != (in_b < in_a));

    const auto other_pattern = PathNormalizer::make_glob_cache_key("/A", split_file_spec("**/*.vb"));
    CHECK(in_a != other_pattern);
}

TEST_CASE ("a recursive filename covers every file", "[pathnormalizer]")
{
    const auto key = PathNormalizer::make_glob_cache_key("/A", split_file_spec("src/**"));
    CHECK(key.fixed_directory_root.native() == "/A/src");
    CHECK(key.pattern_remainder == "**/*");
}
