#include <evalctx-test/util.h>

#include <evalctx/filespec.h>

using namespace evalctx;

static void check_split(StringView spec, StringView fixed, StringView wildcard, StringView filename)
{
    INFO("spec: " << spec.to_string());
    const auto parts = split_file_spec(spec);
    CHECK(parts.fixed_directory_part == fixed);
    CHECK(parts.wildcard_directory_part == wildcard);
    CHECK(parts.filename_part == filename);
}

TEST_CASE ("split_file_spec", "[filespec]")
{
    check_split("src/**/obj/*.cs", "src/", "**/obj/", "*.cs");
    check_split("Glob/**/*.cs", "Glob/", "**/", "*.cs");
    check_split("**/*.cs", "", "**/", "*.cs");
    check_split("*.cs", "", "", "*.cs");
    check_split("/A/Glob/**/*.cs", "/A/Glob/", "**/", "*.cs");
    check_split("a/b.cs", "a/", "", "b.cs");
    check_split("b.cs", "", "", "b.cs");
    check_split("src/a?c/d/*.txt", "src/", "a?c/d/", "*.txt");
    check_split("src/**", "src/", "", "**");
    check_split("", "", "", "");
}

TEST_CASE ("normalize_file_spec_separators", "[filespec]")
{
    CHECK(normalize_file_spec_separators("src\\**\\*.cs") == "src/**/*.cs");
    CHECK(normalize_file_spec_separators("/already/fine") == "/already/fine");
}

TEST_CASE ("has_wildcards", "[filespec]")
{
    CHECK(has_wildcards("*.cs"));
    CHECK(has_wildcards("a?.cs"));
    CHECK(has_wildcards("**/x"));
    CHECK_FALSE(has_wildcards("a/b.cs"));
    CHECK_FALSE(has_wildcards(""));
}

TEST_CASE ("is_legal_file_spec", "[filespec]")
{
    CHECK(is_legal_file_spec(split_file_spec("src/**/*.cs")));
    CHECK(is_legal_file_spec(split_file_spec("../src/**/*.cs")));
    CHECK(is_legal_file_spec(split_file_spec("**")));
    CHECK(is_legal_file_spec(split_file_spec("a/b.cs")));
    CHECK_FALSE(is_legal_file_spec(split_file_spec("src/a**/*.cs")));
    CHECK_FALSE(is_legal_file_spec(split_file_spec("src/**.cs")));
    CHECK_FALSE(is_legal_file_spec(split_file_spec("src/*/../*.cs")));
    CHECK_FALSE(is_legal_file_spec(split_file_spec("src/*/..")));
}

TEST_CASE ("wildcard_match", "[filespec]")
{
    CHECK(wildcard_match("*", ""));
    CHECK(wildcard_match("*", "anything"));
    CHECK(wildcard_match("*.cs", "a.cs"));
    CHECK(wildcard_match("*.cs", ".cs"));
    CHECK_FALSE(wildcard_match("*.cs", "a.csx"));
    CHECK(wildcard_match("a?c", "abc"));
    CHECK_FALSE(wildcard_match("a?c", "ac"));
    CHECK(wildcard_match("a*b*c", "aXXbYYbZc"));
    CHECK_FALSE(wildcard_match("a*b*c", "aXXbYY"));
    CHECK(wildcard_match("exact", "exact"));
    CHECK_FALSE(wildcard_match("exact", "Exact"));
    CHECK(wildcard_match("", ""));
    CHECK_FALSE(wildcard_match("", "x"));
}

TEST_CASE ("file_spec_matches", "[filespec]")
{
    CHECK(file_spec_matches("**/*.cs", "a.cs"));
    CHECK(file_spec_matches("**/*.cs", "sub/deep/a.cs"));
    CHECK_FALSE(file_spec_matches("**/*.cs", "sub/deep/a.txt"));
    CHECK(file_spec_matches("src/**/obj/*.cs", "src/obj/a.cs"));
    CHECK(file_spec_matches("src/**/obj/*.cs", "src/x/y/obj/a.cs"));
    CHECK_FALSE(file_spec_matches("src/**/obj/*.cs", "src/x/y/a.cs"));
    CHECK(file_spec_matches("/A/**", "/A/x/y.cs"));
    CHECK_FALSE(file_spec_matches("/A/**", "/A"));
    CHECK(file_spec_matches("./a/*.cs", "a/./b.cs"));
    CHECK_FALSE(file_spec_matches("a/*.cs", "a/b/c.cs"));
}
