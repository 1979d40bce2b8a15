#include <evalctx-test/util.h>

#include <evalctx/base/strings.h>

#include <string>
#include <vector>

using namespace evalctx;

TEST_CASE ("split by char", "[strings]")
{
    using Strings::split;
    using result_t = std::vector<std::string>;
    REQUIRE(split(",,,,,,", ',').empty());
    REQUIRE(split(",,a,,b,,", ',') == result_t{"a", "b"});
    REQUIRE(split("hello world", ' ') == result_t{"hello", "world"});
    REQUIRE(split("    hello  world    ", ' ') == result_t{"hello", "world"});
    REQUIRE(split("no delimiters", ',') == result_t{"no delimiters"});
}

TEST_CASE ("join", "[strings]")
{
    std::vector<std::string> empty;
    CHECK(Strings::join(", ", empty) == "");
    std::vector<std::string> names{"a", "b", "c"};
    CHECK(Strings::join(", ", names) == "a, b, c");
    CHECK(Strings::join("/", names, [](const std::string& name) { return name + name; }) == "aa/bb/cc");
}

TEST_CASE ("case insensitive comparisons", "[strings]")
{
    CHECK(Strings::case_insensitive_ascii_equals("MSBuildToolsPath", "msbuildtoolspath"));
    CHECK_FALSE(Strings::case_insensitive_ascii_equals("MSBuildToolsPath", "MSBuildBinPath"));
    CHECK(Strings::case_insensitive_ascii_less("apple", "BANANA"));
    CHECK_FALSE(Strings::case_insensitive_ascii_less("BANANA", "apple"));
    CHECK_FALSE(Strings::case_insensitive_ascii_less("Apple", "aPPLE"));
    CHECK(Strings::ascii_to_lowercase("V11.0") == "v11.0");
}

TEST_CASE ("starts_with and ends_with", "[strings]")
{
    CHECK(Strings::starts_with("v11.0", "v"));
    CHECK_FALSE(Strings::starts_with("v", "v11.0"));
    CHECK(Strings::ends_with("Microsoft.Common.targets", ".targets"));
    CHECK_FALSE(Strings::ends_with("targets", ".targets"));
}

TEST_CASE ("strto_int", "[strings]")
{
    CHECK(Strings::strto_int("0") == 0);
    CHECK(Strings::strto_int("12") == 12);
    CHECK(Strings::strto_int("2147483647") == 2147483647);
    CHECK_FALSE(Strings::strto_int("2147483648").has_value());
    CHECK_FALSE(Strings::strto_int("").has_value());
    CHECK_FALSE(Strings::strto_int("-1").has_value());
    CHECK_FALSE(Strings::strto_int("1a").has_value());
}

TEST_CASE ("inplace_replace_all", "[strings]")
{
    std::string s = "a\\b\\c";
    Strings::inplace_replace_all(s, '\\', '/');
    CHECK(s == "a/b/c");
}
