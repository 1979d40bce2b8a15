#include <evalctx-test/util.h>

#include <evalctx/base/files.h>
#include <evalctx/base/strings.h>

#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

using namespace evalctx;
using Test::base_temporary_directory;

#define CHECK_EC_ON_FILE(file, ec)                                                                                     \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL((file).native() << ": " << (ec).message());                                                           \
        }                                                                                                              \
    } while (0)

TEST_CASE ("Path regular operations", "[filesystem][files]")
{
    CHECK(Path().native().empty());
    Path p("hello");
    CHECK(p == "hello");
    CHECK(p.native() == "hello");
    Path copy_constructed(p);
    CHECK(copy_constructed.native() == "hello");
    Path move_constructed(std::move(p));
    CHECK(move_constructed.native() == "hello");

    p = "world";
    Path copy_assigned;
    copy_assigned = p;
    CHECK(copy_assigned.native() == "world");

    Path conv("convert from");
    StringView conv_sv = conv;
    CHECK(conv_sv == "convert from");
    CHECK(strcmp(conv.c_str(), "convert from") == 0);
}

static void test_op_slash(StringView base, StringView append, StringView expected)
{
    Path an_lvalue(base);
    CHECK((an_lvalue / append).native() == expected);  // Path operator/(StringView sv) const&;
    CHECK((Path(base) / append).native() == expected); // Path operator/(StringView sv) &&;
    an_lvalue /= append;                               // Path& operator/=(StringView sv);
    CHECK(an_lvalue.native() == expected);
}

TEST_CASE ("Path::operator/", "[filesystem][files]")
{
    test_op_slash("/a/b", "c/d", "/a/b" EVALCTX_PREFERRED_SEPARATOR "c/d");
    test_op_slash("a/b", "c/d", "a/b" EVALCTX_PREFERRED_SEPARATOR "c/d");
    test_op_slash("a/b/", "c/d", "a/b/c/d");
    test_op_slash("/a/b", "/c/d", "/c/d");
    test_op_slash("", "c/d", "c/d");
    test_op_slash("/", "c", "/c");
}

TEST_CASE ("Path::operator+", "[filesystem][files]")
{
    Path p("/a/b");
    CHECK((p + ".txt").native() == "/a/b.txt");
    p += "/c";
    CHECK(p.native() == "/a/b/c");
}

static void test_lexically_normal(const Path& input, const Path& expected_output)
{
    auto as_normal = input.lexically_normal();
    CHECK(as_normal.native() == expected_output.native());
}

TEST_CASE ("Path::lexically_normal", "[filesystem][files]")
{
    test_lexically_normal({}, {});

    test_lexically_normal("cat/./dog/..", "cat/");
    test_lexically_normal("cat/.///dog/../", "cat/");

    test_lexically_normal(".", ".");
    test_lexically_normal("./", ".");
    test_lexically_normal("./.", ".");
    test_lexically_normal("././", ".");

    test_lexically_normal("../../..", "../../..");
    test_lexically_normal("../../../", "../../..");
    test_lexically_normal("../../../a/b/c", "../../../a/b/c");

    test_lexically_normal("/../../..", "/");
    test_lexically_normal("/../../../", "/");
    test_lexically_normal("/../../../a/b/c", "/a/b/c");

    test_lexically_normal("a/..", ".");
    test_lexically_normal("a/../", ".");

    test_lexically_normal("/", "/");
    test_lexically_normal("//a//b", "/a/b");
    test_lexically_normal("/a/./b/../c", "/a/c");
    test_lexically_normal("a/b/", "a/b/");
}

TEST_CASE ("Path decomposition", "[filesystem][files]")
{
    CHECK(Path("/a/b").parent_path() == "/a");
    CHECK(Path("/a").parent_path() == "/");
    CHECK(Path("/").parent_path() == "/");
    CHECK(Path("a").parent_path() == "");
    CHECK(Path("a/b//").parent_path() == "a/b");

    CHECK(Path("/a/b.txt").filename() == "b.txt");
    CHECK(Path("b.txt").filename() == "b.txt");
    CHECK(Path("/a/").filename() == "");

    CHECK(Path("/a").is_absolute());
    CHECK(Path("a").is_relative());
    CHECK(Path("").is_relative());
}

TEST_CASE ("Path::make_generic", "[filesystem][files]")
{
    Path p("a//b///c/");
    p.make_generic();
    CHECK(p.native() == "a/b/c/");
}

TEST_CASE ("real filesystem round trip", "[files]")
{
    const Filesystem& fs = real_filesystem;
    const auto temp_dir = base_temporary_directory() / "real-filesystem";
    INFO("temp dir is: " << temp_dir.native());

    std::error_code ec;
    fs.remove_all(temp_dir, ec);
    CHECK_EC_ON_FILE(temp_dir, ec);

    CHECK(fs.status(temp_dir, ec) == FileType::not_found);
    CHECK_EC_ON_FILE(temp_dir, ec);
    CHECK_FALSE(fs.exists(temp_dir, EVALCTX_LINE_INFO));

    CHECK(fs.create_directories(temp_dir / "sub" / "deeper", ec));
    CHECK_EC_ON_FILE(temp_dir, ec);
    CHECK_FALSE(fs.create_directories(temp_dir / "sub", ec));
    CHECK_EC_ON_FILE(temp_dir, ec);

    fs.write_contents(temp_dir / "a.cs", "class A {}", EVALCTX_LINE_INFO);
    fs.write_contents(temp_dir / "sub" / "b.cs", "class B {}", EVALCTX_LINE_INFO);

    CHECK(fs.is_directory(temp_dir));
    CHECK(fs.is_regular_file(temp_dir / "a.cs"));
    CHECK_FALSE(fs.is_regular_file(temp_dir / "sub"));
    CHECK(fs.status(temp_dir / "missing" / "child", ec) == FileType::not_found);
    CHECK_EC_ON_FILE(temp_dir, ec);

    auto entries = fs.get_directory_entries(temp_dir, EVALCTX_LINE_INFO);
    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& lhs, const DirectoryEntry& rhs) {
        return lhs.name < rhs.name;
    });
    std::vector<DirectoryEntry> expected{{"a.cs", FileType::regular}, {"sub", FileType::directory}};
    CHECK(entries == expected);

    auto missing = fs.try_get_directory_entries(temp_dir / "missing");
    REQUIRE_FALSE(missing.has_value());
    CHECK(Strings::starts_with(missing.error(), "try_get_directory_entries(\""));

    fs.remove_all(temp_dir, ec);
    CHECK_EC_ON_FILE(temp_dir, ec);
    CHECK_FALSE(fs.exists(temp_dir, EVALCTX_LINE_INFO));
}

TEST_CASE ("directory listing keeps entries that cannot be stat-ed", "[files]")
{
    const Filesystem& fs = real_filesystem;
    const auto temp_dir = base_temporary_directory() / "symlink-loop";
    INFO("temp dir is: " << temp_dir.native());

    std::error_code ec;
    fs.remove_all(temp_dir, ec);
    CHECK_EC_ON_FILE(temp_dir, ec);
    fs.create_directories(temp_dir, EVALCTX_LINE_INFO);
    fs.write_contents(temp_dir / "a.cs", "class A {}", EVALCTX_LINE_INFO);
    const auto loop = temp_dir / "self";
    REQUIRE(::symlink(loop.c_str(), loop.c_str()) == 0);

    auto entries = fs.get_directory_entries(temp_dir, ec);
    CHECK_EC_ON_FILE(temp_dir, ec);
    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& lhs, const DirectoryEntry& rhs) {
        return lhs.name < rhs.name;
    });
    std::vector<DirectoryEntry> expected{{"a.cs", FileType::regular}, {"self", FileType::unknown}};
    CHECK(entries == expected);

    fs.remove_all(temp_dir, ec);
    CHECK_EC_ON_FILE(temp_dir, ec);
}

TEST_CASE ("almost_canonical resolves against the current directory", "[files]")
{
    const auto cwd = real_filesystem.current_path(EVALCTX_LINE_INFO);
    CHECK(cwd.is_absolute());
    CHECK(real_filesystem.almost_canonical("a/../b", EVALCTX_LINE_INFO).native() == (cwd / "b").native());
    CHECK(real_filesystem.almost_canonical("/x/./y", EVALCTX_LINE_INFO).native() == "/x/y");
}
