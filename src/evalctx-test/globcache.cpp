#include <evalctx-test/mockfilesystem.h>
#include <evalctx-test/util.h>

#include <evalctx/existencecache.h>
#include <evalctx/globcache.h>

#include <unistd.h>

#include <string>
#include <vector>

using namespace evalctx;

namespace
{
    using strings = std::vector<std::string>;

    void add_glob_tree(Test::MockFilesystem& fs)
    {
        fs.add_file("/A/Glob/a.cs");
        fs.add_file("/A/Glob/sub/b.cs");
        fs.add_file("/A/Glob/sub/deep/c.cs");
        fs.add_file("/A/Glob/readme.txt");
        fs.add_file("/A/x.cs");
        fs.add_directory("/B");
    }
}

TEST_CASE ("traverse_glob", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    ExistenceCache existence(fs);

    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "**/*.cs"}, existence) == strings{"a.cs", "sub/b.cs", "sub/deep/c.cs"});
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "*.cs"}, existence) == strings{"a.cs"});
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "*"}, existence) == strings{"a.cs", "readme.txt"});
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "s?b/*.cs"}, existence) == strings{"sub/b.cs"});
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "**/deep/*"}, existence) == strings{"sub/deep/c.cs"});
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "**/**/./*.txt"}, existence) == strings{"readme.txt"});
    CHECK(traverse_glob(GlobCacheKey{"/A", "**/*"}, existence) ==
          strings{"x.cs", "Glob/a.cs", "Glob/readme.txt", "Glob/sub/b.cs", "Glob/sub/deep/c.cs"});
    CHECK(traverse_glob(GlobCacheKey{"/missing", "**/*.cs"}, existence).empty());
}

TEST_CASE ("unlistable directories contribute nothing", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    fs.deny_listing("/A/Glob/sub");
    ExistenceCache existence(fs);
    CHECK(traverse_glob(GlobCacheKey{"/A/Glob", "**/*.cs"}, existence) == strings{"a.cs"});
}

TEST_CASE ("expand keeps the spelling of the fixed directory part", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    ExistenceCache existence(fs);
    GlobExpansionCache globs;

    CHECK(globs.expand("Glob/**/*.cs", "/A", existence) ==
          strings{"Glob/a.cs", "Glob/sub/b.cs", "Glob/sub/deep/c.cs"});
    CHECK(globs.expand("Glob\\*.cs", "/A", existence) == strings{"Glob/a.cs"});
    CHECK(globs.expand("../A/Glob/*.txt", "/B", existence) == strings{"../A/Glob/readme.txt"});
    CHECK(globs.expand("/A/Glob/**/*.cs", "/B", existence) ==
          strings{"/A/Glob/a.cs", "/A/Glob/sub/b.cs", "/A/Glob/sub/deep/c.cs"});
}

TEST_CASE ("equivalent specs share one traversal", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    ExistenceCache existence(fs);
    GlobExpansionCache globs;

    CHECK(globs.expand("Glob/**/*.cs", "/A", existence).size() == 3);
    CHECK(globs.size() == 1);
    const auto listings = fs.directory_entries_calls();

    CHECK(globs.expand("/A/Glob/**/*.cs", "/B", existence).size() == 3);
    CHECK(globs.size() == 1);
    CHECK(fs.directory_entries_calls() == listings);

    // a new file is not observed by the cached expansion
    fs.add_file("/A/Glob/sub/d.cs");
    CHECK(globs.expand("Glob/**/*.cs", "/A", existence).size() == 3);
}

TEST_CASE ("the same spec in two cones is cached twice", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    fs.add_file("/B/y.cs");
    ExistenceCache existence(fs);
    GlobExpansionCache globs;

    CHECK(globs.expand("**/*.cs", "/A", existence) ==
          strings{"x.cs", "Glob/a.cs", "Glob/sub/b.cs", "Glob/sub/deep/c.cs"});
    CHECK(globs.expand("**/*.cs", "/B", existence) == strings{"y.cs"});
    CHECK(globs.size() == 2);
}

TEST_CASE ("literal and illegal specs are not expanded", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    ExistenceCache existence(fs);
    GlobExpansionCache globs;

    CHECK(globs.expand("Glob\\a.cs", "/A", existence) == strings{"Glob\\a.cs"});
    CHECK(globs.expand("does/not/exist.cs", "/A", existence) == strings{"does/not/exist.cs"});
    CHECK(globs.expand("Glob/a**/*.cs", "/A", existence) == strings{"Glob/a**/*.cs"});
    CHECK(globs.expand("Glob/*/../*.cs", "/A", existence) == strings{"Glob/*/../*.cs"});
    CHECK(globs.size() == 0);
    CHECK(fs.directory_entries_calls() == 0);
    CHECK(fs.status_calls() == 0);
}

TEST_CASE ("globs below a missing directory match nothing", "[globcache]")
{
    Test::MockFilesystem fs;
    add_glob_tree(fs);
    ExistenceCache existence(fs);
    GlobExpansionCache globs;

    CHECK(globs.expand("missing/**/*.cs", "/A", existence).empty());
    CHECK(globs.size() == 1);
}

TEST_CASE ("a symlink loop does not hide its siblings", "[globcache]")
{
    const Filesystem& fs = real_filesystem;
    const auto temp_dir = Test::base_temporary_directory() / "glob-symlink-loop";
    fs.remove_all(temp_dir, EVALCTX_LINE_INFO);
    fs.create_directories(temp_dir, EVALCTX_LINE_INFO);
    fs.write_contents(temp_dir / "a.cs", "class A {}", EVALCTX_LINE_INFO);
    const auto loop = temp_dir / "self";
    REQUIRE(::symlink(loop.c_str(), loop.c_str()) == 0);

    ExistenceCache existence(fs);
    GlobExpansionCache globs;
    CHECK(globs.expand("*.cs", temp_dir, existence) == strings{"a.cs"});

    fs.remove_all(temp_dir, EVALCTX_LINE_INFO);
}
