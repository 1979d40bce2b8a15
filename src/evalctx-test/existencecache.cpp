#include <evalctx-test/mockfilesystem.h>
#include <evalctx-test/util.h>

#include <evalctx/existencecache.h>

using namespace evalctx;

TEST_CASE ("existence probes are memoized per path", "[existencecache]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    ExistenceCache cache(fs);

    CHECK(&cache.file_system() == &fs);
    CHECK(cache.exists("/A/a.cs"));
    CHECK(cache.is_regular_file("/A/./a.cs"));
    CHECK(cache.is_regular_file("/A/sub/../a.cs"));
    CHECK_FALSE(cache.is_directory("/A/a.cs"));
    CHECK(fs.status_calls("/A/a.cs") == 1);

    CHECK(cache.is_directory("/A/"));
    CHECK(cache.status("/A") == FileType::directory);
    CHECK(fs.status_calls("/A") == 1);

    CHECK_FALSE(cache.exists("/A/missing.cs"));
    CHECK_FALSE(cache.exists("/A/missing.cs"));
    CHECK(fs.status_calls("/A/missing.cs") == 1);

    CHECK(fs.status_calls() == 3);
    CHECK(cache.status_entry_count() == 3);
}

TEST_CASE ("existence answers do not observe later changes", "[existencecache]")
{
    Test::MockFilesystem fs;
    fs.add_directory("/A");
    ExistenceCache cache(fs);

    CHECK_FALSE(cache.exists("/A/new.cs"));
    fs.add_file("/A/new.cs");
    CHECK_FALSE(cache.exists("/A/new.cs"));

    ExistenceCache fresh(fs);
    CHECK(fresh.exists("/A/new.cs"));
}

TEST_CASE ("directory listings are memoized", "[existencecache]")
{
    Test::MockFilesystem fs;
    fs.add_file("/A/a.cs");
    fs.add_directory("/A/sub");
    ExistenceCache cache(fs);

    const auto& first = cache.directory_entries("/A");
    REQUIRE(first.has_value());
    std::vector<DirectoryEntry> expected{{"a.cs", FileType::regular}, {"sub", FileType::directory}};
    CHECK(*first.get() == expected);

    fs.add_file("/A/b.cs");
    const auto& second = cache.directory_entries("/A/sub/..");
    CHECK(&first == &second);
    CHECK(*second.get() == expected);
    CHECK(fs.directory_entries_calls("/A") == 1);
    CHECK(cache.directory_entry_count() == 1);
}

TEST_CASE ("directory listing failures are memoized", "[existencecache]")
{
    Test::MockFilesystem fs;
    fs.add_directory("/A/locked");
    fs.deny_listing("/A/locked");
    ExistenceCache cache(fs);

    const auto& missing = cache.directory_entries("/A/missing");
    REQUIRE_FALSE(missing.has_value());
    CHECK(Strings::starts_with(missing.error(), "Could not list /A/missing: "));

    const auto& locked = cache.directory_entries("/A/locked");
    REQUIRE_FALSE(locked.has_value());
    CHECK(Strings::starts_with(locked.error(), "Could not list /A/locked: "));

    fs.add_directory("/A/missing");
    CHECK_FALSE(cache.directory_entries("/A/missing").has_value());
    CHECK(fs.directory_entries_calls("/A/missing") == 1);
    CHECK(fs.directory_entries_calls("/A/locked") == 1);
}
