#include <evalctx-test/util.h>

#include <evalctx/base/expected.h>
#include <evalctx/base/optional.h>

#include <memory>
#include <string>

using namespace evalctx;

TEST_CASE ("equal", "[optional]")
{
    CHECK(Optional<int>{} == Optional<int>{});
    CHECK_FALSE(Optional<int>{} == Optional<int>{42});
    CHECK_FALSE(Optional<int>{42} == Optional<int>{});
    CHECK_FALSE(Optional<int>{1729} == Optional<int>{42});
    CHECK(Optional<int>{42} == Optional<int>{42});
    CHECK(Optional<int>{42} == 42);
    CHECK(Optional<int>{} != 42);
}

TEST_CASE ("ref conversion", "[optional]")
{
    Optional<int> i_empty;
    Optional<int> i_1 = 1;
    const Optional<int> ci_1 = 1;

    Optional<int&> ref_empty = i_empty;
    Optional<const int&> cref_empty = i_empty;

    Optional<int&> ref_1 = i_1;
    Optional<const int&> cref_1 = ci_1;

    REQUIRE(ref_empty.has_value() == false);
    REQUIRE(cref_empty.has_value() == false);

    REQUIRE(ref_1.get() == i_1.get());
    REQUIRE(cref_1.get() == ci_1.get());

    const int x = 5;
    cref_1 = x;
    REQUIRE(cref_1.get() == &x);
}

TEST_CASE ("value_or", "[optional]")
{
    Optional<std::string> empty;
    Optional<std::string> full = std::string("full");
    CHECK(empty.value_or("default") == "default");
    CHECK(full.value_or("default") == "full");

    const std::string referenced = "referenced";
    Optional<const std::string&> ref = referenced;
    CHECK(ref.value_or("default") == "referenced");
}

TEST_CASE ("optional.map", "[optional]")
{
    const Optional<std::unique_ptr<int>> move_only;
    Optional<int*> m = move_only.map([](auto&& p) { return p.get(); });
    CHECK_FALSE(m.has_value());

    Optional<int> five = 5;
    CHECK(five.map([](int i) { return i * 2; }) == 10);
}

TEST_CASE ("expected value and error", "[expected]")
{
    ExpectedL<int> value = 42;
    REQUIRE(value.has_value());
    CHECK(*value.get() == 42);
    CHECK(value.value_or_exit(EVALCTX_LINE_INFO) == 42);

    ExpectedL<int> error = LocalizedString::from_raw("it failed");
    REQUIRE_FALSE(error.has_value());
    CHECK(error.get() == nullptr);
    CHECK(error.error() == LocalizedString::from_raw("it failed"));

    value = std::move(error);
    REQUIRE_FALSE(value.has_value());
    CHECK(value.error().data() == "it failed");
}

TEST_CASE ("expected map", "[expected]")
{
    ExpectedL<int> value = 21;
    auto doubled = value.map([](int i) { return i * 2; });
    REQUIRE(doubled.has_value());
    CHECK(*doubled.get() == 42);

    ExpectedL<int> error = LocalizedString::from_raw("nope");
    auto mapped_error = error.map([](int i) { return i * 2; });
    REQUIRE_FALSE(mapped_error.has_value());
    CHECK(mapped_error.error().data() == "nope");
}
