#include <evalctx-test/util.h>

#include <evalctx/base/cache.h>
#include <evalctx/base/stringview.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace evalctx;

struct Just
{
    int result;
    int operator()() const { return result; }
};

template<class StringLiteralType>
void test_case_cache()
{
    Cache<std::string, int> cache;
    const StringLiteralType apple{"apple"};
    const StringLiteralType durian{"durian"};
    const StringLiteralType melon{"melon"};
    // check that things can be put into the cache and are cached
    const auto first_addr = &(cache.get_lazy(durian, Just{42}));
    CHECK(*first_addr == 42);
    const auto cache_hit_addr = &(cache.get_lazy(durian, Just{42}));
    CHECK(first_addr == cache_hit_addr);

    // also check that inserting an element "before an element" works
    const auto miss_below_addr = &(cache.get_lazy(apple, Just{1729}));
    CHECK(*miss_below_addr == 1729);
    CHECK(miss_below_addr != first_addr);
    const auto hit_below_addr = &(cache.get_lazy(apple, Just{1729}));
    CHECK(hit_below_addr == miss_below_addr);

    // also check that inserting an element "at the end" works
    const auto miss_above_addr = &(cache.get_lazy(melon, Just{1234}));
    CHECK(*miss_above_addr == 1234);
    CHECK(miss_above_addr != first_addr);
    const auto hit_above_addr = &(cache.get_lazy(melon, Just{1234}));
    CHECK(hit_above_addr == miss_above_addr);

    CHECK(cache.size() == 3);
}

TEST_CASE ("cache non-transparent", "[cache]")
{
    test_case_cache<std::string>();
}

TEST_CASE ("cache transparent", "[cache]")
{
    test_case_cache<StringLiteral>();
}

TEST_CASE ("cache keeps the first value", "[cache]")
{
    Cache<std::string, int> cache;
    CHECK(cache.get_lazy(std::string("key"), Just{1}) == 1);
    CHECK(cache.get_lazy(std::string("key"), Just{2}) == 1);
}

TEST_CASE ("cache initializes each key once across threads", "[cache]")
{
    Cache<std::string, int> cache;
    std::atomic<int> calls{0};
    std::vector<const int*> seen(8);
    std::vector<std::thread> threads;
    for (size_t idx = 0; idx < seen.size(); ++idx)
    {
        threads.emplace_back([&, idx] {
            seen[idx] = &cache.get_lazy(std::string("shared"), [&] {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                return static_cast<int>(idx);
            });
        });
    }

    for (auto&& t : threads)
    {
        t.join();
    }

    CHECK(calls.load() == 1);
    for (auto p : seen)
    {
        CHECK(p == seen[0]);
    }

    CHECK(cache.size() == 1);
}
