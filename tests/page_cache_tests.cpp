#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/page_cache.hpp"

TEST(page_cache_tests, miss_fetches_and_hit_does_not)
{
    page_cache<std::string> cache;
    int fetches = 0;
    auto fetch = [&fetches](page_number_t page_number)
    {
        fetches++;
        return std::vector<std::string>{ "page", std::to_string(page_number) };
    };

    EXPECT_FALSE(cache.exists(4));
    const auto& page = cache.get_page(4, fetch);
    EXPECT_EQ(page[1], "4");
    EXPECT_TRUE(cache.exists(4));

    const auto& again = cache.get_page(4, fetch);
    EXPECT_EQ(&page, &again);
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(page_cache_tests, references_survive_later_inserts)
{
    page_cache<int> cache;
    auto fetch = [](page_number_t page_number) { return std::vector<int>(3, static_cast<int>(page_number)); };

    const auto& first = cache.get_page(0, fetch);
    for (page_number_t n = 1; n < 100; n++)
    {
        cache.get_page(n, fetch);
    }

    EXPECT_EQ(first, std::vector<int>({ 0, 0, 0 }));
    EXPECT_EQ(cache.size(), 100u);
}

TEST(page_cache_tests, failed_fetch_stores_nothing)
{
    page_cache<int> cache;
    auto failing = [](page_number_t) -> std::vector<int> { throw std::runtime_error("unreachable"); };

    EXPECT_THROW(cache.get_page(2, failing), std::runtime_error);
    EXPECT_FALSE(cache.exists(2));
    EXPECT_EQ(cache.size(), 0u);

    const auto& page = cache.get_page(2, [](page_number_t) { return std::vector<int>{ 9 }; });
    EXPECT_EQ(page, std::vector<int>({ 9 }));
}

TEST(page_cache_tests, page_numbers_are_ascending)
{
    page_cache<int> cache;
    auto fetch = [](page_number_t) { return std::vector<int>{}; };

    cache.get_page(7, fetch);
    cache.get_page(2, fetch);
    cache.get_page(5, fetch);

    EXPECT_EQ(cache.page_numbers(), std::vector<page_number_t>({ 2, 5, 7 }));
}
