#include <gtest/gtest.h>
#include <vector>

#include "../include/paged_sequence.hpp"

class counting_page_source : public vector_page_source<int>
{
public:
    int fetches = 0;

    counting_page_source() : vector_page_source<int>({ { 1, 2, 3 }, { 4, 5, 6 }, { 7, 8 } }) {}

    std::vector<int> fetch_page(page_number_t page_number) override
    {
        fetches++;
        return vector_page_source<int>::fetch_page(page_number);
    }
};

TEST(paged_cursor_tests, next_walks_the_sequence_then_reports_the_end)
{
    counting_page_source source;
    paged_sequence<int> sequence{ source };
    auto cursor = sequence.iterate();

    std::vector<int> result;
    while (auto item = cursor.next())
    {
        result.push_back(*item);
    }

    EXPECT_EQ(result, std::vector<int>({ 1, 2, 3, 4, 5, 6, 7, 8 }));
    EXPECT_FALSE(cursor.has_next());
    EXPECT_FALSE(cursor.next().has_value());
    EXPECT_EQ(cursor.position(), 8);
    EXPECT_EQ(source.fetches, 3);
}

TEST(paged_cursor_tests, read_past_the_end_throws)
{
    counting_page_source source;
    paged_sequence<int> sequence{ source };
    paged_cursor<int> cursor{ sequence, 7 };

    EXPECT_EQ(cursor.read(), 8);
    EXPECT_THROW(cursor.read(), index_out_of_bounds_exception);
    EXPECT_EQ(cursor.position(), 8);
}

TEST(paged_cursor_tests, negative_start_position_is_rejected)
{
    counting_page_source source;
    paged_sequence<int> sequence{ source };

    EXPECT_THROW(paged_cursor<int>(sequence, -1), index_out_of_bounds_exception);
    EXPECT_NO_THROW(paged_cursor<int>(sequence, 8));
    EXPECT_EQ(source.fetches, 0);
}

TEST(paged_cursor_tests, reset_restarts_with_the_cached_pages)
{
    counting_page_source source;
    paged_sequence<int> sequence{ source };
    auto cursor = sequence.iterate();

    std::vector<int> result;
    while (auto item = cursor.next())
    {
        result.push_back(*item);
    }
    cursor.reset();
    EXPECT_EQ(cursor.position(), 0);
    while (auto item = cursor.next())
    {
        result.push_back(*item);
    }

    EXPECT_EQ(result, std::vector<int>({ 1, 2, 3, 4, 5, 6, 7, 8, 1, 2, 3, 4, 5, 6, 7, 8 }));
    EXPECT_EQ(source.fetches, 3);
}

TEST(paged_cursor_tests, each_pass_keeps_its_own_position)
{
    counting_page_source source;
    paged_sequence<int> sequence{ source };
    auto first = sequence.iterate();
    auto second = sequence.iterate();

    EXPECT_EQ(*first.next(), 1);
    EXPECT_EQ(*first.next(), 2);
    EXPECT_EQ(*second.next(), 1);
    EXPECT_EQ(*first.next(), 3);
    EXPECT_EQ(*second.next(), 2);

    // a new pass always starts at the beginning
    EXPECT_EQ(*sequence.iterate().next(), 1);
    EXPECT_EQ(source.fetches, 1);
}

TEST(paged_cursor_tests, failed_fetch_leaves_the_position_unchanged)
{
    class failing_once_source : public counting_page_source
    {
    public:
        bool fail = true;

        std::vector<int> fetch_page(page_number_t page_number) override
        {
            if (page_number == 1 && fail)
            {
                fail = false;
                throw std::runtime_error("timeout");
            }
            return counting_page_source::fetch_page(page_number);
        }
    };

    failing_once_source source;
    paged_sequence<int> sequence{ source };
    paged_cursor<int> cursor{ sequence, 2 };

    EXPECT_EQ(*cursor.next(), 3);
    EXPECT_THROW(cursor.next(), std::runtime_error);
    EXPECT_EQ(cursor.position(), 3);
    EXPECT_EQ(*cursor.next(), 4);
}
