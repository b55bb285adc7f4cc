#include <charconv>
#include <limits>
#include "../include/core.hpp"

invalid_index_exception::invalid_index_exception(std::string_view text)
    : paged_sequence_exception("Index must be a positive integer: " + std::string(text))
{
}

index_out_of_bounds_exception::index_out_of_bounds_exception(index_t index)
    : paged_sequence_exception("Index out of bounds: " + std::to_string(index)), index_(index)
{
}

index_out_of_bounds_exception::index_out_of_bounds_exception(std::string_view text, index_t index)
    : paged_sequence_exception("Index out of bounds: " + std::string(text)), index_(index)
{
}

not_implemented_exception::not_implemented_exception(std::string_view accessor)
    : paged_sequence_exception(std::string(accessor) + "() must be implemented.")
{
}

bool try_parse_index(std::string_view text, index_t& index)
{
    if (text.empty())
    {
        return false;
    }

    // from_chars accepts a leading '-' but not '+' or whitespace
    index_t value = 0;
    auto first = text.data();
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
    {
        return false;
    }

    index = value;
    return true;
}

index_t parse_index(std::string_view text)
{
    index_t index = 0;
    if (try_parse_index(text, index))
    {
        return index;
    }

    // an integer, just not one index_t can hold
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, index);
    if (!text.empty() && ec == std::errc::result_out_of_range && ptr == last)
    {
        auto clamped = text.front() == '-' ? std::numeric_limits<index_t>::min() : std::numeric_limits<index_t>::max();
        throw index_out_of_bounds_exception(text, clamped);
    }
    throw invalid_index_exception(text);
}
