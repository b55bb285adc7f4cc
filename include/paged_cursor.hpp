#pragma once

#include <optional>

#include "../include/core.hpp"

template <typename T>
class paged_sequence;

// One sequential pass over a paged_sequence. Each cursor keeps its own
// position; all cursors of a sequence share its page cache.
template <typename T>
class paged_cursor
{
    paged_sequence<T>* sequence_;
    index_t position_ = 0;
public:
    explicit paged_cursor(paged_sequence<T>& sequence, index_t position = 0)
        : sequence_(&sequence), position_(position)
    {
        if (position_ < 0)
        {
            throw index_out_of_bounds_exception(position_);
        }
    }

    bool has_next() const
    {
        return position_ < sequence_->length();
    }

    // empty once the end of the sequence is reached
    std::optional<T> next()
    {
        if (!has_next())
        {
            return std::nullopt;
        }
        return read();
    }

    // throws index_out_of_bounds_exception past the end
    const T& read()
    {
        const T& item = sequence_->get(position_);
        ++position_;
        return item;
    }

    void reset()
    {
        position_ = 0;
    }

    index_t position() const
    {
        return position_;
    }
};
