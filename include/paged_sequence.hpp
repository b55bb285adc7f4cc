#pragma once

#include <cstddef>
#include <exception>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../include/core.hpp"
#include "../include/logging.hpp"
#include "../include/page_cache.hpp"
#include "../include/page_source.hpp"
#include "../include/paged_cursor.hpp"

/*
 * Read-only, randomly indexable view over a page_source.
 *
 * Offset i lives on page i / page_size() at position i % page_size(). A page
 * is fetched from the source the first time any of its items is read and is
 * kept for the life of the sequence, so each page is fetched at most once no
 * matter what order items are requested in. A fetch that throws stores
 * nothing, and the exception reaches the caller unchanged.
 *
 * The total size is read from the source on every call, so sources that only
 * learn it from their first fetch work as expected.
 *
 * Not thread safe.
 */
template <typename T>
class paged_sequence
{
    page_source<T>& source_;
    page_cache<T> cache_;
    std::shared_ptr<spdlog::logger> logger_;

    const std::vector<T>& load_page(page_number_t page_number)
    {
        if (cache_.exists(page_number))
        {
            logger_->trace("page {} cache hit", page_number);
        }

        return cache_.get_page(page_number, [this](page_number_t number) -> std::vector<T>
        {
            logger_->debug("page {} not cached, fetching", number);
            try
            {
                std::vector<T> page = source_.fetch_page(number);
                logger_->debug("page {} fetched, {} items", number, page.size());
                return page;
            }
            catch (const std::exception& ex)
            {
                logger_->warn("fetching page {} failed: {}", number, ex.what());
                throw;
            }
        });
    }

public:
    class iterator
    {
        paged_sequence* sequence_ = nullptr;
        index_t position_ = 0;
        bool is_end_ = false;

        bool at_end() const
        {
            return is_end_ || sequence_ == nullptr || position_ >= sequence_->length();
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        iterator(paged_sequence* sequence, index_t position, bool is_end = false)
            : sequence_(sequence), position_(position), is_end_(is_end)
        {
        }

        reference operator*() const
        {
            return sequence_->get(position_);
        }

        pointer operator->() const
        {
            return &sequence_->get(position_);
        }

        iterator& operator++()
        {
            ++position_;
            return *this;
        }

        iterator operator++(int)
        {
            iterator previous = *this;
            ++position_;
            return previous;
        }

        // end() compares against the live length of the sequence
        bool operator==(const iterator& other) const
        {
            if (is_end_ || other.is_end_)
            {
                return at_end() && other.at_end();
            }
            return sequence_ == other.sequence_ && position_ == other.position_;
        }

        bool operator!=(const iterator& other) const
        {
            return !(*this == other);
        }
    };

    explicit paged_sequence(page_source<T>& source)
        : source_(source), logger_(pagedseq_logger())
    {
    }

    paged_sequence(const paged_sequence&) = delete;
    paged_sequence& operator=(const paged_sequence&) = delete;

    index_t length() const
    {
        return source_.total_size();
    }

    std::size_t size() const
    {
        auto total = length();
        return total > 0 ? static_cast<std::size_t>(total) : 0;
    }

    index_t page_size() const
    {
        auto size = source_.page_size();
        if (size <= 0)
        {
            throw paged_sequence_exception("page size must be positive, got " + std::to_string(size));
        }
        return size;
    }

    index_t page_count() const
    {
        auto total = length();
        if (total <= 0)
        {
            return 0;
        }
        auto size = page_size();
        return (total + size - 1) / size;
    }

    bool contains(index_t index) const
    {
        return index >= 0 && index < length();
    }

    bool contains(std::string_view text) const
    {
        index_t index = 0;
        return try_parse_index(text, index) && contains(index);
    }

    const T& get(index_t index)
    {
        if (!contains(index))
        {
            throw index_out_of_bounds_exception(index);
        }

        auto size = page_size();
        auto page_number = static_cast<page_number_t>(index / size);
        auto offset = static_cast<std::size_t>(index % size);

        const std::vector<T>& page = load_page(page_number);
        if (offset >= page.size())
        {
            throw paged_sequence_exception("page " + std::to_string(page_number) + " holds "
                + std::to_string(page.size()) + " items, index " + std::to_string(index) + " needs "
                + std::to_string(offset + 1));
        }
        return page[offset];
    }

    // integrality is checked before bounds
    const T& get(std::string_view text)
    {
        return get(parse_index(text));
    }

    const T& operator[](index_t index)
    {
        return get(index);
    }

    void set(index_t, const T&)
    {
        throw unsupported_operation_exception("Setting values is not allowed.");
    }

    // rejected without looking at the index text
    void set(std::string_view, const T&)
    {
        throw unsupported_operation_exception("Setting values is not allowed.");
    }

    void remove(index_t)
    {
        throw unsupported_operation_exception("Unsetting values is not allowed.");
    }

    void remove(std::string_view)
    {
        throw unsupported_operation_exception("Unsetting values is not allowed.");
    }

    bool is_page_cached(page_number_t page_number) const
    {
        return cache_.exists(page_number);
    }

    std::size_t cached_page_count() const
    {
        return cache_.size();
    }

    std::vector<page_number_t> cached_pages() const
    {
        return cache_.page_numbers();
    }

    paged_cursor<T> iterate()
    {
        return paged_cursor<T>(*this);
    }

    iterator begin()
    {
        return iterator(this, 0);
    }

    iterator end()
    {
        return iterator(this, 0, true);
    }
};
