#pragma once

#include <vector>
#include <functional>
#include <utility>

#include "../include/core.hpp"

// Supplies a logically contiguous collection in fixed size pages.
// Every page but the last must hold exactly page_size() items, and
// page_size() must not change over the source's lifetime.
template <typename T>
class page_source
{
public:
    using page_t = std::vector<T>;

    virtual ~page_source() = default;

    virtual index_t page_size()
    {
        throw not_implemented_exception("page_size");
    }

    // may depend on a previous fetch_page call
    virtual index_t total_size()
    {
        return 0;
    }

    virtual page_t fetch_page(page_number_t)
    {
        throw not_implemented_exception("fetch_page");
    }
};

template <typename T>
class vector_page_source : public page_source<T>
{
    std::vector<std::vector<T>> pages_;
    index_t page_size_ = 0;
    index_t total_size_ = 0;

public:
    explicit vector_page_source(std::vector<std::vector<T>> pages)
        : vector_page_source(std::move(pages), 0)
    {
    }

    // page_size of 0 takes the size of the first page
    vector_page_source(std::vector<std::vector<T>> pages, index_t page_size)
        : pages_(std::move(pages)), page_size_(page_size)
    {
        if (page_size_ == 0 && !pages_.empty())
        {
            page_size_ = static_cast<index_t>(pages_.front().size());
        }
        for (const auto& page : pages_)
        {
            total_size_ += static_cast<index_t>(page.size());
        }
    }

    index_t page_size() override
    {
        return page_size_;
    }

    index_t total_size() override
    {
        return total_size_;
    }

    std::vector<T> fetch_page(page_number_t page_number) override
    {
        if (page_number >= pages_.size())
        {
            throw paged_sequence_exception("vector_page_source: no page " + std::to_string(page_number));
        }
        return pages_[page_number];
    }
};

template <typename T>
class function_page_source : public page_source<T>
{
public:
    using total_size_fn = std::function<index_t()>;
    using fetch_page_fn = std::function<std::vector<T>(page_number_t)>;

private:
    index_t page_size_;
    total_size_fn total_size_;
    fetch_page_fn fetch_page_;

public:
    function_page_source(index_t page_size, total_size_fn total_size, fetch_page_fn fetch_page)
        : page_size_(page_size), total_size_(std::move(total_size)), fetch_page_(std::move(fetch_page))
    {
    }

    index_t page_size() override
    {
        return page_size_;
    }

    index_t total_size() override
    {
        return total_size_ ? total_size_() : 0;
    }

    std::vector<T> fetch_page(page_number_t page_number) override
    {
        if (!fetch_page_)
        {
            throw not_implemented_exception("fetch_page");
        }
        return fetch_page_(page_number);
    }
};
