#pragma once

#include <map>
#include <vector>
#include <cstddef>
#include <utility>

#include "../include/core.hpp"

// Pages keyed by page number. Entries are never evicted or replaced, so
// references returned by get_page stay valid for the life of the cache.
template <typename T>
class page_cache
{
    std::map<page_number_t, std::vector<T>> pages_;

public:
    page_cache() = default;
    page_cache(const page_cache&) = delete;
    page_cache& operator=(const page_cache&) = delete;

    // fetch is only called on a miss; if it throws nothing is stored
    template <typename Fetch>
    const std::vector<T>& get_page(page_number_t page_number, Fetch&& fetch)
    {
        auto it = pages_.find(page_number);
        if (it == pages_.end())
        {
            std::vector<T> page = fetch(page_number);
            it = pages_.try_emplace(page_number, std::move(page)).first;
        }
        return it->second;
    }

    bool exists(page_number_t page_number) const
    {
        return pages_.find(page_number) != pages_.end();
    }

    std::size_t size() const
    {
        return pages_.size();
    }

    std::vector<page_number_t> page_numbers() const
    {
        std::vector<page_number_t> result;
        result.reserve(pages_.size());
        for (const auto& entry : pages_)
        {
            result.push_back(entry.first);
        }
        return result;
    }
};
