#include <getopt.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

#include "../include/driver_options.hpp"
#include "../include/logging.hpp"

namespace
{
    index_t parse_non_negative(const char* value_text, const char* option_name)
    {
        index_t value = 0;
        if (value_text == nullptr || !try_parse_index(value_text, value) || value < 0)
        {
            throw paged_sequence_exception("Could not parse option --" + std::string(option_name) + "="
                + std::string(value_text ? value_text : "") + " (non-negative integer expected)");
        }
        return value;
    }
}

void parse_driver_options(int argc, char** argv, driver_options& options)
{
    const int OPT_PAGE_SIZE = 1;
    const int OPT_TOTAL_SIZE = 2;
    const int OPT_FETCH_DELAY_MS = 3;
    const int OPT_LOG_LEVEL = 4;
    static struct option long_options[] = {
        {"page_size",      required_argument, nullptr, OPT_PAGE_SIZE},
        {"total_size",     required_argument, nullptr, OPT_TOTAL_SIZE},
        {"fetch_delay_ms", required_argument, nullptr, OPT_FETCH_DELAY_MS},
        {"log_level",      required_argument, nullptr, OPT_LOG_LEVEL},
        {0, 0, 0, 0}
    };

    optind = 1;
    while (true)
    {
        int option_index = 0;
        int c = getopt_long(argc, argv, "", long_options, &option_index);
        if (c == -1)
        {
            break;
        }

        switch (c)
        {
        case OPT_PAGE_SIZE:
            options.page_size = parse_non_negative(optarg, "page_size");
            if (options.page_size == 0)
            {
                throw paged_sequence_exception("--page_size must be positive");
            }
            break;
        case OPT_TOTAL_SIZE:
            options.total_size = parse_non_negative(optarg, "total_size");
            break;
        case OPT_FETCH_DELAY_MS:
        {
            auto delay = parse_non_negative(optarg, "fetch_delay_ms");
            if (delay > std::numeric_limits<int>::max())
            {
                throw paged_sequence_exception("--fetch_delay_ms must not exceed "
                    + std::to_string(std::numeric_limits<int>::max()));
            }
            options.fetch_delay_ms = static_cast<int>(delay);
            break;
        }
        case OPT_LOG_LEVEL:
            options.log_level = optarg;
            break;
        default:
            throw paged_sequence_exception("unknown option");
        }
    }

    set_log_level(options.log_level);
}

void print_driver_usage(const char* program)
{
    std::cerr << "usage: " << program
        << " [--page_size=N] [--total_size=N] [--fetch_delay_ms=N]"
        << " [--log_level=trace|debug|info|warn|error|off]" << std::endl;
}

std::unique_ptr<page_source<index_t>> make_synthetic_source(const driver_options& options,
    std::shared_ptr<index_t> fetch_count)
{
    auto page_size = options.page_size;
    auto total_size = options.total_size;
    auto delay = std::chrono::milliseconds(options.fetch_delay_ms);

    return std::make_unique<function_page_source<index_t>>(
        page_size,
        [total_size]() { return total_size; },
        [page_size, total_size, delay, fetch_count](page_number_t page_number)
        {
            ++*fetch_count;
            if (delay.count() > 0)
            {
                std::this_thread::sleep_for(delay);
            }

            index_t first = static_cast<index_t>(page_number) * page_size;
            index_t last = std::min(first + page_size, total_size);

            std::vector<index_t> page;
            for (index_t i = first; i < last; i++)
            {
                page.push_back(i + 1);
            }
            return page;
        });
}
