#pragma once

#include <memory>
#include <string>

#include "../include/core.hpp"
#include "../include/page_source.hpp"

struct driver_options
{
    index_t page_size = 100;
    index_t total_size = 1000;
    int fetch_delay_ms = 0;
    std::string log_level = "warn";
};

// throws paged_sequence_exception on an unknown option or a bad value
void parse_driver_options(int argc, char** argv, driver_options& options);

void print_driver_usage(const char* program);

// item at offset i is i + 1; every fetch bumps fetch_count and sleeps for
// fetch_delay_ms
std::unique_ptr<page_source<index_t>> make_synthetic_source(const driver_options& options,
    std::shared_ptr<index_t> fetch_count);
