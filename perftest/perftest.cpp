#include <chrono>
#include <iostream>
#include <random>

#include "../include/driver_options.hpp"
#include "../include/paged_sequence.hpp"

int main(int argc, char** argv)
{
    driver_options options;
    options.page_size = 1000;
    options.total_size = 1000000;

    try
    {
        parse_driver_options(argc, argv, options);

        auto fetch_count = std::make_shared<index_t>(0);
        auto source = make_synthetic_source(options, fetch_count);
        paged_sequence<index_t> sequence{ *source };

        for (int pass = 1; pass <= 2; pass++)
        {
            auto start = std::chrono::steady_clock::now();
            index_t sum = 0;
            for (const auto& item : sequence)
            {
                sum += item;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

            std::cout << "pass " << pass << ": sum " << sum << ", " << elapsed.count() << " ms, fetches "
                << *fetch_count << std::endl;
        }

        if (sequence.length() > 0)
        {
            std::mt19937_64 random{ 42 };
            std::uniform_int_distribution<index_t> distribution(0, sequence.length() - 1);

            auto start = std::chrono::steady_clock::now();
            index_t sum = 0;
            for (int i = 0; i < 1000000; i++)
            {
                sum += sequence[distribution(random)];
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

            std::cout << "random reads: sum " << sum << ", " << elapsed.count() << " ms, fetches "
                << *fetch_count << " for " << sequence.page_count() << " pages" << std::endl;
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
