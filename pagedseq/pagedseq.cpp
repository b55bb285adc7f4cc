#include <iostream>
#include <sstream>
#include <string>

#include "../include/driver_options.hpp"
#include "../include/paged_sequence.hpp"

void write_pages(paged_sequence<index_t>& sequence, const index_t& fetch_count)
{
    std::cout << "page size " << sequence.page_size()
        << ", pages " << sequence.page_count()
        << ", cached " << sequence.cached_page_count()
        << ", fetches " << fetch_count << std::endl;

    for (auto page_number : sequence.cached_pages())
    {
        std::cout << "   [" << page_number << "] cached" << std::endl;
    }
}

void run_command(const std::string& command, std::stringstream& ss,
    paged_sequence<index_t>& sequence, paged_cursor<index_t>& cursor, const index_t& fetch_count)
{
    if (command == "len" || command == "length")
    {
        std::cout << sequence.length() << std::endl;
    }
    else if (command == "get")
    {
        std::string index;
        ss >> index;
        std::cout << sequence.get(index) << std::endl;
    }
    else if (command == "has" || command == "contains")
    {
        std::string index;
        ss >> index;
        std::cout << (sequence.contains(index) ? "true" : "false") << std::endl;
    }
    else if (command == "set")
    {
        std::string index;
        index_t value = 0;
        ss >> index >> value;
        sequence.set(std::string_view(index), value);
    }
    else if (command == "del" || command == "delete")
    {
        std::string index;
        ss >> index;
        sequence.remove(std::string_view(index));
    }
    else if (command == "nxt" || command == "next")
    {
        auto item = cursor.next();
        if (item)
        {
            std::cout << cursor.position() - 1 << ": " << *item << std::endl;
        }
        else
        {
            std::cout << "end of sequence" << std::endl;
        }
    }
    else if (command == "rst" || command == "reset")
    {
        cursor.reset();
    }
    else if (command == "lst" || command == "list")
    {
        for (const auto& item : sequence)
        {
            std::cout << item << " ";
        }
        std::cout << std::endl;
    }
    else if (command == "pgs" || command == "pages")
    {
        write_pages(sequence, fetch_count);
    }
    else if (command == "hlp" || command == "help")
    {
        std::cout << "len | get <i> | has <i> | set <i> <v> | del <i> | next | reset | list | pages | exit"
            << std::endl;
    }
    else
    {
        std::cerr << "unrecognised command: " << command << std::endl;
    }
}

int main(int argc, char** argv)
{
    driver_options options;
    try
    {
        parse_driver_options(argc, argv, options);
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        print_driver_usage(argv[0]);
        return 1;
    }

    auto fetch_count = std::make_shared<index_t>(0);
    auto source = make_synthetic_source(options, fetch_count);
    paged_sequence<index_t> sequence{ *source };
    auto cursor = sequence.iterate();

    for (;;)
    {
        std::string line;
        std::cout << "pagedseq> " << std::flush;
        if (!std::getline(std::cin, line))
        {
            break;
        }

        std::stringstream ss(line);
        std::string command;
        ss >> command;
        if (command.empty())
        {
            continue;
        }
        if (command == "xit" || command == "exit" || command == "quit")
        {
            break;
        }

        try
        {
            run_command(command, ss, sequence, cursor, *fetch_count);
        }
        catch (const std::exception& ex)
        {
            std::cerr << ex.what() << std::endl;
        }
    }
    std::cout << "bye" << std::endl;
    return 0;
}
