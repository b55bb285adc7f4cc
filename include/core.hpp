#pragma once

#include <exception>
#include <stdexcept>
#include <cstdint>
#include <string>
#include <string_view>

using index_t = std::int64_t;
using page_number_t = std::uint64_t;

class paged_sequence_exception : public std::runtime_error
{
public:
    paged_sequence_exception(const std::string& message) : std::runtime_error(message)
    {
    }
};

// index supplied as something other than an integer
class invalid_index_exception : public paged_sequence_exception
{
public:
    invalid_index_exception(std::string_view text);
};

class index_out_of_bounds_exception : public paged_sequence_exception
{
    index_t index_;
public:
    index_out_of_bounds_exception(index_t index);
    // integer text too large for index_t; index is the clamped value
    index_out_of_bounds_exception(std::string_view text, index_t index);
    index_t get_index() const { return index_; }
};

// the sequence is read-only
class unsupported_operation_exception : public paged_sequence_exception
{
public:
    unsupported_operation_exception(const std::string& message) : paged_sequence_exception(message)
    {
    }
};

// a page source left a required accessor unimplemented
class not_implemented_exception : public paged_sequence_exception
{
public:
    not_implemented_exception(std::string_view accessor);
};

index_t parse_index(std::string_view text);
bool try_parse_index(std::string_view text, index_t& index);
