#pragma once

#include <bbrunner/concat_tostr.hh>
#include <bbrunner/macros/stringify.hh>
#include <stdexcept>

// Includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
