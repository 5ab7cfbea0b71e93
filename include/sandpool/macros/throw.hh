#pragma once

#include <sandpool/concat_tostr.hh>
#include <stdexcept>

#define SANDPOOL_STRINGIFY_IMPL(x) #x
#define SANDPOOL_STRINGIFY(x) SANDPOOL_STRINGIFY_IMPL(x)

// Throws std::runtime_error with the concatenated arguments and the throw site appended
#define THROW(...)                                                                          \
    throw std::runtime_error(concat_tostr(                                                  \
        __VA_ARGS__, " (thrown at " __FILE__ ":" SANDPOOL_STRINGIFY(__LINE__) ")"           \
    ))

// Like THROW() but throws the exception type @p exception_type
#define THROW_AS(exception_type, ...)                                                       \
    throw exception_type(concat_tostr(                                                      \
        __VA_ARGS__, " (thrown at " __FILE__ ":" SANDPOOL_STRINGIFY(__LINE__) ")"           \
    ))
