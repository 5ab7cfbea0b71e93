#pragma once

#include <cstddef>
#include <string_view>

// Writes until @p len bytes are written or an error occurs. Returns the number of bytes written,
// errno is set upon error. Does not raise SIGPIPE when writing to a socket.
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Throws upon error
void write_exact(int fd, const void* buf, size_t len);
