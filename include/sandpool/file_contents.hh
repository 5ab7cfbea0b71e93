#pragma once

#include <string>
#include <string_view>

// Reads the whole file, throws upon error
std::string get_file_contents(const char* path);

// Reads the whole file from the current offset of @p fd, throws upon error
std::string get_file_contents(int fd);

// Like get_file_contents(const char*) but relative to @p dirfd
std::string get_file_contents_at(int dirfd, const char* path);

// Opens an existing file for writing (no O_CREAT) and writes @p data, throws upon error
void write_file_at(int dirfd, const char* path, std::string_view data);
