#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <simplefind/file_input.hpp>
#include <string>
#include <string_view>

bool is_elf_header(std::string_view buffer);

bool is_archive_header(std::string_view buffer);

bool has_null_bytes(std::string_view buffer);

/// Checks the first block of `content` for NUL bytes and executable or
/// archive magic numbers
bool is_binary(std::string_view content);

/// Reads a whole file into memory. Unreadable files are reported on stderr
/// and yield std::nullopt.
std::optional<file_input> load_file(const std::string &path);

file_input load_stream(std::istream &stream, std::string path);
