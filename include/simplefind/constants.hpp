#pragma once
#include <cstddef>
#include <string_view>

constexpr static inline std::string_view NAME = "sf";
constexpr static inline std::string_view DESCRIPTION =
    "Search in-memory files for a regex pattern";
constexpr static inline std::string_view VERSION = "0.1.0";
constexpr static inline std::size_t TYPICAL_FILESYSTEM_BLOCK_SIZE = 4096;
constexpr static inline std::size_t BINARY_PROBE_SIZE =
    TYPICAL_FILESYSTEM_BLOCK_SIZE;
constexpr static inline std::string_view STDIN_PATH = "<stdin>";
