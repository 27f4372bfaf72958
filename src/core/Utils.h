#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secret_guard {
namespace utils {

// Reads at most max_bytes from path. std::nullopt when the file cannot be opened or read.
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = SIZE_MAX);

std::string trim(const std::string& s);

// Splits on '\n'; a trailing newline does not produce an extra empty element.
// A '\r' left at the end of a piece is dropped.
std::vector<std::string> split_lines(const std::string& content);

std::vector<std::string> split_csv(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, size_t end, const std::string& suffix);

// Length of the well-formed UTF-8 sequence starting at data[pos], or 0 if it is not one.
// Overlong forms, surrogates and code points above U+10FFFF are not well formed.
size_t utf8_sequence_length(const std::string& data, size_t pos);
bool is_valid_utf8(const std::string& data);

} // namespace utils
} // namespace secret_guard
