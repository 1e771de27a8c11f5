#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apiscope {

/**
 * @brief Read a whole file into memory
 * @return File contents, or nullopt if the file cannot be opened
 */
std::optional<std::string> read_source(const std::filesystem::path& filepath);

/**
 * @brief Split text into lines, keeping each line's trailing newline
 */
std::vector<std::string> split_lines(std::string_view text);

/**
 * @brief Copy the 1-based inclusive line range [start_line, end_line]
 *
 * Out-of-range bounds are clamped; an empty result means nothing overlapped.
 */
std::vector<std::string> slice_lines(const std::vector<std::string>& lines,
                                     int start_line, int end_line);

/**
 * @brief 1-based line number of a byte offset
 */
int line_of_offset(std::string_view text, std::size_t offset);

std::string join_lines(const std::vector<std::string>& lines);

}  // namespace apiscope
