#include "core/SourceFile.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace apiscope {

std::optional<std::string> read_source(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (begin < text.size()) {
        std::size_t newline = text.find('\n', begin);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(begin));
            break;
        }
        lines.emplace_back(text.substr(begin, newline - begin + 1));
        begin = newline + 1;
    }
    return lines;
}

std::vector<std::string> slice_lines(const std::vector<std::string>& lines,
                                     int start_line, int end_line) {
    if (start_line < 1) {
        start_line = 1;
    }
    int last = std::min<int>(end_line, static_cast<int>(lines.size()));
    if (start_line > last) {
        return {};
    }
    return std::vector<std::string>(lines.begin() + (start_line - 1), lines.begin() + last);
}

int line_of_offset(std::string_view text, std::size_t offset) {
    offset = std::min(offset, text.size());
    return 1 + static_cast<int>(std::count(text.begin(), text.begin() + offset, '\n'));
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        joined += line;
    }
    return joined;
}

}  // namespace apiscope
