#include "mcp/StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace apiscope {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
}

json StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        spdlog::debug("<- {}", line);
        return json::parse(line);
    }

    if (!in_.eof()) {
        spdlog::error("Error reading from input stream");
    }
    return json();
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    out_ << serialized << '\n';
    out_.flush();
    spdlog::debug("-> {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace apiscope
