#pragma once

#include "mcp/ITransport.hpp"
#include <iostream>

namespace apiscope {

/**
 * @brief Newline-delimited JSON over a pair of streams
 *
 * Blank lines are skipped. Each written message is flushed immediately so
 * the client sees it without buffering delays.
 */
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace apiscope
