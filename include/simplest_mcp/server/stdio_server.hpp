#pragma once

#include <simplest_mcp/mcp/mcp_handler.hpp>

#include <iostream>

namespace simplest_mcp {

// ---------------------------------------------------------------------------
// StdioServer: line-delimited JSON-RPC: one request per input line, one
// response line per non-empty request line.
// ---------------------------------------------------------------------------
class StdioServer {
public:
    explicit StdioServer(const McpHandler& handler,
                         std::istream& in = std::cin,
                         std::ostream& out = std::cout);

    // Blocks until EOF on the input stream.
    void Run();

private:
    const McpHandler& handler_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace simplest_mcp
