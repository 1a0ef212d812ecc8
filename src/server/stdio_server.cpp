#include <simplest_mcp/server/stdio_server.hpp>

#include <simplest_mcp/core/log.hpp>

#include <string>

namespace simplest_mcp {

StdioServer::StdioServer(const McpHandler& handler,
                         std::istream& in,
                         std::ostream& out)
    : handler_(handler), in_(in), out_(out) {}

void StdioServer::Run() {
    LogInfo("stdio", "Serving JSON-RPC on stdin/stdout");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto reply = handler_.Process(line);
        out_ << reply.body << "\n";
        out_.flush();
    }
    LogInfo("stdio", "Input closed");
}

} // namespace simplest_mcp
