#pragma once

#include <simplest_mcp/mcp/envelope.hpp>
#include <simplest_mcp/mcp/tool_executor.hpp>
#include <simplest_mcp/mcp/tool_registry.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

constexpr const char* kMcpProtocolVersion = "2025-06-18";
constexpr const char* kJsonContentType = "application/json";
constexpr int kHttpOk = 200;

struct ServerInfo {
    std::string name;
    std::string version;
};

// Identity announced by initialize: the project name and build version.
ServerInfo DefaultServerInfo();

// What the transport writes back for one request.
struct HttpReply {
    std::string content_type;
    int status = kHttpOk;
    std::string body;
};

// ---------------------------------------------------------------------------
// McpHandler: JSON-RPC 2.0 envelope processor for MCP.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call, execute (synonyms)
//
// Stateless per request; the registry is shared read-only, so one handler
// may serve any number of concurrent requests.
// ---------------------------------------------------------------------------
class McpHandler {
public:
    explicit McpHandler(std::shared_ptr<const ToolRegistry> registry,
                        ServerInfo info = DefaultServerInfo());

    // Raw body in, serialized envelope out. Always JSON and HTTP 200;
    // protocol failures are carried in the body.
    [[nodiscard]] HttpReply Process(std::string_view raw_body) const;

    // As Process, before serialization.
    [[nodiscard]] ResponseEnvelope Handle(std::string_view raw_body) const;

    // Route a decoded request by method name.
    [[nodiscard]] ResponseEnvelope Dispatch(const RequestEnvelope& request) const;

private:
    using MethodHandler =
        ResponseEnvelope (McpHandler::*)(const RequestEnvelope&) const;

    static const std::map<std::string, MethodHandler, std::less<>>& Methods();

    ResponseEnvelope HandleInitialize(const RequestEnvelope& request) const;
    ResponseEnvelope HandleToolsList(const RequestEnvelope& request) const;
    ResponseEnvelope HandleToolsCall(const RequestEnvelope& request) const;

    std::shared_ptr<const ToolRegistry> registry_;
    ToolExecutor executor_;
    ServerInfo info_;
};

} // namespace simplest_mcp
