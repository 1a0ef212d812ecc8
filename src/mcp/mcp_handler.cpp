#include <simplest_mcp/mcp/mcp_handler.hpp>

#include <simplest_mcp/core/log.hpp>
#include <simplest_mcp/core/version.hpp>

namespace simplest_mcp {

namespace {

constexpr const char* kComponent = "mcp";

} // anonymous namespace

ServerInfo DefaultServerInfo() {
    return ServerInfo{kServerName, kVersion};
}

McpHandler::McpHandler(std::shared_ptr<const ToolRegistry> registry,
                       ServerInfo info)
    : registry_(std::move(registry)),
      executor_(registry_),
      info_(std::move(info)) {}

const std::map<std::string, McpHandler::MethodHandler, std::less<>>&
McpHandler::Methods() {
    static const std::map<std::string, MethodHandler, std::less<>> methods = {
        {"initialize", &McpHandler::HandleInitialize},
        {"tools/list", &McpHandler::HandleToolsList},
        {"tools/call", &McpHandler::HandleToolsCall},
        {"execute", &McpHandler::HandleToolsCall},
    };
    return methods;
}

HttpReply McpHandler::Process(std::string_view raw_body) const {
    auto envelope = Handle(raw_body);
    return HttpReply{kJsonContentType, kHttpOk, envelope.Serialize()};
}

ResponseEnvelope McpHandler::Handle(std::string_view raw_body) const {
    auto request = DecodeRequest(raw_body);
    if (request.IsErr()) {
        return std::move(request).Error();
    }
    return Dispatch(request.Value());
}

ResponseEnvelope McpHandler::Dispatch(const RequestEnvelope& request) const {
    const auto& methods = Methods();
    auto it = methods.find(request.method);
    if (it == methods.end()) {
        LogWarn(kComponent, "Method not found: " + request.method);
        return MakeError(request.id, ErrorCode::MethodNotFound,
                         "Method not found: " + request.method);
    }

    LogDebug(kComponent, request.method + " (id " +
                             std::to_string(request.id) + ")");
    auto response = (this->*(it->second))(request);
    if (response.IsError()) {
        LogWarn(kComponent, request.method + " failed: " +
                                response.Error().message);
    }
    return response;
}

ResponseEnvelope McpHandler::HandleInitialize(const RequestEnvelope& request) const {
    nlohmann::json result;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["protocolVersion"] = kMcpProtocolVersion;
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    return MakeResult(request.id, std::move(result));
}

ResponseEnvelope McpHandler::HandleToolsList(const RequestEnvelope& request) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_->Tools()) {
        tools.push_back(schema.ToJson());
    }
    return MakeResult(request.id, {{"tools", std::move(tools)}});
}

ResponseEnvelope McpHandler::HandleToolsCall(const RequestEnvelope& request) const {
    return executor_.Execute(request.id, request.params);
}

} // namespace simplest_mcp
