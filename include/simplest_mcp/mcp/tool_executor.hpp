#pragma once

#include <simplest_mcp/core/result.hpp>
#include <simplest_mcp/mcp/envelope.hpp>
#include <simplest_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

// ---------------------------------------------------------------------------
// ToolCallParams: the params object of tools/call and execute.
// ---------------------------------------------------------------------------
struct ToolCallParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    std::optional<nlohmann::json> meta;  // "_meta", not used by execution
};

struct Operands {
    double num1 = 0.0;
    double num2 = 0.0;
};

// Decode params. Errors are InvalidParams.
Result<ToolCallParams, RpcError> DecodeToolCallParams(const nlohmann::json& params);

// Read num1/num2 from the argument bag. Presence is checked before type.
Result<Operands, RpcError> ReadOperands(const nlohmann::json& arguments);

// JSON spelling of a tool output: integral values below 2^53 become JSON
// integers, other finite values doubles, NaN and infinities null.
nlohmann::json NumberToJson(double value);

// ---------------------------------------------------------------------------
// ToolExecutor: runs one tool call against the registry and wraps the
// outcome in a response envelope.
// ---------------------------------------------------------------------------
class ToolExecutor {
public:
    explicit ToolExecutor(std::shared_ptr<const ToolRegistry> registry);

    [[nodiscard]] ResponseEnvelope Execute(int request_id,
                                           const nlohmann::json& params) const;

private:
    std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace simplest_mcp
