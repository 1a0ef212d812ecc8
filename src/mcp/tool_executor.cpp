#include <simplest_mcp/mcp/tool_executor.hpp>

#include <simplest_mcp/core/log.hpp>
#include <simplest_mcp/mcp/json_access.hpp>

#include <cmath>
#include <cstdint>

namespace simplest_mcp {

namespace {

constexpr const char* kComponent = "tools";

constexpr const char* kMalformedMessage =
    "Invalid params: Parameters for 'tools/call' are malformed.";
constexpr const char* kMissingOperandsMessage =
    "Invalid params: Parameters 'num1' and 'num2' are required.";
constexpr const char* kNonNumericMessage =
    "Invalid params: Parameters 'num1' and 'num2' must be numeric.";

// 2^53: every integer of smaller magnitude is exact in a double.
constexpr double kMaxExactInteger = 9007199254740992.0;

RpcError InvalidParams(const char* message) {
    return RpcError{ErrorCode::InvalidParams, message, std::nullopt};
}

} // anonymous namespace

Result<ToolCallParams, RpcError> DecodeToolCallParams(const nlohmann::json& params) {
    using R = Result<ToolCallParams, RpcError>;

    auto object = GetObject(params, "params");
    if (object.IsErr()) {
        return R::Err(InvalidParams(kMalformedMessage));
    }

    auto name = GetField(params, "name").AndThen([](const nlohmann::json* v) {
        return GetString(*v, "name");
    });
    if (name.IsErr()) {
        LogDebug(kComponent, "tools/call params: " + name.Error().Describe());
        return R::Err(InvalidParams(kMalformedMessage));
    }

    ToolCallParams decoded;
    decoded.name = std::move(name).Value();

    if (const auto* arguments = FindField(params, "arguments")) {
        if (arguments->is_object()) {
            decoded.arguments = *arguments;
        } else if (!arguments->is_null()) {
            LogDebug(kComponent, "tools/call params: arguments is not an object");
            return R::Err(InvalidParams(kMalformedMessage));
        }
    }
    if (const auto* meta = FindField(params, "_meta")) {
        decoded.meta = *meta;
    }
    return R::Ok(std::move(decoded));
}

Result<Operands, RpcError> ReadOperands(const nlohmann::json& arguments) {
    using R = Result<Operands, RpcError>;

    // Operand names are matched exactly, unlike envelope members.
    const auto* num1 = FindFieldExact(arguments, "num1");
    const auto* num2 = FindFieldExact(arguments, "num2");
    if (num1 == nullptr || num2 == nullptr) {
        return R::Err(InvalidParams(kMissingOperandsMessage));
    }

    auto first = GetNumber(*num1, "num1");
    auto second = GetNumber(*num2, "num2");
    if (first.IsErr() || second.IsErr()) {
        return R::Err(InvalidParams(kNonNumericMessage));
    }
    return R::Ok(Operands{first.Value(), second.Value()});
}

nlohmann::json NumberToJson(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    if (std::trunc(value) == value && std::fabs(value) < kMaxExactInteger &&
        !(value == 0.0 && std::signbit(value))) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

ToolExecutor::ToolExecutor(std::shared_ptr<const ToolRegistry> registry)
    : registry_(std::move(registry)) {}

ResponseEnvelope ToolExecutor::Execute(int request_id,
                                       const nlohmann::json& params) const {
    auto call = DecodeToolCallParams(params);
    if (call.IsErr()) {
        return ResponseEnvelope::Failure(request_id, call.Error());
    }

    auto operands = ReadOperands(call.Value().arguments);
    if (operands.IsErr()) {
        return ResponseEnvelope::Failure(request_id, operands.Error());
    }

    const auto& tool_name = call.Value().name;
    const auto* operation = registry_->Find(tool_name);
    if (operation == nullptr) {
        LogWarn(kComponent, "Unknown tool: " + tool_name);
        return MakeError(request_id, ErrorCode::MethodNotFound,
                         "Method not found: Tool '" + tool_name + "' not found.");
    }

    const auto& in = operands.Value();
    const double output = (*operation)(in.num1, in.num2);
    LogDebug(kComponent, tool_name + " -> " + NumberToJson(output).dump());
    return MakeResult(request_id, {{"output", NumberToJson(output)}});
}

} // namespace simplest_mcp
