#pragma once

#include <simplest_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

constexpr const char* kJsonRpcVersion = "2.0";

// Request id used whenever the inbound id is unknown (empty body, syntax
// error, absent or unreadable id).
constexpr int kUnknownRequestId = -1;

// ---------------------------------------------------------------------------
// ErrorCode: JSON-RPC 2.0 reserved error codes.
// ---------------------------------------------------------------------------
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

// "Parse error", "Invalid Request", ...
[[nodiscard]] const char* ErrorCodeName(ErrorCode code);

struct RpcError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    std::optional<nlohmann::json> data;

    [[nodiscard]] int Code() const noexcept { return static_cast<int>(code); }
};

// ---------------------------------------------------------------------------
// RequestEnvelope: one decoded and validated JSON-RPC request.
// ---------------------------------------------------------------------------
struct RequestEnvelope {
    std::string jsonrpc = kJsonRpcVersion;
    int id = kUnknownRequestId;
    std::string method;
    nlohmann::json params;  // null when absent
};

// ---------------------------------------------------------------------------
// ResponseEnvelope: either a success (result) or an error, never both.
// ---------------------------------------------------------------------------
class ResponseEnvelope {
public:
    static ResponseEnvelope Success(int id, nlohmann::json result);
    static ResponseEnvelope Failure(int id, RpcError error);

    [[nodiscard]] int Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept { return body_.index() == 1; }
    [[nodiscard]] const nlohmann::json& Payload() const { return std::get<0>(body_); }
    [[nodiscard]] const RpcError& Error() const { return std::get<1>(body_); }

    // Compact JSON text with keys in the order jsonrpc, id, result|error.
    [[nodiscard]] std::string Serialize() const;

private:
    ResponseEnvelope(int id, std::variant<nlohmann::json, RpcError> body)
        : id_(id), body_(std::move(body)) {}

    int id_;
    std::variant<nlohmann::json, RpcError> body_;
};

ResponseEnvelope MakeResult(int id, nlohmann::json result);
ResponseEnvelope MakeError(int id, ErrorCode code, std::string message,
                           std::optional<nlohmann::json> data = std::nullopt);

// Decode a raw request body. On failure the error side already holds the
// error envelope to send back (parse error, invalid request or internal
// error, with the id fallback applied).
Result<RequestEnvelope, ResponseEnvelope> DecodeRequest(std::string_view body);

// Parse a serialized response envelope (client side of the wire format).
Result<ResponseEnvelope, std::string> ParseResponse(std::string_view text);

} // namespace simplest_mcp
