#include <simplest_mcp/mcp/envelope.hpp>

#include <simplest_mcp/core/log.hpp>
#include <simplest_mcp/mcp/json_access.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace simplest_mcp {

namespace {

constexpr const char* kComponent = "envelope";

constexpr const char* kEmptyBodyMessage =
    "Parse error: Request body is empty.";
constexpr const char* kInvalidJsonMessage =
    "Parse error: Invalid JSON was received by the server.";
constexpr const char* kInvalidRequestMessage =
    "Invalid Request: Missing required JSON-RPC fields "
    "(jsonrpc:\"2.0\", id, method).";

bool IsBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

// Deepest container nesting accepted in a request or response document.
constexpr int kMaxNestingDepth = 64;

// Parse with a nesting limit. Returns false when the document nests deeper
// than kMaxNestingDepth; syntax errors still throw parse_error.
bool ParseBounded(std::string_view text, nlohmann::json& doc) {
    bool too_deep = false;
    nlohmann::json::parser_callback_t limit =
        [&too_deep](int depth, nlohmann::json::parse_event_t event,
                    nlohmann::json& /*parsed*/) {
            if (event == nlohmann::json::parse_event_t::object_start ||
                event == nlohmann::json::parse_event_t::array_start) {
                if (depth >= kMaxNestingDepth) {
                    too_deep = true;
                }
            }
            return !too_deep;
        };
    doc = nlohmann::json::parse(text.begin(), text.end(), limit);
    if (too_deep) {
        doc = nullptr;
        return false;
    }
    return true;
}

// Top-level request members as found in the document, before the protocol
// rules are applied. Absent and null members are both nullopt.
struct RawRequest {
    std::optional<std::string> jsonrpc;
    std::optional<int> id;
    std::optional<std::string> method;
    nlohmann::json params;
};

Result<std::optional<std::string>, AccessError> ReadOptionalString(
    const nlohmann::json& doc, std::string_view name) {
    using R = Result<std::optional<std::string>, AccessError>;
    const auto* value = FindField(doc, name);
    if (value == nullptr || value->is_null()) {
        return R::Ok(std::nullopt);
    }
    auto text = GetString(*value, name);
    if (text.IsErr()) {
        return R::Err(text.Error());
    }
    return R::Ok(std::move(text).Value());
}

Result<std::optional<int>, AccessError> ReadId(const nlohmann::json& doc) {
    using R = Result<std::optional<int>, AccessError>;
    const auto* value = FindField(doc, "id");
    if (value == nullptr) {
        return R::Ok(std::nullopt);
    }
    auto number = GetInteger(*value, "id");
    if (number.IsErr()) {
        return R::Err(number.Error());
    }
    const auto id = number.Value();
    if (id < std::numeric_limits<int>::min() ||
        id > std::numeric_limits<int>::max()) {
        return R::Err(AccessError{AccessFailure::WrongType, "id",
                                  "a 32-bit integer"});
    }
    return R::Ok(static_cast<int>(id));
}

Result<RawRequest, AccessError> ReadRawRequest(const nlohmann::json& doc) {
    using R = Result<RawRequest, AccessError>;
    RawRequest raw;

    auto jsonrpc = ReadOptionalString(doc, "jsonrpc");
    if (jsonrpc.IsErr()) return R::Err(jsonrpc.Error());
    raw.jsonrpc = std::move(jsonrpc).Value();

    auto id = ReadId(doc);
    if (id.IsErr()) return R::Err(id.Error());
    raw.id = id.Value();

    auto method = ReadOptionalString(doc, "method");
    if (method.IsErr()) return R::Err(method.Error());
    raw.method = std::move(method).Value();

    if (const auto* params = FindField(doc, "params")) {
        raw.params = *params;
    }
    return R::Ok(std::move(raw));
}

ErrorCode ToErrorCode(std::int64_t code) {
    return static_cast<ErrorCode>(static_cast<int>(code));
}

} // anonymous namespace

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError:     return "Parse error";
        case ErrorCode::InvalidRequest: return "Invalid Request";
        case ErrorCode::MethodNotFound: return "Method not found";
        case ErrorCode::InvalidParams:  return "Invalid params";
        case ErrorCode::InternalError:  return "Internal error";
    }
    return "Server error";
}

// ---------------------------------------------------------------------------
// ResponseEnvelope
// ---------------------------------------------------------------------------
ResponseEnvelope ResponseEnvelope::Success(int id, nlohmann::json result) {
    return ResponseEnvelope(
        id, std::variant<nlohmann::json, RpcError>(std::in_place_index<0>,
                                                   std::move(result)));
}

ResponseEnvelope ResponseEnvelope::Failure(int id, RpcError error) {
    return ResponseEnvelope(
        id, std::variant<nlohmann::json, RpcError>(std::in_place_index<1>,
                                                   std::move(error)));
}

std::string ResponseEnvelope::Serialize() const {
    nlohmann::ordered_json envelope;
    envelope["jsonrpc"] = kJsonRpcVersion;
    envelope["id"] = id_;
    if (IsError()) {
        const auto& error = Error();
        nlohmann::ordered_json detail;
        detail["code"] = error.Code();
        detail["message"] = error.message;
        if (error.data.has_value()) {
            detail["data"] = nlohmann::ordered_json(*error.data);
        }
        envelope["error"] = std::move(detail);
    } else {
        envelope["result"] = nlohmann::ordered_json(Payload());
    }
    return envelope.dump(-1, ' ', false,
                         nlohmann::ordered_json::error_handler_t::replace);
}

ResponseEnvelope MakeResult(int id, nlohmann::json result) {
    return ResponseEnvelope::Success(id, std::move(result));
}

ResponseEnvelope MakeError(int id, ErrorCode code, std::string message,
                           std::optional<nlohmann::json> data) {
    return ResponseEnvelope::Failure(
        id, RpcError{code, std::move(message), std::move(data)});
}

// ---------------------------------------------------------------------------
// DecodeRequest
// ---------------------------------------------------------------------------
Result<RequestEnvelope, ResponseEnvelope> DecodeRequest(std::string_view body) {
    using R = Result<RequestEnvelope, ResponseEnvelope>;

    if (IsBlank(body)) {
        LogWarn(kComponent, "Rejected empty request body");
        return R::Err(MakeError(kUnknownRequestId, ErrorCode::ParseError,
                                kEmptyBodyMessage));
    }

    int id = kUnknownRequestId;
    try {
        nlohmann::json doc;
        if (!ParseBounded(body, doc)) {
            LogWarn(kComponent, "Request nests deeper than " +
                                    std::to_string(kMaxNestingDepth) + " levels");
            return R::Err(MakeError(kUnknownRequestId, ErrorCode::ParseError,
                                    kInvalidJsonMessage));
        }

        // A literal null never materializes into a request object.
        if (doc.is_null()) {
            LogWarn(kComponent, "Request body is JSON null");
            return R::Err(MakeError(kUnknownRequestId,
                                    ErrorCode::InvalidRequest,
                                    kInvalidRequestMessage));
        }
        if (!doc.is_object()) {
            LogWarn(kComponent, "Request body is not a JSON object");
            return R::Err(MakeError(kUnknownRequestId, ErrorCode::ParseError,
                                    kInvalidJsonMessage));
        }

        auto raw = ReadRawRequest(doc);
        if (raw.IsErr()) {
            LogWarn(kComponent, "Malformed request: " + raw.Error().Describe());
            return R::Err(MakeError(kUnknownRequestId, ErrorCode::ParseError,
                                    kInvalidJsonMessage));
        }
        auto fields = std::move(raw).Value();
        id = fields.id.value_or(kUnknownRequestId);

        if (!fields.id.has_value() ||
            fields.jsonrpc.value_or("") != kJsonRpcVersion ||
            IsBlank(fields.method.value_or(""))) {
            LogWarn(kComponent, "Invalid request envelope");
            return R::Err(MakeError(id, ErrorCode::InvalidRequest,
                                    kInvalidRequestMessage));
        }

        RequestEnvelope request;
        request.jsonrpc = std::move(*fields.jsonrpc);
        request.id = id;
        request.method = std::move(*fields.method);
        request.params = std::move(fields.params);
        return R::Ok(std::move(request));
    } catch (const nlohmann::json::parse_error& e) {
        LogWarn(kComponent, std::string("JSON parse failed: ") + e.what());
        return R::Err(MakeError(kUnknownRequestId, ErrorCode::ParseError,
                                kInvalidJsonMessage));
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Unexpected decode failure: ") + e.what());
        return R::Err(MakeError(id, ErrorCode::InternalError,
                                std::string("Internal error: ") + e.what()));
    }
}

// ---------------------------------------------------------------------------
// ParseResponse
// ---------------------------------------------------------------------------
Result<ResponseEnvelope, std::string> ParseResponse(std::string_view text) {
    using R = Result<ResponseEnvelope, std::string>;

    nlohmann::json doc;
    try {
        if (!ParseBounded(text, doc)) {
            return R::Err("response nests deeper than " +
                          std::to_string(kMaxNestingDepth) + " levels");
        }
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(std::string("invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return R::Err("response is not a JSON object");
    }

    const auto* version = FindFieldExact(doc, "jsonrpc");
    if (version == nullptr || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return R::Err("response lacks jsonrpc \"2.0\"");
    }

    const auto* id_field = FindFieldExact(doc, "id");
    if (id_field == nullptr) {
        return R::Err("response lacks an id");
    }
    auto id = GetInteger(*id_field, "id");
    if (id.IsErr()) {
        return R::Err(id.Error().Describe());
    }

    const auto* result = FindFieldExact(doc, "result");
    const auto* error = FindFieldExact(doc, "error");
    if ((result == nullptr) == (error == nullptr)) {
        return R::Err("response must carry exactly one of result or error");
    }
    if (result != nullptr) {
        return R::Ok(MakeResult(static_cast<int>(id.Value()), *result));
    }

    auto code = GetField(*error, "code").AndThen([](const nlohmann::json* v) {
        return GetInteger(*v, "code");
    });
    if (code.IsErr()) {
        return R::Err(code.Error().Describe());
    }
    auto message = GetField(*error, "message").AndThen([](const nlohmann::json* v) {
        return GetString(*v, "message");
    });
    if (message.IsErr()) {
        return R::Err(message.Error().Describe());
    }

    std::optional<nlohmann::json> data;
    if (const auto* d = FindFieldExact(*error, "data")) {
        data = *d;
    }
    return R::Ok(MakeError(static_cast<int>(id.Value()),
                           ToErrorCode(code.Value()),
                           std::move(message).Value(), std::move(data)));
}

} // namespace simplest_mcp
