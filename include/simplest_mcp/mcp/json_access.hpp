#pragma once

#include <simplest_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

// ---------------------------------------------------------------------------
// Typed, fallible access to dynamic JSON values. Every accessor reports a
// missing member or a type mismatch as an AccessError instead of throwing.
// ---------------------------------------------------------------------------

enum class AccessFailure {
    Missing,
    WrongType,
};

struct AccessError {
    AccessFailure kind = AccessFailure::Missing;
    std::string field;
    std::string expected;  // JSON type name that was required

    [[nodiscard]] std::string Describe() const;
};

// Look up a member of a JSON object. An exact key match wins; otherwise the
// first key that matches ignoring ASCII case is returned. Returns nullptr
// when `object` is not an object or has no such member.
[[nodiscard]] const nlohmann::json* FindField(const nlohmann::json& object,
                                              std::string_view name);

// As FindField, but keys must match exactly.
[[nodiscard]] const nlohmann::json* FindFieldExact(const nlohmann::json& object,
                                                   std::string_view name);

Result<const nlohmann::json*, AccessError> GetField(const nlohmann::json& object,
                                                    std::string_view name);

// The accessors below check the type of an already located value; `field`
// only labels the error.
Result<const nlohmann::json*, AccessError> GetObject(const nlohmann::json& value,
                                                     std::string_view field);
Result<double, AccessError> GetNumber(const nlohmann::json& value,
                                      std::string_view field);
Result<std::string, AccessError> GetString(const nlohmann::json& value,
                                           std::string_view field);
// Integral JSON numbers only; 1.0 is rejected.
Result<std::int64_t, AccessError> GetInteger(const nlohmann::json& value,
                                             std::string_view field);

} // namespace simplest_mcp
