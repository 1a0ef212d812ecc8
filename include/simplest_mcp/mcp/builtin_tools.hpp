#pragma once

#include <simplest_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

constexpr const char* kSumTool = "Somar";
constexpr const char* kSubtractTool = "Subtrair";

// Input schema shared by the arithmetic tools: an object with the numeric
// properties num1 and num2, both required.
nlohmann::json BinaryOperandSchema(const std::string& num1_description,
                                   const std::string& num2_description);

// Register Somar (num1 + num2) and Subtrair (num1 - num2), in that order.
void RegisterBuiltinTools(ToolRegistry& registry);

// The server's fixed registry, built once and never mutated afterwards.
std::shared_ptr<const ToolRegistry> MakeBuiltinRegistry();

} // namespace simplest_mcp
