#pragma once

#include <simplest_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace simplest_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: what tools/list announces for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool computes one number from the two validated operands.
using ToolOperation = std::function<double(double num1, double num2)>;

// ---------------------------------------------------------------------------
// ToolRegistry: named tools in registration order. Filled once at start-up
// and then shared read-only (std::shared_ptr<const ToolRegistry>), so lookups
// need no locking.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails when a tool of the same name is already registered.
    Result<void, std::string> Register(const std::string& name,
                                       const std::string& description,
                                       const nlohmann::json& input_schema,
                                       ToolOperation operation);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // nullptr when no tool has this name.
    [[nodiscard]] const ToolOperation* Find(const std::string& name) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolOperation> operations_;
};

} // namespace simplest_mcp
