#include <simplest_mcp/mcp/tool_registry.hpp>

namespace simplest_mcp {

nlohmann::json ToolSchema::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

Result<void, std::string> ToolRegistry::Register(const std::string& name,
                                                 const std::string& description,
                                                 const nlohmann::json& input_schema,
                                                 ToolOperation operation) {
    if (name.empty()) {
        return Result<void, std::string>::Err("tool name must not be empty");
    }
    if (HasTool(name)) {
        return Result<void, std::string>::Err("tool already registered: " + name);
    }
    schemas_.push_back({name, description, input_schema});
    operations_[name] = std::move(operation);
    return Result<void, std::string>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return operations_.count(name) > 0;
}

const ToolOperation* ToolRegistry::Find(const std::string& name) const {
    auto it = operations_.find(name);
    return it != operations_.end() ? &it->second : nullptr;
}

} // namespace simplest_mcp
