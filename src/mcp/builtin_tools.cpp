#include <simplest_mcp/mcp/builtin_tools.hpp>

#include <stdexcept>

namespace simplest_mcp {

nlohmann::json BinaryOperandSchema(const std::string& num1_description,
                                   const std::string& num2_description) {
    return {
        {"type", "object"},
        {"properties", {
            {"num1", {{"type", "number"}, {"description", num1_description}}},
            {"num2", {{"type", "number"}, {"description", num2_description}}}
        }},
        {"required", nlohmann::json::array({"num1", "num2"})}
    };
}

void RegisterBuiltinTools(ToolRegistry& registry) {
    auto add = [&registry](const std::string& name,
                           const std::string& description,
                           const nlohmann::json& schema,
                           ToolOperation operation) {
        auto registered = registry.Register(name, description, schema,
                                            std::move(operation));
        if (registered.IsErr()) {
            throw std::logic_error(registered.Error());
        }
    };

    add(kSumTool, "Adds two numbers: num1 + num2.",
        BinaryOperandSchema("The first number", "The second number"),
        [](double num1, double num2) { return num1 + num2; });

    add(kSubtractTool, "Subtracts two numbers: num1 - num2.",
        BinaryOperandSchema("The minuend", "The subtrahend"),
        [](double num1, double num2) { return num1 - num2; });
}

std::shared_ptr<const ToolRegistry> MakeBuiltinRegistry() {
    auto registry = std::make_shared<ToolRegistry>();
    RegisterBuiltinTools(*registry);
    return registry;
}

} // namespace simplest_mcp
