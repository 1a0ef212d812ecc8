#include <simplest_mcp/mcp/json_access.hpp>

#include <cctype>
#include <limits>

namespace simplest_mcp {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

AccessError WrongType(std::string_view field, const char* expected) {
    return AccessError{AccessFailure::WrongType, std::string(field), expected};
}

} // anonymous namespace

std::string AccessError::Describe() const {
    if (kind == AccessFailure::Missing) {
        return "missing field '" + field + "'";
    }
    return "field '" + field + "' must be " + expected;
}

const nlohmann::json* FindFieldExact(const nlohmann::json& object,
                                     std::string_view name) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(std::string(name));
    return it != object.end() ? &*it : nullptr;
}

const nlohmann::json* FindField(const nlohmann::json& object,
                                std::string_view name) {
    if (const auto* exact = FindFieldExact(object, name)) {
        return exact;
    }
    if (!object.is_object()) return nullptr;
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (EqualsIgnoreCase(it.key(), name)) {
            return &it.value();
        }
    }
    return nullptr;
}

Result<const nlohmann::json*, AccessError> GetField(const nlohmann::json& object,
                                                    std::string_view name) {
    using R = Result<const nlohmann::json*, AccessError>;
    if (!object.is_object()) {
        return R::Err(WrongType(name, "a member of an object"));
    }
    const auto* value = FindField(object, name);
    if (value == nullptr) {
        return R::Err(AccessError{AccessFailure::Missing, std::string(name), ""});
    }
    return R::Ok(value);
}

Result<const nlohmann::json*, AccessError> GetObject(const nlohmann::json& value,
                                                     std::string_view field) {
    using R = Result<const nlohmann::json*, AccessError>;
    if (!value.is_object()) {
        return R::Err(WrongType(field, "an object"));
    }
    return R::Ok(&value);
}

Result<double, AccessError> GetNumber(const nlohmann::json& value,
                                      std::string_view field) {
    if (!value.is_number()) {
        return Result<double, AccessError>::Err(WrongType(field, "a number"));
    }
    return Result<double, AccessError>::Ok(value.get<double>());
}

Result<std::string, AccessError> GetString(const nlohmann::json& value,
                                           std::string_view field) {
    if (!value.is_string()) {
        return Result<std::string, AccessError>::Err(WrongType(field, "a string"));
    }
    return Result<std::string, AccessError>::Ok(value.get<std::string>());
}

Result<std::int64_t, AccessError> GetInteger(const nlohmann::json& value,
                                             std::string_view field) {
    using R = Result<std::int64_t, AccessError>;
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return R::Err(WrongType(field, "an integer"));
        }
        return R::Ok(static_cast<std::int64_t>(raw));
    }
    if (value.is_number_integer()) {
        return R::Ok(value.get<std::int64_t>());
    }
    return R::Err(WrongType(field, "an integer"));
}

} // namespace simplest_mcp
