#include "niritaskbar/json_utils.hpp"

namespace niritaskbar {

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (!value.is_string()) {
            return std::nullopt;
        }
        return value.get<std::string>();
    }

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        return optional_string(obj.at(key));
    }

    std::optional<int64_t> optional_int_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        const auto& value = obj.at(key);
        if (!value.is_number_integer()) {
            return std::nullopt;
        }
        return value.get<int64_t>();
    }

    std::optional<uint64_t> optional_id_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        const auto& value = obj.at(key);
        if (!value.is_number_unsigned()) {
            return std::nullopt;
        }
        return value.get<uint64_t>();
    }

    bool bool_field_or(const nlohmann::json& obj, const char* key, bool fallback) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_boolean()) {
            return fallback;
        }
        return obj.at(key).get<bool>();
    }

}
