#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace niritaskbar {

    std::optional<std::string> optional_string(const nlohmann::json& value);
    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int64_t>     optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<uint64_t>    optional_id_field(const nlohmann::json& obj, const char* key);
    bool                       bool_field_or(const nlohmann::json& obj, const char* key, bool fallback);

}
