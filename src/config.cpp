#include "niritaskbar/config.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <nlohmann/json.hpp>

#include <QString>

#include "niritaskbar/strings.hpp"

namespace niritaskbar {

    namespace {

        ConfigResult<bool> read_bool(const nlohmann::json& obj, const char* key, bool fallback, std::string_view context) {
            if (!obj.contains(key)) {
                return fallback;
            }
            const auto& value = obj.at(key);
            if (!value.is_boolean()) {
                return std::unexpected(ConfigErrorInfo{std::string(context), std::string(key) + " must be a boolean"});
            }
            return value.get<bool>();
        }

        ConfigResult<std::chrono::seconds> read_seconds(const nlohmann::json& obj, const char* key, std::chrono::seconds fallback) {
            if (!obj.contains(key)) {
                return fallback;
            }
            const auto& value = obj.at(key);
            if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
                return std::unexpected(ConfigErrorInfo{"cache", std::string(key) + " must be a positive integer"});
            }
            return std::chrono::seconds(value.get<int64_t>());
        }

        ConfigResult<std::vector<AppRule>> parse_app_rules(const std::string& app_id, const nlohmann::json& rules) {
            const std::string context = "apps." + app_id;
            if (!rules.is_array()) {
                return std::unexpected(ConfigErrorInfo{context, "must be an array"});
            }
            std::vector<AppRule> parsed;
            parsed.reserve(rules.size());
            for (const auto& rule : rules) {
                if (!rule.is_object() || !rule.contains("match") || !rule.contains("class") || !rule.at("match").is_string() || !rule.at("class").is_string()) {
                    return std::unexpected(ConfigErrorInfo{context, "rules need string match and class"});
                }
                auto               pattern = rule.at("match").get<std::string>();
                QRegularExpression regex(QString::fromStdString(pattern), QRegularExpression::UseUnicodePropertiesOption);
                if (!regex.isValid()) {
                    return std::unexpected(ConfigErrorInfo{context, "invalid regex " + pattern + ": " + regex.errorString().toStdString() + " at offset " +
                                                                        std::to_string(regex.patternErrorOffset())});
                }
                regex.optimize();
                parsed.push_back(AppRule{.pattern = std::move(pattern), .regex = std::move(regex), .css_class = rule.at("class").get<std::string>()});
            }
            return parsed;
        }

        ConfigResult<NotificationConfig> parse_notifications(const nlohmann::json& value) {
            constexpr std::string_view kContext = "notifications";
            NotificationConfig         notifications;
            // Shorthand: "notifications": true enables them with default settings.
            if (value.is_boolean()) {
                notifications.enabled = value.get<bool>();
                return notifications;
            }
            if (!value.is_object()) {
                return std::unexpected(ConfigErrorInfo{std::string(kContext), "must be a boolean or an object"});
            }
            const auto         enabled = read_bool(value, "enabled", notifications.enabled, kContext);
            if (!enabled) {
                return std::unexpected(enabled.error());
            }
            const auto desktop_entry = read_bool(value, "use-desktop-entry", notifications.use_desktop_entry, kContext);
            if (!desktop_entry) {
                return std::unexpected(desktop_entry.error());
            }
            const auto fuzzy = read_bool(value, "use-fuzzy-matching", notifications.use_fuzzy_matching, kContext);
            if (!fuzzy) {
                return std::unexpected(fuzzy.error());
            }
            notifications.enabled            = *enabled;
            notifications.use_desktop_entry  = *desktop_entry;
            notifications.use_fuzzy_matching = *fuzzy;

            if (value.contains("map-app-ids")) {
                const auto& map = value.at("map-app-ids");
                if (!map.is_object()) {
                    return std::unexpected(ConfigErrorInfo{std::string(kContext), "map-app-ids must be an object"});
                }
                for (const auto& [entry, app_id] : map.items()) {
                    if (!app_id.is_string()) {
                        return std::unexpected(ConfigErrorInfo{std::string(kContext), "map-app-ids." + entry + " must be a string"});
                    }
                    notifications.map_app_ids.insert_or_assign(entry, app_id.get<std::string>());
                }
            }
            return notifications;
        }

    } // namespace

    ConfigResult<Config> parse_config(std::string_view json_text) {
        const auto json = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
        if (json.is_discarded()) {
            return std::unexpected(ConfigErrorInfo{"config", "invalid json"});
        }
        if (!json.is_object()) {
            return std::unexpected(ConfigErrorInfo{"config", "must be an object"});
        }

        Config config;
        if (json.contains("apps")) {
            const auto& apps = json.at("apps");
            if (!apps.is_object()) {
                return std::unexpected(ConfigErrorInfo{"apps", "must be an object"});
            }
            for (const auto& [app_id, rules] : apps.items()) {
                auto parsed = parse_app_rules(app_id, rules);
                if (!parsed) {
                    return std::unexpected(parsed.error());
                }
                config.apps.insert_or_assign(app_id, std::move(*parsed));
            }
        }
        if (json.contains("notifications")) {
            auto notifications = parse_notifications(json.at("notifications"));
            if (!notifications) {
                return std::unexpected(notifications.error());
            }
            config.notifications = std::move(*notifications);
        }
        if (json.contains("cache")) {
            const auto& cache = json.at("cache");
            if (!cache.is_object()) {
                return std::unexpected(ConfigErrorInfo{"cache", "must be an object"});
            }
            const auto ttl = read_seconds(cache, "ttl-seconds", config.cache_ttl);
            if (!ttl) {
                return std::unexpected(ttl.error());
            }
            const auto sweep = read_seconds(cache, "sweep-seconds", config.cache_sweep);
            if (!sweep) {
                return std::unexpected(sweep.error());
            }
            config.cache_ttl   = *ttl;
            config.cache_sweep = *sweep;
        }
        if (json.contains("output")) {
            const auto& output = json.at("output");
            if (!output.is_null() && !output.is_string()) {
                return std::unexpected(ConfigErrorInfo{"output", "must be a string"});
            }
            if (output.is_string()) {
                const auto trimmed = trim_copy(output.get<std::string>());
                if (!trimmed.empty()) {
                    config.output = trimmed;
                }
            }
        }
        const auto debug = read_bool(json, "debug", config.debug_logging, "config");
        if (!debug) {
            return std::unexpected(debug.error());
        }
        config.debug_logging = *debug;
        return config;
    }

    ConfigResult<Config> load_config(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Config{};
        }
        std::ifstream input(path);
        if (!input.good()) {
            return std::unexpected(ConfigErrorInfo{path.string(), "unable to open"});
        }
        const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        auto              config = parse_config(text);
        if (!config) {
            auto error    = config.error();
            error.context = path.string() + ": " + error.context;
            return std::unexpected(std::move(error));
        }
        return config;
    }

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        if (overrides.output) {
            merged.output = *overrides.output;
        }
        if (overrides.notifications_enabled) {
            merged.notifications.enabled = *overrides.notifications_enabled;
        }
        return merged;
    }

    std::vector<std::string> app_classes(const Config& config, std::string_view app_id) {
        std::vector<std::string> classes;
        const auto               it = config.apps.find(std::string(app_id));
        if (it == config.apps.end()) {
            return classes;
        }
        for (const auto& rule : it->second) {
            classes.push_back(rule.css_class);
        }
        return classes;
    }

    std::vector<std::string> app_matches(const Config& config, std::string_view app_id, std::string_view title) {
        std::vector<std::string> classes;
        const auto               it = config.apps.find(std::string(app_id));
        if (it == config.apps.end()) {
            return classes;
        }
        const QString subject = QString::fromUtf8(title.data(), static_cast<qsizetype>(title.size()));
        for (const auto& rule : it->second) {
            if (rule.regex.match(subject).hasMatch()) {
                classes.push_back(rule.css_class);
            }
        }
        return classes;
    }

    CorrelationOptions correlation_options(const Config& config) {
        return CorrelationOptions{
            .use_desktop_entry  = config.notifications.use_desktop_entry,
            .use_fuzzy_matching = config.notifications.use_fuzzy_matching,
            .app_id_map         = config.notifications.map_app_ids,
            .debug_logging      = config.debug_logging,
        };
    }

} // namespace niritaskbar
