#ifndef NIRITASKBAR_CONFIG_HPP
#define NIRITASKBAR_CONFIG_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <QRegularExpression>

#include "niritaskbar/notification_correlator.hpp"

namespace niritaskbar {

    struct ConfigErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_config_error(const ConfigErrorInfo& error) {
        if (error.context.empty()) {
            return error.message;
        }
        return error.context + ": " + error.message;
    }

    template <typename T>
    using ConfigResult = std::expected<T, ConfigErrorInfo>;

    // Tags windows of one application with a CSS class when the title matches.
    // Patterns are PCRE, so inline flags such as (?i) and \p{..} classes work.
    struct AppRule {
        std::string        pattern;
        QRegularExpression regex;
        std::string        css_class;
    };

    struct NotificationConfig {
        bool                                         enabled            = false;
        bool                                         use_desktop_entry  = true;
        bool                                         use_fuzzy_matching = false;
        std::unordered_map<std::string, std::string> map_app_ids;
    };

    struct Config {
        std::unordered_map<std::string, std::vector<AppRule>> apps;
        NotificationConfig                                    notifications;
        std::chrono::seconds                                  cache_ttl   = std::chrono::minutes(5);
        std::chrono::seconds                                  cache_sweep = std::chrono::minutes(1);
        std::optional<std::string>                            output;
        bool                                                  debug_logging = false;
    };

    struct ConfigOverrides {
        std::optional<bool>        debug_logging;
        std::optional<std::string> output;
        std::optional<bool>        notifications_enabled;
    };

    ConfigResult<Config>     parse_config(std::string_view json_text);
    ConfigResult<Config>     load_config(const std::filesystem::path& path);
    Config                   apply_overrides(const Config& base, const ConfigOverrides& overrides);

    // Every class the app could carry, so a bar can clear stale ones.
    std::vector<std::string> app_classes(const Config& config, std::string_view app_id);
    std::vector<std::string> app_matches(const Config& config, std::string_view app_id, std::string_view title);
    CorrelationOptions       correlation_options(const Config& config);

} // namespace niritaskbar

#endif // NIRITASKBAR_CONFIG_HPP
