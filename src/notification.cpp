#include "niritaskbar/notification.hpp"

#include <limits>
#include <utility>

namespace niritaskbar {

    namespace {

        std::optional<std::string> non_empty(std::string value) {
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

        template <typename T>
        std::optional<T> hint_as(const HintMap& hints, const char* key) {
            const auto it = hints.find(key);
            if (it == hints.end()) {
                return std::nullopt;
            }
            if (const auto* value = std::get_if<T>(&it->second)) {
                return *value;
            }
            return std::nullopt;
        }

        template <typename T>
        std::optional<T> ranged_hint(const HintMap& hints, const char* key) {
            const auto value = hint_as<int64_t>(hints, key);
            if (!value || *value < std::numeric_limits<T>::min() || *value > std::numeric_limits<T>::max()) {
                return std::nullopt;
            }
            return static_cast<T>(*value);
        }

    } // namespace

    std::vector<NotificationAction> pair_actions(const std::vector<std::string>& flat) {
        std::vector<NotificationAction> actions;
        actions.reserve(flat.size() / 2);
        for (size_t i = 0; i + 1 < flat.size(); i += 2) {
            actions.push_back(NotificationAction{.id = flat[i], .label = flat[i + 1]});
        }
        return actions;
    }

    NotificationHints decode_hints(const HintMap& hints) {
        return NotificationHints{
            .action_icons   = hint_as<bool>(hints, "action-icons"),
            .category       = hint_as<std::string>(hints, "category"),
            .desktop_entry  = hint_as<std::string>(hints, "desktop-entry"),
            .resident       = hint_as<bool>(hints, "resident"),
            .sound_file     = hint_as<std::string>(hints, "sound-file"),
            .sound_name     = hint_as<std::string>(hints, "sound-name"),
            .suppress_sound = hint_as<bool>(hints, "suppress-sound"),
            .transient      = hint_as<bool>(hints, "transient"),
            .sender_pid     = hint_as<int64_t>(hints, "sender-pid"),
            .urgency        = ranged_hint<uint8_t>(hints, "urgency"),
            .x              = ranged_hint<int32_t>(hints, "x"),
            .y              = ranged_hint<int32_t>(hints, "y"),
        };
    }

    Notification decode_notification(NotifyCall call) {
        return Notification{
            .app_name       = non_empty(std::move(call.app_name)),
            .replaces_id    = call.replaces_id == 0 ? std::nullopt : std::optional<uint32_t>(call.replaces_id),
            .app_icon       = non_empty(std::move(call.app_icon)),
            .summary        = std::move(call.summary),
            .body           = non_empty(std::move(call.body)),
            .actions        = pair_actions(call.actions),
            .hints          = decode_hints(call.hints),
            .expire_timeout = call.expire_timeout,
        };
    }

} // namespace niritaskbar
