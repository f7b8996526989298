#ifndef NIRITASKBAR_NOTIFICATION_HPP
#define NIRITASKBAR_NOTIFICATION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace niritaskbar {

    struct NotificationAction {
        std::string id;
        std::string label;

        bool        operator==(const NotificationAction&) const = default;
    };

    // Bus values are narrowed to these before decoding: every integer width becomes int64_t.
    using HintValue = std::variant<bool, int64_t, double, std::string>;
    using HintMap   = std::map<std::string, HintValue>;

    struct NotificationHints {
        std::optional<bool>        action_icons;
        std::optional<std::string> category;
        std::optional<std::string> desktop_entry;
        std::optional<bool>        resident;
        std::optional<std::string> sound_file;
        std::optional<std::string> sound_name;
        std::optional<bool>        suppress_sound;
        std::optional<bool>        transient;
        std::optional<int64_t>     sender_pid;
        std::optional<uint8_t>     urgency;
        std::optional<int32_t>     x;
        std::optional<int32_t>     y;
    };

    struct Notification {
        std::optional<std::string>      app_name;
        std::optional<uint32_t>         replaces_id;
        std::optional<std::string>      app_icon;
        std::string                     summary;
        std::optional<std::string>      body;
        std::vector<NotificationAction> actions;
        NotificationHints               hints;
        int32_t                         expire_timeout = -1;
    };

    // The raw arguments of org.freedesktop.Notifications.Notify.
    struct NotifyCall {
        std::string              app_name;
        uint32_t                 replaces_id = 0;
        std::string              app_icon;
        std::string              summary;
        std::string              body;
        std::vector<std::string> actions;
        HintMap                  hints;
        int32_t                  expire_timeout = -1;
    };

    std::vector<NotificationAction> pair_actions(const std::vector<std::string>& flat);
    NotificationHints               decode_hints(const HintMap& hints);
    Notification                    decode_notification(NotifyCall call);

    struct EnrichedNotification {
        Notification           notification;
        std::optional<int64_t> resolved_pid;

        // The bus-resolved pid, falling back to the sender-pid hint.
        std::optional<int64_t> pid() const {
            if (resolved_pid) {
                return resolved_pid;
            }
            return notification.hints.sender_pid;
        }
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_NOTIFICATION_HPP
