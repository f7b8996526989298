#ifndef NIRITASKBAR_TASKBAR_HPP
#define NIRITASKBAR_TASKBAR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <thread>
#include <variant>
#include <vector>

#include "niritaskbar/channel.hpp"
#include "niritaskbar/niri_socket.hpp"
#include "niritaskbar/notification.hpp"
#include "niritaskbar/notification_correlator.hpp"
#include "niritaskbar/types.hpp"

namespace niritaskbar {

    struct SnapshotUpdate {
        Snapshot snapshot;
    };

    struct UrgencyUpdate {
        uint64_t window_id;
        bool     urgent;

        bool     operator==(const UrgencyUpdate&) const = default;
    };

    using TaskbarUpdate = std::variant<SnapshotUpdate, UrgencyUpdate>;
    using TaskbarEvent  = std::variant<Snapshot, EnrichedNotification>;
    using UpdateSink    = std::function<void(const TaskbarUpdate&)>;

    // Consumes snapshots and notifications in arrival order.
    //
    // Urgency is set when a notification correlates to a window and cleared the
    // next time that window shows up focused.
    class TaskbarState {
      public:
        TaskbarState(bool notifications_enabled, CorrelationOptions options, ParentLookup parent_of);

        std::vector<TaskbarUpdate>     handle(TaskbarEvent event);

        const std::optional<Snapshot>& last_snapshot() const {
            return last_snapshot_;
        }
        bool is_urgent(uint64_t window_id) const {
            return urgent_.contains(window_id);
        }

      private:
        std::vector<TaskbarUpdate> on_snapshot(Snapshot snapshot);
        std::vector<TaskbarUpdate> on_notification(const EnrichedNotification& notification);

        bool                       notifications_enabled_;
        CorrelationOptions         options_;
        ParentLookup               parent_of_;
        std::optional<Snapshot>    last_snapshot_;
        std::set<uint64_t>         urgent_;
    };

    // Runs a TaskbarState on its own thread and hands updates to the sink.
    class Taskbar {
      public:
        Taskbar(TaskbarState state, NiriClient& client, UpdateSink sink);
        ~Taskbar();

        Taskbar(const Taskbar&)            = delete;
        Taskbar& operator=(const Taskbar&) = delete;

        void             start();
        void             stop();

        // Safe from any thread; false once stopped.
        bool             post(TaskbarEvent event);
        NiriResult<void> activate_window(uint64_t id);

      private:
        void                  run();

        TaskbarState          state_;
        NiriClient&           client_;
        UpdateSink            sink_;
        Channel<TaskbarEvent> events_;
        std::thread           thread_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_TASKBAR_HPP
