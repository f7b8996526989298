#include "niritaskbar/taskbar.hpp"

#include <string>
#include <utility>

#include "niritaskbar/failsafe.hpp"
#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    TaskbarState::TaskbarState(bool notifications_enabled, CorrelationOptions options, ParentLookup parent_of) :
        notifications_enabled_(notifications_enabled), options_(std::move(options)), parent_of_(std::move(parent_of)) {}

    std::vector<TaskbarUpdate> TaskbarState::handle(TaskbarEvent event) {
        if (auto* snapshot = std::get_if<Snapshot>(&event)) {
            return on_snapshot(std::move(*snapshot));
        }
        return on_notification(std::get<EnrichedNotification>(event));
    }

    std::vector<TaskbarUpdate> TaskbarState::on_snapshot(Snapshot snapshot) {
        std::vector<TaskbarUpdate> updates;
        std::set<uint64_t>         still_urgent;
        for (const auto& entry : snapshot.windows) {
            if (!urgent_.contains(entry.window.id)) {
                continue;
            }
            if (entry.window.is_focused) {
                updates.push_back(UrgencyUpdate{.window_id = entry.window.id, .urgent = false});
            } else {
                still_urgent.insert(entry.window.id);
            }
        }
        urgent_ = std::move(still_urgent);
        last_snapshot_ = snapshot;
        updates.insert(updates.begin(), SnapshotUpdate{std::move(snapshot)});
        return updates;
    }

    std::vector<TaskbarUpdate> TaskbarState::on_notification(const EnrichedNotification& notification) {
        if (!notifications_enabled_) {
            return {};
        }
        CorrelationResult result;
        if (const auto error = failsafe::capture([&] { result = correlate_notification(notification, last_snapshot_, options_, parent_of_); })) {
            error_log("notification", "correlation failed: " + *error);
            return {};
        }
        if (result.rule == MatchRule::kNone) {
            debug_log(options_.debug_logging, "notification", "no matching window for " + notification.notification.summary);
            return {};
        }
        debug_log(options_.debug_logging, "notification", "matched " + std::to_string(result.window_ids.size()) + " window(s) by " + std::string(match_rule_name(result.rule)));

        std::vector<TaskbarUpdate> updates;
        for (const auto id : result.window_ids) {
            if (urgent_.insert(id).second) {
                updates.push_back(UrgencyUpdate{.window_id = id, .urgent = true});
            }
        }
        return updates;
    }

    Taskbar::Taskbar(TaskbarState state, NiriClient& client, UpdateSink sink) : state_(std::move(state)), client_(client), sink_(std::move(sink)) {}

    Taskbar::~Taskbar() {
        stop();
    }

    void Taskbar::start() {
        if (thread_.joinable()) {
            return;
        }
        thread_ = std::thread([this] { run(); });
    }

    void Taskbar::stop() {
        events_.close();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool Taskbar::post(TaskbarEvent event) {
        return events_.send(std::move(event));
    }

    NiriResult<void> Taskbar::activate_window(uint64_t id) {
        return client_.activate_window(id);
    }

    void Taskbar::run() {
        while (auto event = events_.receive()) {
            for (const auto& update : state_.handle(std::move(*event))) {
                if (const auto error = failsafe::capture([&] { sink_(update); })) {
                    error_log("taskbar", "update sink failed: " + *error);
                }
            }
        }
    }

} // namespace niritaskbar
