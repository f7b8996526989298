#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "fake_niri_transport.hpp"
#include "niritaskbar/taskbar.hpp"

using niritaskbar::EnrichedNotification;
using niritaskbar::ParentPidResult;
using niritaskbar::Snapshot;
using niritaskbar::SnapshotUpdate;
using niritaskbar::SnapshotWindow;
using niritaskbar::TaskbarState;
using niritaskbar::TaskbarUpdate;
using niritaskbar::UrgencyUpdate;

namespace {

    SnapshotWindow window(uint64_t id, int64_t pid, bool focused = false) {
        return SnapshotWindow{
            .window = niritaskbar::Window{.id = id, .workspace_id = 1, .pid = pid, .app_id = std::nullopt, .title = std::nullopt, .is_focused = focused},
            .output = "DP-1",
        };
    }

    Snapshot snapshot(std::vector<SnapshotWindow> windows) {
        return Snapshot{.windows = std::move(windows), .workspaces = {}};
    }

    EnrichedNotification from_pid(int64_t pid) {
        EnrichedNotification notification;
        notification.notification.summary = "ping";
        notification.resolved_pid         = pid;
        return notification;
    }

    niritaskbar::ParentLookup no_parents() {
        return [](int64_t) -> ParentPidResult { return std::optional<int64_t>{}; };
    }

    std::vector<UrgencyUpdate> urgency_updates(const std::vector<TaskbarUpdate>& updates) {
        std::vector<UrgencyUpdate> urgency;
        for (const auto& update : updates) {
            if (const auto* value = std::get_if<UrgencyUpdate>(&update)) {
                urgency.push_back(*value);
            }
        }
        return urgency;
    }

} // namespace

TEST(TaskbarState, SnapshotProducesSnapshotUpdate) {
    TaskbarState state(true, {}, no_parents());

    const auto updates = state.handle(snapshot({window(1, 100)}));

    ASSERT_EQ(updates.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<SnapshotUpdate>(updates.front()));
    EXPECT_EQ(std::get<SnapshotUpdate>(updates.front()).snapshot.windows.size(), 1u);
    ASSERT_TRUE(state.last_snapshot().has_value());
}

TEST(TaskbarState, NotificationMarksMatchingWindowOnce) {
    TaskbarState state(true, {}, no_parents());
    state.handle(snapshot({window(1, 100), window(2, 200)}));

    const auto first  = state.handle(from_pid(200));
    const auto second = state.handle(from_pid(200));

    EXPECT_EQ(urgency_updates(first), (std::vector<UrgencyUpdate>{{.window_id = 2, .urgent = true}}));
    EXPECT_TRUE(second.empty());
    EXPECT_TRUE(state.is_urgent(2));
}

TEST(TaskbarState, FocusClearsUrgency) {
    TaskbarState state(true, {}, no_parents());
    state.handle(snapshot({window(1, 100, true), window(2, 200)}));
    state.handle(from_pid(200));

    const auto unfocused = state.handle(snapshot({window(1, 100, true), window(2, 200)}));
    EXPECT_TRUE(urgency_updates(unfocused).empty());

    const auto focused = state.handle(snapshot({window(1, 100), window(2, 200, true)}));

    ASSERT_EQ(focused.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SnapshotUpdate>(focused.front()));
    EXPECT_EQ(urgency_updates(focused), (std::vector<UrgencyUpdate>{{.window_id = 2, .urgent = false}}));
    EXPECT_FALSE(state.is_urgent(2));
}

TEST(TaskbarState, ClosedWindowsAreForgotten) {
    TaskbarState state(true, {}, no_parents());
    state.handle(snapshot({window(2, 200)}));
    state.handle(from_pid(200));

    state.handle(snapshot({}));

    EXPECT_FALSE(state.is_urgent(2));
}

TEST(TaskbarState, NotificationsIgnoredWhenDisabled) {
    TaskbarState state(false, {}, no_parents());
    state.handle(snapshot({window(2, 200)}));

    EXPECT_TRUE(state.handle(from_pid(200)).empty());
    EXPECT_FALSE(state.is_urgent(2));
}

TEST(TaskbarState, NotificationBeforeSnapshotIsDropped) {
    TaskbarState state(true, {}, no_parents());

    EXPECT_TRUE(state.handle(from_pid(200)).empty());
}

TEST(TaskbarState, CorrelationFailureMarksNothing) {
    TaskbarState state(true, {}, [](int64_t) -> ParentPidResult { throw std::runtime_error("proc exploded"); });
    state.handle(snapshot({window(2, 999)}));

    EXPECT_TRUE(state.handle(from_pid(200)).empty());
}

TEST(Taskbar, DeliversUpdatesInOrder) {
    auto                    script = std::make_shared<niritaskbar::testing::FakeNiriScript>();
    niritaskbar::NiriClient client(niritaskbar::testing::fake_connector(script));

    std::mutex                 mutex;
    std::condition_variable    cv;
    std::vector<TaskbarUpdate> seen;
    niritaskbar::Taskbar       taskbar(TaskbarState(true, {}, no_parents()), client, [&](const TaskbarUpdate& update) {
        std::lock_guard lock(mutex);
        seen.push_back(update);
        cv.notify_all();
    });
    taskbar.start();

    ASSERT_TRUE(taskbar.post(snapshot({window(2, 200)})));
    ASSERT_TRUE(taskbar.post(from_pid(200)));
    {
        std::unique_lock lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return seen.size() >= 2; }));
    }
    taskbar.stop();

    EXPECT_TRUE(std::holds_alternative<SnapshotUpdate>(seen[0]));
    EXPECT_EQ(std::get<UrgencyUpdate>(seen[1]), (UrgencyUpdate{.window_id = 2, .urgent = true}));
    EXPECT_FALSE(taskbar.post(snapshot({})));
}

TEST(Taskbar, ActivateWindowUsesClient) {
    auto script = std::make_shared<niritaskbar::testing::FakeNiriScript>();
    script->replies.push_back(R"({"Ok":"Handled"})");
    niritaskbar::NiriClient client(niritaskbar::testing::fake_connector(script));
    niritaskbar::Taskbar    taskbar(TaskbarState(false, {}, no_parents()), client, [](const TaskbarUpdate&) {});

    EXPECT_TRUE(taskbar.activate_window(5).has_value());
    EXPECT_EQ(script->sent.back(), R"({"Action":{"FocusWindow":{"id":5}}})");
}
