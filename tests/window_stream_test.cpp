#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fake_niri_transport.hpp"
#include "niritaskbar/window_stream.hpp"

using niritaskbar::testing::FakeNiriScript;
using niritaskbar::testing::FakeNiriTransport;
using niritaskbar::testing::fake_connector;

namespace {

    constexpr const char* kWorkspaces = R"({"WorkspacesChanged":{"workspaces":[{"id":1,"idx":1,"output":"DP-1"}]}})";
    constexpr const char* kWindows    = R"({"WindowsChanged":{"windows":[{"id":7,"workspace_id":1,"is_focused":true}]}})";

} // namespace

TEST(RunWindowStream, EmitsSnapshotsOnceReady) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies = {kWorkspaces, kWindows, R"({"WindowClosed":{"id":7}})"};
    FakeNiriTransport          transport(script);
    niritaskbar::WindowSet     set;
    std::vector<niritaskbar::Snapshot> snapshots;

    const auto result = niritaskbar::run_window_stream(
        transport, set,
        [&](niritaskbar::Snapshot snapshot) {
            snapshots.push_back(std::move(snapshot));
            return true;
        },
        false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "connection closed");
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0].windows.size(), 1u);
    EXPECT_TRUE(snapshots[1].windows.empty());
}

TEST(RunWindowStream, SkipsMalformedLines) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies = {kWorkspaces, "{garbage", kWindows};
    FakeNiriTransport      transport(script);
    niritaskbar::WindowSet set;
    int                    snapshots = 0;

    const auto result = niritaskbar::run_window_stream(
        transport, set,
        [&](niritaskbar::Snapshot) {
            ++snapshots;
            return true;
        },
        false);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(snapshots, 1);
}

TEST(RunWindowStream, StopsQuietlyWhenSinkCloses) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies = {kWorkspaces, kWindows, kWindows};
    FakeNiriTransport      transport(script);
    niritaskbar::WindowSet set;
    int                    snapshots = 0;

    const auto result = niritaskbar::run_window_stream(
        transport, set,
        [&](niritaskbar::Snapshot) {
            ++snapshots;
            return false;
        },
        false);

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(snapshots, 1);
    EXPECT_EQ(script->replies.size(), 1u);
}

TEST(WindowStream, ForwardsSnapshotsAndReportsEnd) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies = {R"({"Ok":"Handled"})", kWorkspaces, kWindows};
    niritaskbar::NiriClient client(fake_connector(script));

    std::mutex              mutex;
    std::condition_variable cv;
    std::vector<uint64_t>   seen;
    bool                    finished = false;

    niritaskbar::WindowStream stream(
        client,
        [&](niritaskbar::Snapshot snapshot) {
            std::lock_guard lock(mutex);
            for (const auto& entry : snapshot.windows) {
                seen.push_back(entry.window.id);
            }
            return true;
        },
        false,
        [&] {
            std::lock_guard lock(mutex);
            finished = true;
            cv.notify_all();
        });
    stream.start();

    {
        std::unique_lock lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return finished; }));
    }
    stream.stop();

    EXPECT_EQ(seen, (std::vector<uint64_t>{7}));
    EXPECT_EQ(script->sent.front(), "\"EventStream\"");
}

TEST(WindowStream, StopBeforeStartNeverConnects) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies = {R"({"Ok":"Handled"})"};
    niritaskbar::NiriClient client(fake_connector(script));
    bool                    finished = false;

    niritaskbar::WindowStream stream(client, [](niritaskbar::Snapshot) { return true; }, false, [&] { finished = true; });
    stream.stop();

    EXPECT_FALSE(finished);
    EXPECT_EQ(script->connects, 0);
}
