#include <gtest/gtest.h>

#include "niritaskbar/output_filter.hpp"

namespace {

    niritaskbar::SnapshotWindow on_output(uint64_t id, std::optional<std::string> output) {
        return niritaskbar::SnapshotWindow{.window = niritaskbar::Window{.id = id, .workspace_id = 1, .pid = std::nullopt, .app_id = std::nullopt, .title = std::nullopt}, .output = std::move(output)};
    }

} // namespace

TEST(OutputFilter, ShowAllAcceptsEverything) {
    const auto filter = niritaskbar::OutputFilter::show_all();

    EXPECT_TRUE(filter.should_show("DP-1"));
    EXPECT_TRUE(filter.should_show(std::nullopt));
}

TEST(OutputFilter, OnlyAcceptsNamedOutput) {
    const auto filter = niritaskbar::OutputFilter::only("DP-1");

    EXPECT_TRUE(filter.should_show("DP-1"));
    EXPECT_FALSE(filter.should_show("HDMI-A-1"));
    EXPECT_FALSE(filter.should_show(std::nullopt));
}

TEST(OutputFilter, VisibleWindowsKeepsOrder) {
    const niritaskbar::Snapshot snapshot{.windows = {on_output(1, "DP-1"), on_output(2, "HDMI-A-1"), on_output(3, "DP-1"), on_output(4, std::nullopt)}, .workspaces = {}};

    const auto visible = niritaskbar::OutputFilter::only("DP-1").visible_windows(snapshot);

    ASSERT_EQ(visible.size(), 2u);
    EXPECT_EQ(visible[0].window.id, 1u);
    EXPECT_EQ(visible[1].window.id, 3u);
    EXPECT_EQ(niritaskbar::OutputFilter::show_all().visible_windows(snapshot).size(), 4u);
}
