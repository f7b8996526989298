#include <string>
#include <variant>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "niritaskbar/niri_ipc.hpp"

namespace {

    constexpr const char* kWindowJson = R"({
        "id": 12,
        "title": "Inbox - Mail",
        "app_id": "org.gnome.Evolution",
        "pid": 4242,
        "workspace_id": 3,
        "is_focused": true,
        "is_floating": false,
        "is_urgent": false,
        "layout": {
            "pos_in_scrolling_layout": [2, 1],
            "tile_size": [800.0, 600.0],
            "window_size": [796, 596]
        }
    })";

}

TEST(NiriIpcParse, ParsesWindow) {
    const auto window = niritaskbar::parse_window(kWindowJson);

    ASSERT_TRUE(window.has_value()) << niritaskbar::format_niri_error(window.error());
    EXPECT_EQ(window->id, 12u);
    EXPECT_EQ(window->title, "Inbox - Mail");
    EXPECT_EQ(window->app_id, "org.gnome.Evolution");
    EXPECT_EQ(window->pid, 4242);
    EXPECT_EQ(window->workspace_id, 3u);
    EXPECT_TRUE(window->is_focused);
    ASSERT_TRUE(window->layout.position.has_value());
    EXPECT_EQ(window->layout.position->column, 2u);
    EXPECT_EQ(window->layout.position->tile, 1u);
    EXPECT_DOUBLE_EQ(window->layout.tile_size.width, 800.0);
    EXPECT_DOUBLE_EQ(window->layout.window_size.height, 596.0);
}

TEST(NiriIpcParse, WindowOptionalFieldsMayBeNull) {
    const auto window = niritaskbar::parse_window(R"({"id": 1, "title": null, "app_id": null, "pid": null, "workspace_id": null, "is_focused": false,
        "layout": {"pos_in_scrolling_layout": null, "tile_size": [1, 1], "window_size": [1, 1]}})");

    ASSERT_TRUE(window.has_value());
    EXPECT_FALSE(window->title.has_value());
    EXPECT_FALSE(window->app_id.has_value());
    EXPECT_FALSE(window->pid.has_value());
    EXPECT_FALSE(window->workspace_id.has_value());
    EXPECT_FALSE(window->layout.position.has_value());
}

TEST(NiriIpcParse, WindowRequiresId) {
    const auto window = niritaskbar::parse_window(R"({"is_focused": false})");

    ASSERT_FALSE(window.has_value());
    EXPECT_EQ(niritaskbar::format_niri_error(window.error()), "window: id missing");
}

TEST(NiriIpcParse, ParsesWorkspace) {
    const auto workspace = niritaskbar::parse_workspace(R"({"id": 5, "idx": 2, "name": null, "output": "DP-1", "is_urgent": false,
        "is_active": true, "is_focused": false, "active_window_id": 12})");

    ASSERT_TRUE(workspace.has_value());
    EXPECT_EQ(workspace->id, 5u);
    EXPECT_EQ(workspace->idx, 2u);
    EXPECT_FALSE(workspace->name.has_value());
    EXPECT_EQ(workspace->output, "DP-1");
    EXPECT_TRUE(workspace->is_active);
    EXPECT_EQ(workspace->active_window_id, 12u);
}

TEST(NiriIpcParse, ParsesWindowsChanged) {
    const auto text  = std::string(R"({"WindowsChanged": {"windows": [)") + kWindowJson + "]}}";
    const auto event = niritaskbar::parse_event(text);

    ASSERT_TRUE(event.has_value());
    const auto* changed = std::get_if<niritaskbar::WindowsChanged>(&*event);
    ASSERT_NE(changed, nullptr);
    ASSERT_EQ(changed->windows.size(), 1u);
    EXPECT_EQ(changed->windows.front().id, 12u);
    EXPECT_EQ(niritaskbar::event_name(*event), "WindowsChanged");
}

TEST(NiriIpcParse, ParsesWindowFocusChangedToNone) {
    const auto event = niritaskbar::parse_event(R"({"WindowFocusChanged": {"id": null}})");

    ASSERT_TRUE(event.has_value());
    const auto* focus = std::get_if<niritaskbar::WindowFocusChanged>(&*event);
    ASSERT_NE(focus, nullptr);
    EXPECT_FALSE(focus->id.has_value());
}

TEST(NiriIpcParse, ParsesWindowLayoutsChanged) {
    const auto event = niritaskbar::parse_event(
        R"({"WindowLayoutsChanged": {"changes": [[7, {"pos_in_scrolling_layout": [3, 1], "tile_size": [10, 20], "window_size": [10, 20]}]]}})");

    ASSERT_TRUE(event.has_value());
    const auto* layouts = std::get_if<niritaskbar::WindowLayoutsChanged>(&*event);
    ASSERT_NE(layouts, nullptr);
    ASSERT_EQ(layouts->changes.size(), 1u);
    EXPECT_EQ(layouts->changes.front().first, 7u);
    EXPECT_EQ(layouts->changes.front().second.position, (niritaskbar::ScrollingPosition{.column = 3, .tile = 1}));
}

TEST(NiriIpcParse, ParsesWorkspaceActivated) {
    const auto event = niritaskbar::parse_event(R"({"WorkspaceActivated": {"id": 4, "focused": true}})");

    ASSERT_TRUE(event.has_value());
    const auto* activated = std::get_if<niritaskbar::WorkspaceActivated>(&*event);
    ASSERT_NE(activated, nullptr);
    EXPECT_EQ(activated->id, 4u);
    EXPECT_TRUE(activated->focused);
}

TEST(NiriIpcParse, UnknownEventIsIgnored) {
    const auto event = niritaskbar::parse_event(R"({"KeyboardLayoutsChanged": {"keyboard_layouts": {"names": [], "current_idx": 0}}})");

    ASSERT_TRUE(event.has_value());
    const auto* ignored = std::get_if<niritaskbar::IgnoredEvent>(&*event);
    ASSERT_NE(ignored, nullptr);
    EXPECT_EQ(ignored->name, "KeyboardLayoutsChanged");
}

TEST(NiriIpcParse, RejectsMultiKeyEvent) {
    const auto event = niritaskbar::parse_event(R"({"WindowClosed": {"id": 1}, "WindowFocusChanged": {"id": 1}})");

    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().message, "expected single-key object");
}

TEST(NiriIpcParse, RejectsInvalidJson) {
    const auto event = niritaskbar::parse_event("{not json");

    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(niritaskbar::format_niri_error(event.error()), "event: invalid json");
}

TEST(NiriIpcParse, RejectsMalformedWindowInList) {
    const auto event = niritaskbar::parse_event(R"({"WindowsChanged": {"windows": [{"id": "twelve", "is_focused": false}]}})");

    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(niritaskbar::format_niri_error(event.error()), "WindowsChanged: id invalid");
}

TEST(NiriIpcReply, AcceptsHandled) {
    EXPECT_TRUE(niritaskbar::parse_handled_reply(R"({"Ok": "Handled"})").has_value());
}

TEST(NiriIpcReply, ReportsCompositorError) {
    const auto reply = niritaskbar::parse_handled_reply(R"({"Err": "window not found"})");

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(niritaskbar::format_niri_error(reply.error()), "niri reply: window not found");
}

TEST(NiriIpcReply, ReportsUnexpectedVariant) {
    const auto reply = niritaskbar::parse_handled_reply(R"({"Ok": {"Version": "25.02"}})");

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().message, "unexpected response; expected Handled, got Version");
}

TEST(NiriIpcRequest, EncodesEventStream) {
    EXPECT_EQ(niritaskbar::event_stream_request(), "\"EventStream\"");
}

TEST(NiriIpcRequest, EncodesFocusWindow) {
    const auto request = nlohmann::json::parse(niritaskbar::focus_window_request(42));

    EXPECT_EQ(request, nlohmann::json::parse(R"({"Action": {"FocusWindow": {"id": 42}}})"));
}
