#ifndef NIRITASKBAR_NIRI_IPC_HPP
#define NIRITASKBAR_NIRI_IPC_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "niritaskbar/types.hpp"

namespace niritaskbar {

    struct NiriErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_niri_error(const NiriErrorInfo& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using NiriResult = std::expected<T, NiriErrorInfo>;

    struct WindowsChanged {
        std::vector<Window> windows;
    };

    struct WorkspacesChanged {
        std::vector<Workspace> workspaces;
    };

    struct WindowClosed {
        uint64_t id;
    };

    struct WindowOpenedOrChanged {
        Window window;
    };

    struct WindowFocusChanged {
        std::optional<uint64_t> id;
    };

    struct WindowLayoutsChanged {
        std::vector<std::pair<uint64_t, WindowLayout>> changes;
    };

    struct WorkspaceActivated {
        uint64_t id;
        bool     focused;
    };

    // Any event kind the taskbar has no use for.
    struct IgnoredEvent {
        std::string name;
    };

    using NiriEvent = std::variant<WindowsChanged, WorkspacesChanged, WindowClosed, WindowOpenedOrChanged, WindowFocusChanged, WindowLayoutsChanged, WorkspaceActivated, IgnoredEvent>;

    std::string_view      event_name(const NiriEvent& event);

    NiriResult<NiriEvent> parse_event(std::string_view json_text);
    NiriResult<Window>    parse_window(std::string_view json_text);
    NiriResult<Workspace> parse_workspace(std::string_view json_text);
    NiriResult<void>      parse_handled_reply(std::string_view json_text);

    std::string           event_stream_request();
    std::string           focus_window_request(uint64_t id);

} // namespace niritaskbar

#endif // NIRITASKBAR_NIRI_IPC_HPP
