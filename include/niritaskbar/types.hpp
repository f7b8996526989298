#ifndef NIRITASKBAR_TYPES_HPP
#define NIRITASKBAR_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace niritaskbar {

    struct ScrollingPosition {
        uint64_t column;
        uint64_t tile;

        bool     operator==(const ScrollingPosition&) const = default;
    };

    struct Size {
        double width  = 0.0;
        double height = 0.0;

        bool   operator==(const Size&) const = default;
    };

    struct WindowLayout {
        // Unset for floating windows.
        std::optional<ScrollingPosition> position;
        Size                             tile_size;
        Size                             window_size;

        bool                             operator==(const WindowLayout&) const = default;
    };

    struct Window {
        uint64_t                   id;
        std::optional<uint64_t>    workspace_id;
        std::optional<int64_t>     pid;
        std::optional<std::string> app_id;
        std::optional<std::string> title;
        bool                       is_focused  = false;
        bool                       is_floating = false;
        bool                       is_urgent   = false;
        WindowLayout               layout      = {};

        bool                       operator==(const Window&) const = default;
    };

    struct Workspace {
        uint64_t                   id;
        uint64_t                   idx;
        std::optional<std::string> name;
        std::optional<std::string> output;
        bool                       is_urgent  = false;
        bool                       is_active  = false;
        bool                       is_focused = false;
        std::optional<uint64_t>    active_window_id;

        bool                       operator==(const Workspace&) const = default;
    };

    // A window as published in a snapshot: its workspace is known, so its output is too.
    struct SnapshotWindow {
        Window                     window;
        std::optional<std::string> output;

        bool                       operator==(const SnapshotWindow&) const = default;
    };

    struct Snapshot {
        std::vector<SnapshotWindow> windows;
        std::vector<Workspace>      workspaces;

        bool                        operator==(const Snapshot&) const = default;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_TYPES_HPP
