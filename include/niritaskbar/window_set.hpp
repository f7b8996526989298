#ifndef NIRITASKBAR_WINDOW_SET_HPP
#define NIRITASKBAR_WINDOW_SET_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "niritaskbar/niri_ipc.hpp"
#include "niritaskbar/types.hpp"

namespace niritaskbar {

    // Rebuilds the compositor's window and workspace state from its event stream.
    //
    // niri sends one full window list and one full workspace list before any
    // incremental event, in either order. Nothing is published until both have
    // been seen.
    class WindowSet {
      public:
        explicit WindowSet(bool debug_logging = false);

        // Applies one event; returns the resulting snapshot once the set is ready.
        std::optional<Snapshot> apply(const NiriEvent& event);

        bool                    ready() const;
        std::string_view        state_name() const;

      private:
        struct Uninitialized {};

        struct HaveWindowsOnly {
            std::vector<Window> windows;
        };

        struct HaveWorkspacesOnly {
            std::vector<Workspace> workspaces;
        };

        struct Ready {
            std::map<uint64_t, Window>    windows;
            std::map<uint64_t, Workspace> workspaces;

            void                          replace_windows(std::vector<Window> list);
            void                          replace_workspaces(std::vector<Workspace> list);
            void                          remove_window(uint64_t id);
            void                          upsert_window(Window window);
            void                          set_focus(std::optional<uint64_t> id);
            void                          update_layout(uint64_t id, const WindowLayout& layout);
            void                          activate_workspace(uint64_t id, bool focused);
            Snapshot                      snapshot() const;
        };

        using State = std::variant<Uninitialized, HaveWindowsOnly, HaveWorkspacesOnly, Ready>;

        void  on_windows(std::vector<Window> windows);
        void  on_workspaces(std::vector<Workspace> workspaces);
        Ready* ready_state(std::string_view event);

        static Ready make_ready(std::vector<Window> windows, std::vector<Workspace> workspaces);

        State state_;
        bool  debug_logging_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_WINDOW_SET_HPP
