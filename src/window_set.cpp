#include "niritaskbar/window_set.hpp"

#include <string>
#include <utility>

#include "niritaskbar/logging.hpp"

namespace niritaskbar {

    namespace {

        template <typename... Ts>
        struct Overloaded : Ts... {
            using Ts::operator()...;
        };

    } // namespace

    WindowSet::WindowSet(bool debug_logging) : state_(Uninitialized{}), debug_logging_(debug_logging) {}

    std::optional<Snapshot> WindowSet::apply(const NiriEvent& event) {
        std::visit(Overloaded{
                       [this](const WindowsChanged& changed) { on_windows(changed.windows); },
                       [this](const WorkspacesChanged& changed) { on_workspaces(changed.workspaces); },
                       [this](const WindowClosed& closed) {
                           if (auto* ready = ready_state("WindowClosed")) {
                               ready->remove_window(closed.id);
                           }
                       },
                       [this](const WindowOpenedOrChanged& changed) {
                           if (auto* ready = ready_state("WindowOpenedOrChanged")) {
                               ready->upsert_window(changed.window);
                           }
                       },
                       [this](const WindowFocusChanged& changed) {
                           if (auto* ready = ready_state("WindowFocusChanged")) {
                               ready->set_focus(changed.id);
                           }
                       },
                       [this](const WindowLayoutsChanged& changed) {
                           if (auto* ready = ready_state("WindowLayoutsChanged")) {
                               for (const auto& [id, layout] : changed.changes) {
                                   ready->update_layout(id, layout);
                               }
                           }
                       },
                       [this](const WorkspaceActivated& activated) {
                           if (auto* ready = ready_state("WorkspaceActivated")) {
                               ready->activate_workspace(activated.id, activated.focused);
                           }
                       },
                       [this](const IgnoredEvent& ignored) { debug_log(debug_logging_, "window set", "ignoring event " + ignored.name); },
                   },
                   event);

        if (const auto* ready = std::get_if<Ready>(&state_)) {
            return ready->snapshot();
        }
        return std::nullopt;
    }

    bool WindowSet::ready() const {
        return std::holds_alternative<Ready>(state_);
    }

    std::string_view WindowSet::state_name() const {
        return std::visit(Overloaded{
                              [](const Uninitialized&) { return std::string_view("uninitialized"); },
                              [](const HaveWindowsOnly&) { return std::string_view("windows only"); },
                              [](const HaveWorkspacesOnly&) { return std::string_view("workspaces only"); },
                              [](const Ready&) { return std::string_view("ready"); },
                          },
                          state_);
    }

    void WindowSet::on_windows(std::vector<Window> windows) {
        if (auto* ready = std::get_if<Ready>(&state_)) {
            ready->replace_windows(std::move(windows));
            return;
        }
        if (auto* buffered = std::get_if<HaveWorkspacesOnly>(&state_)) {
            state_ = make_ready(std::move(windows), std::move(buffered->workspaces));
            return;
        }
        state_ = HaveWindowsOnly{std::move(windows)};
    }

    void WindowSet::on_workspaces(std::vector<Workspace> workspaces) {
        if (auto* ready = std::get_if<Ready>(&state_)) {
            ready->replace_workspaces(std::move(workspaces));
            return;
        }
        if (auto* buffered = std::get_if<HaveWindowsOnly>(&state_)) {
            state_ = make_ready(std::move(buffered->windows), std::move(workspaces));
            return;
        }
        state_ = HaveWorkspacesOnly{std::move(workspaces)};
    }

    WindowSet::Ready* WindowSet::ready_state(std::string_view event) {
        auto* ready = std::get_if<Ready>(&state_);
        if (!ready) {
            std::string message = "unexpected ";
            message.append(event);
            message.append(" event while ");
            message.append(state_name());
            warn_log("window set", message);
        }
        return ready;
    }

    WindowSet::Ready WindowSet::make_ready(std::vector<Window> windows, std::vector<Workspace> workspaces) {
        Ready ready;
        ready.replace_workspaces(std::move(workspaces));
        ready.replace_windows(std::move(windows));
        return ready;
    }

    void WindowSet::Ready::replace_windows(std::vector<Window> list) {
        windows.clear();
        for (auto& window : list) {
            const auto id = window.id;
            windows.insert_or_assign(id, std::move(window));
        }
    }

    void WindowSet::Ready::replace_workspaces(std::vector<Workspace> list) {
        workspaces.clear();
        for (auto& workspace : list) {
            const auto id = workspace.id;
            workspaces.insert_or_assign(id, std::move(workspace));
        }
    }

    void WindowSet::Ready::remove_window(uint64_t id) {
        windows.erase(id);
    }

    void WindowSet::Ready::upsert_window(Window window) {
        if (window.is_focused) {
            for (auto& [_, existing] : windows) {
                existing.is_focused = false;
            }
        }
        const auto id = window.id;
        windows.insert_or_assign(id, std::move(window));
    }

    void WindowSet::Ready::set_focus(std::optional<uint64_t> id) {
        for (auto& [window_id, window] : windows) {
            window.is_focused = id && *id == window_id;
        }
    }

    void WindowSet::Ready::update_layout(uint64_t id, const WindowLayout& layout) {
        const auto it = windows.find(id);
        if (it == windows.end()) {
            return;
        }
        it->second.layout = layout;
    }

    void WindowSet::Ready::activate_workspace(uint64_t id, bool focused) {
        for (auto& [workspace_id, workspace] : workspaces) {
            workspace.is_focused = focused && workspace_id == id;
        }
    }

    Snapshot WindowSet::Ready::snapshot() const {
        Snapshot snapshot;
        snapshot.windows.reserve(windows.size());
        for (const auto& [_, window] : windows) {
            if (!window.workspace_id) {
                continue;
            }
            const auto workspace = workspaces.find(*window.workspace_id);
            if (workspace == workspaces.end()) {
                continue;
            }
            snapshot.windows.push_back(SnapshotWindow{.window = window, .output = workspace->second.output});
        }
        snapshot.workspaces.reserve(workspaces.size());
        for (const auto& [_, workspace] : workspaces) {
            snapshot.workspaces.push_back(workspace);
        }
        return snapshot;
    }

} // namespace niritaskbar
