#include "niritaskbar/update_json.hpp"

#include <variant>

#include <nlohmann/json.hpp>

namespace niritaskbar {

    namespace {

        template <typename T>
        nlohmann::json optional_value(const std::optional<T>& value) {
            if (!value) {
                return nullptr;
            }
            return nlohmann::json(*value);
        }

        nlohmann::json window_json(const SnapshotWindow& entry, const Config& config) {
            const auto&    window = entry.window;
            const auto     app_id = window.app_id.value_or("");
            const auto     title  = window.title.value_or("");

            nlohmann::json out = {
                {"id", window.id},
                {"app_id", optional_value(window.app_id)},
                {"title", optional_value(window.title)},
                {"output", optional_value(entry.output)},
                {"workspace_id", optional_value(window.workspace_id)},
                {"focused", window.is_focused},
                {"floating", window.is_floating},
                {"urgent", window.is_urgent},
                {"classes", app_matches(config, app_id, title)},
                {"all_classes", app_classes(config, app_id)},
            };
            if (const auto& position = window.layout.position) {
                out["column"] = position->column;
                out["row"]    = position->tile;
            } else {
                out["column"] = nullptr;
                out["row"]    = nullptr;
            }
            return out;
        }

        nlohmann::json workspace_json(const Workspace& workspace) {
            return {
                {"id", workspace.id},
                {"idx", workspace.idx},
                {"name", optional_value(workspace.name)},
                {"output", optional_value(workspace.output)},
                {"active", workspace.is_active},
                {"focused", workspace.is_focused},
                {"urgent", workspace.is_urgent},
                {"active_window_id", optional_value(workspace.active_window_id)},
            };
        }

        nlohmann::json snapshot_json(const Snapshot& snapshot, const Config& config, const OutputFilter& filter) {
            auto windows = nlohmann::json::array();
            for (const auto& entry : filter.visible_windows(snapshot)) {
                windows.push_back(window_json(entry, config));
            }
            auto workspaces = nlohmann::json::array();
            for (const auto& workspace : snapshot.workspaces) {
                const auto output = workspace.output ? std::optional<std::string_view>(*workspace.output) : std::nullopt;
                if (filter.should_show(output)) {
                    workspaces.push_back(workspace_json(workspace));
                }
            }
            return {{"type", "snapshot"}, {"windows", std::move(windows)}, {"workspaces", std::move(workspaces)}};
        }

    } // namespace

    std::string render_update_json(const TaskbarUpdate& update, const Config& config, const OutputFilter& filter) {
        nlohmann::json out;
        if (const auto* snapshot = std::get_if<SnapshotUpdate>(&update)) {
            out = snapshot_json(snapshot->snapshot, config, filter);
        } else {
            const auto& urgency = std::get<UrgencyUpdate>(update);
            out                 = {{"type", "urgency"}, {"id", urgency.window_id}, {"urgent", urgency.urgent}};
        }
        return out.dump(-1, ' ', true);
    }

} // namespace niritaskbar
