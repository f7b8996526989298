#include "niritaskbar/niri_ipc.hpp"

#include <nlohmann/json.hpp>

#include "niritaskbar/json_utils.hpp"

namespace niritaskbar {

    namespace {

        NiriResult<nlohmann::json> parse_json(std::string_view json_text, std::string_view context) {
            auto parsed = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
            if (parsed.is_discarded()) {
                return std::unexpected(NiriErrorInfo{std::string(context), "invalid json"});
            }
            return parsed;
        }

        NiriResult<const nlohmann::json*> required_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            if (!obj.is_object() || !obj.contains(key)) {
                return std::unexpected(NiriErrorInfo{std::string(context), std::string(key) + " missing"});
            }
            return &obj.at(key);
        }

        NiriResult<uint64_t> required_id_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            const auto value = required_field(obj, key, context);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (!(*value)->is_number_unsigned()) {
                return std::unexpected(NiriErrorInfo{std::string(context), std::string(key) + " invalid"});
            }
            return (*value)->get<uint64_t>();
        }

        NiriResult<bool> required_bool_field(const nlohmann::json& obj, std::string_view key, std::string_view context) {
            const auto value = required_field(obj, key, context);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (!(*value)->is_boolean()) {
                return std::unexpected(NiriErrorInfo{std::string(context), std::string(key) + " invalid"});
            }
            return (*value)->get<bool>();
        }

        Size size_from_json(const nlohmann::json& value) {
            if (!value.is_array() || value.size() < 2 || !value.at(0).is_number() || !value.at(1).is_number()) {
                return {};
            }
            return Size{.width = value.at(0).get<double>(), .height = value.at(1).get<double>()};
        }

        WindowLayout layout_from_json(const nlohmann::json& value) {
            WindowLayout layout;
            if (!value.is_object()) {
                return layout;
            }
            if (value.contains("pos_in_scrolling_layout")) {
                const auto& pos = value.at("pos_in_scrolling_layout");
                if (pos.is_array() && pos.size() >= 2 && pos.at(0).is_number_unsigned() && pos.at(1).is_number_unsigned()) {
                    layout.position = ScrollingPosition{.column = pos.at(0).get<uint64_t>(), .tile = pos.at(1).get<uint64_t>()};
                }
            }
            if (value.contains("tile_size")) {
                layout.tile_size = size_from_json(value.at("tile_size"));
            }
            if (value.contains("window_size")) {
                layout.window_size = size_from_json(value.at("window_size"));
            }
            return layout;
        }

        NiriResult<Window> window_from_json(const nlohmann::json& value, std::string_view context) {
            if (!value.is_object()) {
                return std::unexpected(NiriErrorInfo{std::string(context), "window not object"});
            }
            const auto id = required_id_field(value, "id", context);
            if (!id) {
                return std::unexpected(id.error());
            }
            const auto focused = required_bool_field(value, "is_focused", context);
            if (!focused) {
                return std::unexpected(focused.error());
            }
            Window window{
                .id           = *id,
                .workspace_id = optional_id_field(value, "workspace_id"),
                .pid          = optional_int_field(value, "pid"),
                .app_id       = optional_string_field(value, "app_id"),
                .title        = optional_string_field(value, "title"),
                .is_focused   = *focused,
                .is_floating  = bool_field_or(value, "is_floating", false),
                .is_urgent    = bool_field_or(value, "is_urgent", false),
            };
            if (value.contains("layout")) {
                window.layout = layout_from_json(value.at("layout"));
            }
            return window;
        }

        NiriResult<Workspace> workspace_from_json(const nlohmann::json& value, std::string_view context) {
            if (!value.is_object()) {
                return std::unexpected(NiriErrorInfo{std::string(context), "workspace not object"});
            }
            const auto id = required_id_field(value, "id", context);
            if (!id) {
                return std::unexpected(id.error());
            }
            const auto idx = required_id_field(value, "idx", context);
            if (!idx) {
                return std::unexpected(idx.error());
            }
            return Workspace{
                .id               = *id,
                .idx              = *idx,
                .name             = optional_string_field(value, "name"),
                .output           = optional_string_field(value, "output"),
                .is_urgent        = bool_field_or(value, "is_urgent", false),
                .is_active        = bool_field_or(value, "is_active", false),
                .is_focused       = bool_field_or(value, "is_focused", false),
                .active_window_id = optional_id_field(value, "active_window_id"),
            };
        }

        template <typename T, typename Parse>
        NiriResult<std::vector<T>> list_from_json(const nlohmann::json& body, std::string_view key, std::string_view context, Parse parse) {
            const auto list = required_field(body, key, context);
            if (!list) {
                return std::unexpected(list.error());
            }
            if (!(*list)->is_array()) {
                return std::unexpected(NiriErrorInfo{std::string(context), std::string(key) + " not array"});
            }
            std::vector<T> items;
            items.reserve((*list)->size());
            for (const auto& entry : **list) {
                auto item = parse(entry, context);
                if (!item) {
                    return std::unexpected(item.error());
                }
                items.push_back(std::move(*item));
            }
            return items;
        }

        NiriResult<NiriEvent> layouts_changed_from_json(const nlohmann::json& body) {
            constexpr std::string_view kContext = "WindowLayoutsChanged";
            const auto                 changes  = required_field(body, "changes", kContext);
            if (!changes) {
                return std::unexpected(changes.error());
            }
            if (!(*changes)->is_array()) {
                return std::unexpected(NiriErrorInfo{std::string(kContext), "changes not array"});
            }
            WindowLayoutsChanged event;
            for (const auto& change : **changes) {
                if (!change.is_array() || change.size() != 2 || !change.at(0).is_number_unsigned()) {
                    return std::unexpected(NiriErrorInfo{std::string(kContext), "change invalid"});
                }
                event.changes.emplace_back(change.at(0).get<uint64_t>(), layout_from_json(change.at(1)));
            }
            return event;
        }

        NiriResult<NiriEvent> event_from_json(std::string_view name, const nlohmann::json& body) {
            if (name == "WindowsChanged") {
                auto windows = list_from_json<Window>(body, "windows", name, window_from_json);
                if (!windows) {
                    return std::unexpected(windows.error());
                }
                return WindowsChanged{std::move(*windows)};
            }
            if (name == "WorkspacesChanged") {
                auto workspaces = list_from_json<Workspace>(body, "workspaces", name, workspace_from_json);
                if (!workspaces) {
                    return std::unexpected(workspaces.error());
                }
                return WorkspacesChanged{std::move(*workspaces)};
            }
            if (name == "WindowClosed") {
                const auto id = required_id_field(body, "id", name);
                if (!id) {
                    return std::unexpected(id.error());
                }
                return WindowClosed{*id};
            }
            if (name == "WindowOpenedOrChanged") {
                const auto window = required_field(body, "window", name);
                if (!window) {
                    return std::unexpected(window.error());
                }
                auto parsed = window_from_json(**window, name);
                if (!parsed) {
                    return std::unexpected(parsed.error());
                }
                return WindowOpenedOrChanged{std::move(*parsed)};
            }
            if (name == "WindowFocusChanged") {
                const auto id = required_field(body, "id", name);
                if (!id) {
                    return std::unexpected(id.error());
                }
                if ((*id)->is_null()) {
                    return WindowFocusChanged{std::nullopt};
                }
                if (!(*id)->is_number_unsigned()) {
                    return std::unexpected(NiriErrorInfo{std::string(name), "id invalid"});
                }
                return WindowFocusChanged{(*id)->get<uint64_t>()};
            }
            if (name == "WindowLayoutsChanged") {
                return layouts_changed_from_json(body);
            }
            if (name == "WorkspaceActivated") {
                const auto id = required_id_field(body, "id", name);
                if (!id) {
                    return std::unexpected(id.error());
                }
                const auto focused = required_bool_field(body, "focused", name);
                if (!focused) {
                    return std::unexpected(focused.error());
                }
                return WorkspaceActivated{.id = *id, .focused = *focused};
            }
            return IgnoredEvent{std::string(name)};
        }

    } // namespace

    std::string_view event_name(const NiriEvent& event) {
        struct Visitor {
            std::string_view operator()(const WindowsChanged&) const {
                return "WindowsChanged";
            }
            std::string_view operator()(const WorkspacesChanged&) const {
                return "WorkspacesChanged";
            }
            std::string_view operator()(const WindowClosed&) const {
                return "WindowClosed";
            }
            std::string_view operator()(const WindowOpenedOrChanged&) const {
                return "WindowOpenedOrChanged";
            }
            std::string_view operator()(const WindowFocusChanged&) const {
                return "WindowFocusChanged";
            }
            std::string_view operator()(const WindowLayoutsChanged&) const {
                return "WindowLayoutsChanged";
            }
            std::string_view operator()(const WorkspaceActivated&) const {
                return "WorkspaceActivated";
            }
            std::string_view operator()(const IgnoredEvent& ignored) const {
                return ignored.name;
            }
        };
        return std::visit(Visitor{}, event);
    }

    NiriResult<NiriEvent> parse_event(std::string_view json_text) {
        const auto json = parse_json(json_text, "event");
        if (!json) {
            return std::unexpected(json.error());
        }
        if (json->is_string()) {
            return IgnoredEvent{json->get<std::string>()};
        }
        if (!json->is_object() || json->size() != 1) {
            return std::unexpected(NiriErrorInfo{"event", "expected single-key object"});
        }
        const auto it = json->begin();
        return event_from_json(it.key(), it.value());
    }

    NiriResult<Window> parse_window(std::string_view json_text) {
        const auto json = parse_json(json_text, "window");
        if (!json) {
            return std::unexpected(json.error());
        }
        return window_from_json(*json, "window");
    }

    NiriResult<Workspace> parse_workspace(std::string_view json_text) {
        const auto json = parse_json(json_text, "workspace");
        if (!json) {
            return std::unexpected(json.error());
        }
        return workspace_from_json(*json, "workspace");
    }

    NiriResult<void> parse_handled_reply(std::string_view json_text) {
        constexpr std::string_view kContext = "niri reply";
        const auto                 json     = parse_json(json_text, kContext);
        if (!json) {
            return std::unexpected(json.error());
        }
        if (!json->is_object()) {
            return std::unexpected(NiriErrorInfo{std::string(kContext), "reply not object"});
        }
        if (json->contains("Err")) {
            const auto message = optional_string(json->at("Err"));
            return std::unexpected(NiriErrorInfo{std::string(kContext), message.value_or("unknown error")});
        }
        if (!json->contains("Ok")) {
            return std::unexpected(NiriErrorInfo{std::string(kContext), "Ok missing"});
        }
        const auto& response = json->at("Ok");
        if (response.is_string() && response.get<std::string>() == "Handled") {
            return {};
        }
        std::string variant = "unknown";
        if (response.is_string()) {
            variant = response.get<std::string>();
        } else if (response.is_object() && !response.empty()) {
            variant = response.begin().key();
        }
        return std::unexpected(NiriErrorInfo{std::string(kContext), "unexpected response; expected Handled, got " + variant});
    }

    std::string event_stream_request() {
        return nlohmann::json("EventStream").dump();
    }

    std::string focus_window_request(uint64_t id) {
        const nlohmann::json request = {{"Action", {{"FocusWindow", {{"id", id}}}}}};
        return request.dump();
    }

} // namespace niritaskbar
