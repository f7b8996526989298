#include "niritaskbar/notification_correlator.hpp"

#include <utility>

#include "niritaskbar/logging.hpp"
#include "niritaskbar/strings.hpp"

namespace niritaskbar {

    std::string_view match_rule_name(MatchRule rule) {
        switch (rule) {
            case MatchRule::kNone: return "none";
            case MatchRule::kProcessAncestry: return "process ancestry";
            case MatchRule::kDesktopEntry: return "desktop entry";
            case MatchRule::kFuzzyDesktopEntry: return "fuzzy desktop entry";
        }
        return "unknown";
    }

    ParentLookup proc_parent_lookup(std::filesystem::path proc_root) {
        return [proc_root = std::move(proc_root)](int64_t pid) { return read_parent_pid(pid, proc_root); };
    }

    std::vector<uint64_t> match_process_ancestry(int64_t pid, const std::vector<SnapshotWindow>& windows, const ParentLookup& parent_of, bool debug_logging) {
        std::unordered_map<int64_t, const Window*> by_pid;
        for (const auto& entry : windows) {
            if (entry.window.pid) {
                by_pid.insert_or_assign(*entry.window.pid, &entry.window);
            }
        }

        std::vector<uint64_t> marked;
        int64_t               current = pid;
        while (true) {
            if (const auto it = by_pid.find(current); it != by_pid.end() && !it->second->is_focused) {
                marked.push_back(it->second->id);
            }
            const auto parent = parent_of(current);
            if (!parent) {
                debug_log(debug_logging, "notification ancestry", format_process_error(parent.error()));
                break;
            }
            if (!*parent) {
                break;
            }
            current = **parent;
        }
        return marked;
    }

    bool fuzzy_app_id_match(std::string_view app_id, std::string_view desktop_entry) {
        if (equals_ignore_case(app_id, desktop_entry)) {
            return true;
        }
        if (app_id.find('.') == std::string_view::npos) {
            return false;
        }
        const auto segment = last_dot_segment(app_id);
        return !segment.empty() && equals_ignore_case(segment, last_dot_segment(desktop_entry));
    }

    CorrelationResult match_desktop_entry(std::string_view desktop_entry, const std::vector<SnapshotWindow>& windows, const CorrelationOptions& options) {
        std::string mapped(desktop_entry);
        if (const auto it = options.app_id_map.find(mapped); it != options.app_id_map.end()) {
            mapped = it->second;
        }

        std::vector<uint64_t> exact;
        std::vector<uint64_t> fuzzy;
        for (const auto& entry : windows) {
            if (!entry.window.app_id) {
                continue;
            }
            const auto& app_id = *entry.window.app_id;
            if (app_id == mapped) {
                exact.push_back(entry.window.id);
            } else if (options.use_fuzzy_matching && fuzzy_app_id_match(app_id, mapped)) {
                fuzzy.push_back(entry.window.id);
            }
        }

        if (!exact.empty()) {
            return CorrelationResult{.rule = MatchRule::kDesktopEntry, .window_ids = std::move(exact)};
        }
        if (!fuzzy.empty()) {
            return CorrelationResult{.rule = MatchRule::kFuzzyDesktopEntry, .window_ids = std::move(fuzzy)};
        }
        return {};
    }

    CorrelationResult correlate_notification(const EnrichedNotification& notification, const std::optional<Snapshot>& snapshot, const CorrelationOptions& options,
                                             const ParentLookup& parent_of) {
        if (!snapshot) {
            debug_log(options.debug_logging, "notification", "no window snapshot yet; dropping");
            return {};
        }

        if (const auto pid = notification.pid(); pid && parent_of) {
            auto marked = match_process_ancestry(*pid, snapshot->windows, parent_of, options.debug_logging);
            if (!marked.empty()) {
                return CorrelationResult{.rule = MatchRule::kProcessAncestry, .window_ids = std::move(marked)};
            }
        }

        if (!options.use_desktop_entry) {
            return {};
        }
        const auto& desktop_entry = notification.notification.hints.desktop_entry;
        if (!desktop_entry || desktop_entry->empty()) {
            return {};
        }
        return match_desktop_entry(*desktop_entry, snapshot->windows, options);
    }

} // namespace niritaskbar
