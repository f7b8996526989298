#ifndef NIRITASKBAR_NOTIFICATION_CORRELATOR_HPP
#define NIRITASKBAR_NOTIFICATION_CORRELATOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "niritaskbar/notification.hpp"
#include "niritaskbar/process.hpp"
#include "niritaskbar/types.hpp"

namespace niritaskbar {

    struct CorrelationOptions {
        bool                                         use_desktop_entry  = true;
        bool                                         use_fuzzy_matching = false;
        std::unordered_map<std::string, std::string> app_id_map;
        bool                                         debug_logging = false;
    };

    using ParentLookup = std::function<ParentPidResult(int64_t pid)>;

    ParentLookup proc_parent_lookup(std::filesystem::path proc_root);

    enum class MatchRule {
        kNone,
        kProcessAncestry,
        kDesktopEntry,
        kFuzzyDesktopEntry,
    };

    std::string_view match_rule_name(MatchRule rule);

    struct CorrelationResult {
        MatchRule             rule = MatchRule::kNone;
        std::vector<uint64_t> window_ids;
    };

    // Walks from pid up the process tree, collecting unfocused windows owned by any ancestor.
    std::vector<uint64_t> match_process_ancestry(int64_t pid, const std::vector<SnapshotWindow>& windows, const ParentLookup& parent_of, bool debug_logging = false);

    // Matches the (remapped) desktop entry against window app ids; exact matches beat fuzzy ones.
    CorrelationResult     match_desktop_entry(std::string_view desktop_entry, const std::vector<SnapshotWindow>& windows, const CorrelationOptions& options);

    bool                  fuzzy_app_id_match(std::string_view app_id, std::string_view desktop_entry);

    // Applies the rules in priority order and stops at the first one that marks a window.
    CorrelationResult     correlate_notification(const EnrichedNotification& notification, const std::optional<Snapshot>& snapshot, const CorrelationOptions& options,
                                                 const ParentLookup& parent_of);

} // namespace niritaskbar

#endif // NIRITASKBAR_NOTIFICATION_CORRELATOR_HPP
