#include "niritaskbar/output_filter.hpp"

namespace niritaskbar {

    bool OutputFilter::should_show(std::optional<std::string_view> output) const {
        if (!only_) {
            return true;
        }
        return output && *output == *only_;
    }

    std::vector<SnapshotWindow> OutputFilter::visible_windows(const Snapshot& snapshot) const {
        std::vector<SnapshotWindow> visible;
        for (const auto& entry : snapshot.windows) {
            const auto output = entry.output ? std::optional<std::string_view>(*entry.output) : std::nullopt;
            if (should_show(output)) {
                visible.push_back(entry);
            }
        }
        return visible;
    }

}
