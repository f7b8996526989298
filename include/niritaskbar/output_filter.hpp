#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "niritaskbar/types.hpp"

namespace niritaskbar {

    // Decides whether windows on a given output belong in this bar.
    class OutputFilter {
      public:
        static OutputFilter show_all() {
            return OutputFilter(std::nullopt);
        }
        static OutputFilter only(std::string output) {
            return OutputFilter(std::move(output));
        }

        bool                        should_show(std::optional<std::string_view> output) const;
        std::vector<SnapshotWindow> visible_windows(const Snapshot& snapshot) const;

      private:
        explicit OutputFilter(std::optional<std::string> only) : only_(std::move(only)) {}

        std::optional<std::string> only_;
    };

}
