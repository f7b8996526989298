#pragma once

#include <string>
#include <string_view>

namespace niritaskbar {

    std::string_view trim_view(std::string_view value);
    std::string      trim_copy(std::string_view value);
    bool             equals_ignore_case(std::string_view lhs, std::string_view rhs);

    // Text after the final '.', or the whole value when there is none.
    std::string_view last_dot_segment(std::string_view value);

}
