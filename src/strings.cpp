#include "niritaskbar/strings.hpp"

#include <algorithm>
#include <cctype>

namespace niritaskbar {

    namespace {

        char lower(char ch) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }

    } // namespace

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return lower(a) == lower(b); });
    }

    std::string_view last_dot_segment(std::string_view value) {
        const auto dot = value.rfind('.');
        if (dot == std::string_view::npos) {
            return value;
        }
        return value.substr(dot + 1);
    }

}
