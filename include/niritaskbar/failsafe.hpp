#ifndef NIRITASKBAR_FAILSAFE_HPP
#define NIRITASKBAR_FAILSAFE_HPP

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace niritaskbar::failsafe {

    // Runs fn and returns a description of anything it threw, or nullopt on success.
    template <typename F>
    [[nodiscard]] std::optional<std::string> capture(F&& fn) {
        try {
            std::forward<F>(fn)();
            return std::nullopt;
        } catch (const std::exception& ex) { return std::string(ex.what()); } catch (...) {
            return std::string("unknown exception");
        }
    }

} // namespace niritaskbar::failsafe

#endif // NIRITASKBAR_FAILSAFE_HPP
