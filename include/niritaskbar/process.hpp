#ifndef NIRITASKBAR_PROCESS_HPP
#define NIRITASKBAR_PROCESS_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace niritaskbar {

    enum class ProcessErrorKind {
        kNotFound,
        kUnreadable,
        kMalformed,
        kInvalidNumber,
    };

    struct ProcessError {
        ProcessErrorKind kind;
        int64_t          pid;
        std::string      detail;
    };

    std::string format_process_error(const ProcessError& error);

    // The parent pid, or nullopt when the process is a root or an orphan.
    using ParentPidResult = std::expected<std::optional<int64_t>, ProcessError>;

    ParentPidResult parse_parent_pid(std::string_view stat, int64_t pid);
    ParentPidResult read_parent_pid(int64_t pid, const std::filesystem::path& proc_root);

} // namespace niritaskbar

#endif // NIRITASKBAR_PROCESS_HPP
