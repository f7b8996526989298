#include "niritaskbar/process.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>

namespace niritaskbar {

    namespace {

        std::string_view kind_label(ProcessErrorKind kind) {
            switch (kind) {
                case ProcessErrorKind::kNotFound: return "not found";
                case ProcessErrorKind::kUnreadable: return "unreadable";
                case ProcessErrorKind::kMalformed: return "malformed";
                case ProcessErrorKind::kInvalidNumber: return "invalid parent pid";
            }
            return "error";
        }

        std::string_view next_field(std::string_view& rest) {
            constexpr std::string_view kWhitespace = " \t\n\r\f\v";
            const auto                 start       = rest.find_first_not_of(kWhitespace);
            if (start == std::string_view::npos) {
                rest = {};
                return {};
            }
            rest            = rest.substr(start);
            const auto end  = rest.find_first_of(kWhitespace);
            const auto text = rest.substr(0, end);
            rest            = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
            return text;
        }

    } // namespace

    std::string format_process_error(const ProcessError& error) {
        std::string text = "/proc/" + std::to_string(error.pid) + "/stat ";
        text.append(kind_label(error.kind));
        if (!error.detail.empty()) {
            text.append(": ");
            text.append(error.detail);
        }
        return text;
    }

    ParentPidResult parse_parent_pid(std::string_view stat, int64_t pid) {
        // proc_pid_stat(5): pid (comm) state ppid ...
        // comm may contain spaces, so count fields from its closing parenthesis.
        std::string_view rest   = stat;
        int              fields = 4;
        if (const auto close = stat.rfind(')'); close != std::string_view::npos) {
            rest   = stat.substr(close + 1);
            fields = 2;
        }
        std::string_view field;
        for (int index = 0; index < fields; ++index) {
            field = next_field(rest);
            if (field.empty()) {
                return std::unexpected(ProcessError{.kind = ProcessErrorKind::kMalformed, .pid = pid, .detail = "insufficient fields"});
            }
        }

        int64_t    parent = 0;
        const auto result = std::from_chars(field.data(), field.data() + field.size(), parent);
        if (result.ec != std::errc{} || result.ptr != field.data() + field.size()) {
            return std::unexpected(ProcessError{.kind = ProcessErrorKind::kInvalidNumber, .pid = pid, .detail = std::string(field)});
        }
        if (parent == 0) {
            return std::optional<int64_t>{};
        }
        return std::optional<int64_t>{parent};
    }

    ParentPidResult read_parent_pid(int64_t pid, const std::filesystem::path& proc_root) {
        const auto      path = proc_root / std::to_string(pid) / "stat";
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::unexpected(ProcessError{.kind = ProcessErrorKind::kNotFound, .pid = pid, .detail = {}});
        }
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(ProcessError{.kind = ProcessErrorKind::kUnreadable, .pid = pid, .detail = "not a regular file"});
        }
        std::ifstream input(path, std::ios::binary);
        if (!input.good()) {
            return std::unexpected(ProcessError{.kind = ProcessErrorKind::kUnreadable, .pid = pid, .detail = "cannot open"});
        }
        std::string stat((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        if (input.bad()) {
            return std::unexpected(ProcessError{.kind = ProcessErrorKind::kUnreadable, .pid = pid, .detail = "read failed"});
        }
        return parse_parent_pid(stat, pid);
    }

} // namespace niritaskbar
