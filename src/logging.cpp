#include "niritaskbar/logging.hpp"

#include <array>
#include <cstddef>
#include <string>

namespace niritaskbar {

    namespace {

        enum class Level : size_t {
            kError,
            kWarn,
            kDebug,
        };

        constexpr std::array<std::string_view, 3> kPrefixes = {"[niri-taskbar]", "[niri-taskbar][warn]", "[niri-taskbar][debug]"};

        std::array<LogSink, 3>                    g_sinks = {nullptr, nullptr, nullptr};

        LogSink&                                  sink_for(Level level) {
            return g_sinks[static_cast<size_t>(level)];
        }

        std::string entry(Level level, std::string_view context, std::string_view message) {
            const auto  prefix = kPrefixes[static_cast<size_t>(level)];
            std::string text(prefix);
            text += ' ';
            if (!context.empty()) {
                text += context;
                text += ": ";
            }
            text += message;
            return text;
        }

        // "[prefix] context: message @file.cpp:42 function"
        std::string located_entry(Level level, std::string_view context, std::string_view message, const std::source_location& location) {
            std::string_view file = location.file_name();
            if (const auto slash = file.rfind('/'); slash != std::string_view::npos) {
                file.remove_prefix(slash + 1);
            }
            auto text = entry(level, context, message);
            text += " @";
            text += file;
            text += ':';
            text += std::to_string(location.line());
            if (const std::string_view function = location.function_name(); !function.empty()) {
                text += ' ';
                text += function;
            }
            return text;
        }

        void emit(Level level, const std::string& text) {
            if (const auto sink = sink_for(level)) {
                sink(text);
            }
        }

    } // namespace

    std::string format_log_entry(std::string_view context, std::string_view message) {
        return entry(Level::kError, context, message);
    }

    std::string format_warn_entry(std::string_view context, std::string_view message) {
        return entry(Level::kWarn, context, message);
    }

    std::string format_debug_entry(std::string_view context, std::string_view message) {
        return entry(Level::kDebug, context, message);
    }

    std::string format_log_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return located_entry(Level::kError, context, message, location);
    }

    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location) {
        return located_entry(Level::kDebug, context, message, location);
    }

    void set_debug_log_sink(LogSink sink) {
        sink_for(Level::kDebug) = sink;
    }

    void clear_debug_log_sink() {
        sink_for(Level::kDebug) = nullptr;
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (enabled && sink_for(Level::kDebug)) {
            emit(Level::kDebug, located_entry(Level::kDebug, context, message, location));
        }
    }

    void set_warn_log_sink(LogSink sink) {
        sink_for(Level::kWarn) = sink;
    }

    void clear_warn_log_sink() {
        sink_for(Level::kWarn) = nullptr;
    }

    void warn_log(std::string_view context, std::string_view message) {
        if (sink_for(Level::kWarn)) {
            emit(Level::kWarn, entry(Level::kWarn, context, message));
        }
    }

    void set_error_log_sink(LogSink sink) {
        sink_for(Level::kError) = sink;
    }

    void clear_error_log_sink() {
        sink_for(Level::kError) = nullptr;
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        if (sink_for(Level::kError)) {
            emit(Level::kError, located_entry(Level::kError, context, message, location));
        }
    }

} // namespace niritaskbar
