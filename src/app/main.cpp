#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QMetaObject>
#include <QSocketNotifier>

#include "niritaskbar/config.hpp"
#include "niritaskbar/connection_cache.hpp"
#include "niritaskbar/dbus/qt_bus.hpp"
#include "niritaskbar/file_descriptor.hpp"
#include "niritaskbar/logging.hpp"
#include "niritaskbar/niri_socket.hpp"
#include "niritaskbar/notification_stream.hpp"
#include "niritaskbar/output_filter.hpp"
#include "niritaskbar/paths.hpp"
#include "niritaskbar/taskbar.hpp"
#include "niritaskbar/update_json.hpp"
#include "niritaskbar/update_socket.hpp"
#include "niritaskbar/window_stream.hpp"

namespace {

    using namespace niritaskbar;

    std::mutex g_output_mutex;
    int        g_signal_write_fd = -1;

    void       stderr_sink(std::string_view message) {
        std::lock_guard lock(g_output_mutex);
        std::fwrite(message.data(), 1, message.size(), stderr);
        std::fputc('\n', stderr);
    }

    void write_stdout_line(std::string_view line) {
        std::lock_guard lock(g_output_mutex);
        std::fwrite(line.data(), 1, line.size(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
    }

    void handle_signal(int) {
        const char byte = 1;
        if (g_signal_write_fd >= 0) {
            [[maybe_unused]] const auto written = ::write(g_signal_write_fd, &byte, 1);
        }
    }

    std::optional<uint64_t> parse_window_id(const QString& text) {
        const std::string value = text.toStdString();
        uint64_t          id    = 0;
        const auto [ptr, ec]    = std::from_chars(value.data(), value.data() + value.size(), id);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return id;
    }

    int activate(NiriClient& client, const QString& text) {
        const auto id = parse_window_id(text);
        if (!id) {
            error_log("activate", "invalid window id: " + text.toStdString());
            return 1;
        }
        if (const auto result = client.activate_window(*id); !result) {
            error_log("activate", format_niri_error(result.error()));
            return 1;
        }
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("niri-taskbar-monitor"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Taskbar state monitor for the niri compositor"));
    parser.addHelpOption();
    const QCommandLineOption config_option(QStringList{QStringLiteral("c"), QStringLiteral("config")}, QStringLiteral("Read configuration from <path>."), QStringLiteral("path"));
    const QCommandLineOption socket_option(QStringList{QStringLiteral("s"), QStringLiteral("socket")}, QStringLiteral("Serve updates on the Unix socket <path>."), QStringLiteral("path"));
    const QCommandLineOption output_option(QStringList{QStringLiteral("o"), QStringLiteral("output")}, QStringLiteral("Only report windows on output <name>."), QStringLiteral("name"));
    const QCommandLineOption debug_option(QStringLiteral("debug"), QStringLiteral("Enable debug logging."));
    const QCommandLineOption notifications_option(QStringLiteral("notifications"), QStringLiteral("Watch desktop notifications even if the configuration disables them."));
    const QCommandLineOption no_notifications_option(QStringLiteral("no-notifications"), QStringLiteral("Do not watch desktop notifications."));
    const QCommandLineOption activate_option(QStringLiteral("activate"), QStringLiteral("Focus window <id> and exit."), QStringLiteral("id"));
    parser.addOptions({config_option, socket_option, output_option, debug_option, notifications_option, no_notifications_option, activate_option});
    parser.process(app);

    set_warn_log_sink(&stderr_sink);
    set_error_log_sink(&stderr_sink);
    set_debug_log_sink(&stderr_sink);

    const auto paths = try_resolve_paths_from_env();
    if (!paths) {
        error_log("startup", "unable to resolve paths; set HOME or XDG_CONFIG_HOME");
        return 1;
    }
    if (!paths->niri_socket) {
        error_log("startup", "NIRI_SOCKET is not set");
        return 1;
    }

    NiriClient client(socket_connector(*paths->niri_socket));
    if (parser.isSet(activate_option)) {
        return activate(client, parser.value(activate_option));
    }

    const auto config_path = parser.isSet(config_option) ? std::filesystem::path(parser.value(config_option).toStdString()) : paths->config_path;
    auto       loaded      = load_config(config_path);
    if (!loaded) {
        error_log("config", format_config_error(loaded.error()));
        return 1;
    }
    ConfigOverrides overrides;
    if (parser.isSet(debug_option)) {
        overrides.debug_logging = true;
    }
    if (parser.isSet(output_option)) {
        overrides.output = parser.value(output_option).toStdString();
    }
    if (parser.isSet(notifications_option) && parser.isSet(no_notifications_option)) {
        error_log("startup", "--notifications and --no-notifications are mutually exclusive");
        return 1;
    }
    if (parser.isSet(notifications_option)) {
        overrides.notifications_enabled = true;
    } else if (parser.isSet(no_notifications_option)) {
        overrides.notifications_enabled = false;
    }
    const Config config = apply_overrides(*loaded, overrides);
    const bool   debug  = config.debug_logging;
    debug_log(debug, "startup", "configuration from " + config_path.string());

    const OutputFilter filter      = config.output ? OutputFilter::only(*config.output) : OutputFilter::show_all();
    const auto         socket_path = parser.isSet(socket_option) ? std::filesystem::path(parser.value(socket_option).toStdString()) : paths->update_socket_path;
    UpdateSocketServer server(socket_path);
    if (const auto error = server.start()) {
        warn_log("update socket", *error + "; updates go to stdout only");
    }

    Taskbar taskbar(TaskbarState(config.notifications.enabled, correlation_options(config), proc_parent_lookup(paths->proc_root)), client, [&](const TaskbarUpdate& update) {
        const auto line = render_update_json(update, config, filter);
        write_stdout_line(line);
        server.broadcast(line);
    });

    dbus::QtBusIntrospector introspector;
    ConnectionCache         cache(introspector,
                                  ConnectionCacheOptions{
                                      .ttl            = config.cache_ttl,
                                      .sweep_interval = config.cache_sweep,
                                      .clock          = {},
                                      .debug_logging  = debug,
                          });
    NotificationStream      notifications([&cache](std::string_view peer) { return cache.get(peer); }, [&taskbar](EnrichedNotification notification) { return taskbar.post(std::move(notification)); }, debug);
    dbus::NameOwnerWatcher  owners([&cache](NameOwnerChange change) { cache.name_owner_changed(std::move(change)); });
    dbus::NotificationMonitor monitor(
        [&notifications](RawNotification raw) {
            if (!notifications.push(std::move(raw))) {
                warn_log("notification monitor", "notification stream closed; dropping notification");
            }
        },
        debug);
    if (config.notifications.enabled) {
        if (const auto result = owners.start(); !result) {
            error_log("startup", format_bus_error(result.error()));
        }
        if (const auto result = monitor.start(); !result) {
            error_log("startup", format_bus_error(result.error()) + "; notifications disabled");
        }
    }

    WindowStream windows(
        client, [&taskbar](Snapshot snapshot) { return taskbar.post(std::move(snapshot)); }, debug,
        [] { QMetaObject::invokeMethod(QCoreApplication::instance(), [] { QCoreApplication::exit(1); }, Qt::QueuedConnection); });

    int signal_pipe[2] = {-1, -1};
    if (::pipe2(signal_pipe, O_CLOEXEC | O_NONBLOCK) < 0) {
        error_log("startup", "unable to create signal pipe");
        return 1;
    }
    FileDescriptor signal_read(signal_pipe[0]);
    FileDescriptor signal_write(signal_pipe[1]);
    g_signal_write_fd = signal_write.get();
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    QSocketNotifier signal_notifier(signal_read.get(), QSocketNotifier::Read);
    QObject::connect(&signal_notifier, &QSocketNotifier::activated, &app, [] { QCoreApplication::quit(); });

    taskbar.start();
    windows.start();
    const int status = app.exec();

    monitor.stop();
    owners.stop();
    windows.stop();
    notifications.stop();
    taskbar.stop();
    server.stop();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_write_fd = -1;
    return status;
}
