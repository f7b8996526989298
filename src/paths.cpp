#include "niritaskbar/paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace niritaskbar {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        std::filesystem::path runtime_root(const EnvConfig& env) {
            if (env.xdg_runtime_dir) {
                return std::filesystem::path(*env.xdg_runtime_dir);
            }
            return std::filesystem::temp_directory_path() / ("niri-taskbar-" + std::to_string(::getuid()));
        }

    } // namespace

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        std::filesystem::path config_root;
        if (env.xdg_config_home) {
            config_root = *env.xdg_config_home;
        } else if (env.home) {
            config_root = std::filesystem::path(*env.home) / ".config";
        } else {
            return std::nullopt;
        }

        std::optional<std::filesystem::path> niri_socket;
        if (env.niri_socket) {
            niri_socket = std::filesystem::path(*env.niri_socket);
        }
        return Paths{
            .config_path        = config_root / "niri-taskbar" / "config.json",
            .update_socket_path = runtime_root(env) / "niri-taskbar" / "updates.sock",
            .niri_socket        = niri_socket,
            .proc_root          = "/proc",
        };
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        const EnvConfig env{
            .home            = get_env("HOME"),
            .xdg_config_home = get_env("XDG_CONFIG_HOME"),
            .xdg_runtime_dir = get_env("XDG_RUNTIME_DIR"),
            .niri_socket     = get_env("NIRI_SOCKET"),
        };
        return try_resolve_paths(env);
    }

} // namespace niritaskbar
