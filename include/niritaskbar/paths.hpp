#ifndef NIRITASKBAR_PATHS_HPP
#define NIRITASKBAR_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace niritaskbar {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_runtime_dir;
        std::optional<std::string> niri_socket;
    };

    struct Paths {
        std::filesystem::path                config_path;
        std::filesystem::path                update_socket_path;
        std::optional<std::filesystem::path> niri_socket;
        std::filesystem::path                proc_root;
    };

    // nullopt when neither HOME nor XDG_CONFIG_HOME is known.
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();

} // namespace niritaskbar

#endif // NIRITASKBAR_PATHS_HPP
