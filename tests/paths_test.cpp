#include <gtest/gtest.h>

#include "niritaskbar/paths.hpp"

TEST(Paths, PrefersXdgDirectories) {
    const niritaskbar::EnvConfig env{
        .home            = "/home/ada",
        .xdg_config_home = "/cfg",
        .xdg_runtime_dir = "/run/user/1000",
        .niri_socket     = "/run/user/1000/niri.sock",
    };

    const auto paths = niritaskbar::try_resolve_paths(env);

    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->config_path, "/cfg/niri-taskbar/config.json");
    EXPECT_EQ(paths->update_socket_path, "/run/user/1000/niri-taskbar/updates.sock");
    EXPECT_EQ(paths->niri_socket, "/run/user/1000/niri.sock");
    EXPECT_EQ(paths->proc_root, "/proc");
}

TEST(Paths, FallsBackToHomeConfig) {
    const niritaskbar::EnvConfig env{.home = "/home/ada", .xdg_config_home = std::nullopt, .xdg_runtime_dir = "/run/user/1000", .niri_socket = std::nullopt};

    const auto paths = niritaskbar::try_resolve_paths(env);

    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->config_path, "/home/ada/.config/niri-taskbar/config.json");
    EXPECT_FALSE(paths->niri_socket.has_value());
}

TEST(Paths, FallsBackToTempForRuntimeDir) {
    const niritaskbar::EnvConfig env{.home = "/home/ada", .xdg_config_home = std::nullopt, .xdg_runtime_dir = std::nullopt, .niri_socket = std::nullopt};

    const auto paths = niritaskbar::try_resolve_paths(env);

    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->update_socket_path.filename(), "updates.sock");
    EXPECT_TRUE(paths->update_socket_path.parent_path().parent_path().filename().string().starts_with("niri-taskbar-"));
}

TEST(Paths, FailsWithoutHomeOrConfigDir) {
    const niritaskbar::EnvConfig env{};

    EXPECT_FALSE(niritaskbar::try_resolve_paths(env).has_value());
}
