/*
    config.h
    Application configuration stored in a TOML file.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = shuttle::core::config["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        bool sound = shuttle::core::settings.notification_sound;
        auto interval = shuttle::core::settings.progress_throttle_interval;
    - Write a setting:
        shuttle::core::settings.notification_sound = true;

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        shuttle::core::InitConfig();
    - Save the current configuration to file:
        shuttle::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <filesystem>
#include <toml++/toml.h>

namespace shuttle::core {

inline toml::table config;

struct Settings {
    bool notification_sound = false; // Play a sound on terminal transfer notifications
    std::chrono::milliseconds progress_throttle_interval = transfer::kProgressThrottleInterval;
};

inline Settings settings;

void InitConfig();

// Loads settings from an explicit file, used by InitConfig and tests
void LoadConfig(const std::filesystem::path& path);

void SaveConfig();

} // namespace shuttle::core
