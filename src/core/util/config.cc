#include <core/constant/path.h>
#include <core/util/config.h>
#include <cstdint>
#include <fstream>
#include <spdlog/spdlog.h>

namespace shuttle::core {

static void LoadSetting() {
    if (!config["setting"].is_table()) {
        config.insert_or_assign("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    settings.notification_sound = setting["notification-sound"].value_or(false);

    auto throttle_ms = setting["progress-throttle-ms"].value_or(
        static_cast<std::int64_t>(transfer::kProgressThrottleInterval.count()));
    if (throttle_ms < 0) {
        spdlog::warn("Invalid progress-throttle-ms {}, falling back to {}",
                     throttle_ms,
                     transfer::kProgressThrottleInterval.count());
        throttle_ms = transfer::kProgressThrottleInterval.count();
    }
    settings.progress_throttle_interval = std::chrono::milliseconds(throttle_ms);
}

void LoadConfig(const std::filesystem::path& path) {
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(path::kConfigDir);
    }
    auto path = path::kConfigDir / "config.toml";
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }

    LoadConfig(path);
}

void SaveConfig() {
    auto path = path::kConfigDir / "config.toml";
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"notification-sound", settings.notification_sound},
                                {"progress-throttle-ms",
                                 static_cast<std::int64_t>(
                                     settings.progress_throttle_interval.count())},
                            });
    ofs << config;
}

} // namespace shuttle::core
