#pragma once

#include <core/util/config.h>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace shuttle::core::feedback {

struct Settings {
    bool notification_sound;
    std::int64_t progress_throttle_ms;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Settings, notification_sound, progress_throttle_ms);

    static Settings FromConfigSettings() {
        return Settings{
            .notification_sound = core::settings.notification_sound,
            .progress_throttle_ms = core::settings.progress_throttle_interval.count(),
        };
    }
};

} // namespace shuttle::core::feedback
