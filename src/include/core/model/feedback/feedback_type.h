#pragma once

#include <nlohmann/json.hpp>

namespace shuttle::core {

enum class FeedbackType {
    kSettings,             // current settings, sent once at startup
    kNotificationStarted,  // a live notification appears (id, state)
    kNotificationUpdated,  // a notification is shown or replaced (id, state)
    kNotificationStopped,  // a live notification is dismissed (id)
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kSettings, "Settings"},
                                 {FeedbackType::kNotificationStarted, "NotificationStarted"},
                                 {FeedbackType::kNotificationUpdated, "NotificationUpdated"},
                                 {FeedbackType::kNotificationStopped, "NotificationStopped"},
                             });

} // namespace shuttle::core
