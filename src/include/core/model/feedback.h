#pragma once

#include "feedback/feedback.h"
#include "feedback/feedback_type.h"
#include "feedback/notification_posted.h"
#include "feedback/notification_stopped.h"
#include "feedback/settings.h"
#include <functional>

namespace shuttle::core {

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace shuttle::core
