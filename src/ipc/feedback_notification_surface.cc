#include <core/model/feedback.h>
#include <ipc/feedback_notification_surface.h>
#include <spdlog/spdlog.h>

namespace shuttle::ipc {

using core::Feedback;
using core::FeedbackType;

void FeedbackNotificationSurface::Start(core::TransferId id, const core::NotificationState& state) {
    spdlog::debug("Notification #{} started: {}", id, state.body);
    event_stream_.PostFeedback(Feedback{
        .type = FeedbackType::kNotificationStarted,
        .data = core::feedback::NotificationPosted{.id = id, .state = state},
    });
}

void FeedbackNotificationSurface::Update(core::TransferId id, const core::NotificationState& state) {
    spdlog::debug("Notification #{} updated: {}", id, state.body);
    event_stream_.PostFeedback(Feedback{
        .type = FeedbackType::kNotificationUpdated,
        .data = core::feedback::NotificationPosted{.id = id, .state = state},
    });
}

void FeedbackNotificationSurface::Stop(core::TransferId id) {
    spdlog::debug("Notification #{} stopped", id);
    event_stream_.PostFeedback(Feedback{
        .type = FeedbackType::kNotificationStopped,
        .data = core::feedback::NotificationStopped{.id = id},
    });
}

} // namespace shuttle::ipc
