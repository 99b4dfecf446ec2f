#pragma once

#include <core/transfer/notification_surface.h>
#include <ipc/ipc_event_stream.h>

namespace shuttle::ipc {

// Forwards notification calls to the frontend as Notification* feedback
class FeedbackNotificationSurface : public core::NotificationSurface {
public:
    explicit FeedbackNotificationSurface(IpcEventStream& event_stream)
        : event_stream_(event_stream) {}

    void Start(core::TransferId id, const core::NotificationState& state) override;
    void Update(core::TransferId id, const core::NotificationState& state) override;
    void Stop(core::TransferId id) override;

private:
    IpcEventStream& event_stream_;
};

} // namespace shuttle::ipc
