#pragma once

#include <core/constant/transfer.h>
#include <core/model/notification_state.h>

namespace shuttle::core {

// Renders notifications. Calls for one id arrive in order, calls for different ids may
// arrive concurrently.
class NotificationSurface {
public:
    virtual ~NotificationSurface() = default;

    virtual void Start(TransferId id, const NotificationState& state) = 0;
    virtual void Update(TransferId id, const NotificationState& state) = 0;
    virtual void Stop(TransferId id) = 0;
};

} // namespace shuttle::core
