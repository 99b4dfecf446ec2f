#pragma once

#include <core/constant/transfer.h>
#include <core/model/notification_state.h>
#include <core/model/transfer_direction.h>
#include <core/model/transfer_phase.h>
#include <optional>
#include <string_view>

namespace shuttle::core {

struct NotificationInput {
    TransferId transfer_id = kInvalidTransferId;
    TransferDirection direction = TransferDirection::kSend;
    TransferPhase phase = TransferPhase::kCreated;
    std::string_view remote_device_name;
    std::optional<int> progress;  // empty for an indeterminate progress bar
    bool done = false;            // terminal notification
    bool sound_enabled = false;   // user preference, only honoured when done
    std::string_view error_message;
};

NotificationIcon SelectIcon(TransferDirection direction, bool done);

NotificationState BuildNotificationState(const NotificationInput& input);

} // namespace shuttle::core
