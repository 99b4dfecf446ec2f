#include <algorithm>
#include <core/constant/notification.h>
#include <core/transfer/notification_builder.h>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace shuttle::core {

NotificationIcon SelectIcon(TransferDirection direction, bool done) {
    if (direction == TransferDirection::kReceive) {
        return done ? NotificationIcon::kDownloadDone : NotificationIcon::kDownload;
    }
    return done ? NotificationIcon::kUploadDone : NotificationIcon::kUpload;
}

static std::string statusText(const NotificationInput& input) {
    std::string_view remote = input.remote_device_name.empty() ? notification::kUnknownDevice
                                                               : input.remote_device_name;
    switch (input.phase) {
    case TransferPhase::kCreated:
    case TransferPhase::kConnecting:
        return fmt::format(fmt::runtime(input.direction == TransferDirection::kReceive
                                            ? notification::kStatusReceiving
                                            : notification::kStatusConnecting),
                           remote);
    case TransferPhase::kActive:
    case TransferPhase::kFinished:
        return fmt::format(fmt::runtime(input.direction == TransferDirection::kReceive
                                            ? notification::kStatusReceiving
                                            : notification::kStatusSending),
                           remote);
    case TransferPhase::kSucceeded:
        return fmt::format(fmt::runtime(notification::kStatusSuccess), remote);
    case TransferPhase::kFailed:
        return fmt::format(fmt::runtime(notification::kStatusError), remote, input.error_message);
    }
    return std::string(remote);
}

NotificationState BuildNotificationState(const NotificationInput& input) {
    NotificationState state;
    state.title = notification::kTitle;
    state.category = notification::kCategory;
    state.body = statusText(input);
    state.icon = SelectIcon(input.direction, input.done);
    state.play_sound = input.done && input.sound_enabled;

    if (!input.done) {
        if (input.progress) {
            state.progress = std::clamp(*input.progress, transfer::kMinProgress, transfer::kMaxProgress);
        }
        state.actions.push_back(NotificationAction{
            .label = std::string(notification::kActionStop),
            .operation = "StopTransfer",
            .transfer_id = input.transfer_id,
        });
    }
    return state;
}

} // namespace shuttle::core
