#pragma once

#include <core/constant/transfer.h>
#include <core/model/notification_state.h>
#include <nlohmann/json.hpp>

namespace shuttle::core::feedback {

struct NotificationPosted {
    TransferId id;
    NotificationState state;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(NotificationPosted, id, state);
};

} // namespace shuttle::core::feedback
