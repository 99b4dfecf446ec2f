#pragma once

#include <core/constant/transfer.h>
#include <nlohmann/json.hpp>

namespace shuttle::core::feedback {

struct NotificationStopped {
    TransferId id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(NotificationStopped, id);
};

} // namespace shuttle::core::feedback
