#pragma once

#include <nlohmann/json.hpp>

namespace shuttle::ipc {

enum class OperationType {
    kUnknown,        // any operation name this backend does not know
    kStopTransfer,   // stop a running transfer, provides the transfer_id
    kModifySettings, // change one setting, provides key and value
    kExitApp,        // stop every transfer and exit
};

NLOHMANN_JSON_SERIALIZE_ENUM(OperationType,
                             {
                                 {OperationType::kUnknown, nullptr},
                                 {OperationType::kStopTransfer, "StopTransfer"},
                                 {OperationType::kModifySettings, "ModifySettings"},
                                 {OperationType::kExitApp, "ExitApp"},
                             });

} // namespace shuttle::ipc
