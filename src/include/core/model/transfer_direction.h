#pragma once

#include <nlohmann/json.hpp>

namespace shuttle::core {

enum class TransferDirection {
    kSend,    // local device pushes items to the remote device
    kReceive, // remote device pushes items to the local device
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferDirection,
                             {
                                 {TransferDirection::kSend, "Send"},
                                 {TransferDirection::kReceive, "Receive"},
                             });

} // namespace shuttle::core
