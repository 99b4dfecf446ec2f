#pragma once

#include <core/constant/transfer.h>
#include <nlohmann/json.hpp>

namespace shuttle::ipc::operation {

struct StopTransfer {
    core::TransferId transfer_id; // id of the live notification / transfer

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(StopTransfer, transfer_id);
};

} // namespace shuttle::ipc::operation
