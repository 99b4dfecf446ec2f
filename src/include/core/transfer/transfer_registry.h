#pragma once

#include <core/constant/transfer.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shuttle::core {

class TransferCoordinator;

// Active transfers by identity. Only lookup and membership are guarded here,
// coordinators protect their own state.
class TransferRegistry {
public:
    TransferRegistry() = default;
    ~TransferRegistry() = default;
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // Returns false if the identity is already registered
    bool Register(TransferId id, std::shared_ptr<TransferCoordinator> coordinator);

    // Forwards a cooperative stop to the transfer, unknown identities are ignored.
    // The transfer is stopped outside the lock, so it may call back into the registry.
    void RequestStop(TransferId id);

    // Returns false if the identity was not registered
    bool Remove(TransferId id);

    bool Contains(TransferId id) const;
    std::size_t size() const;
    std::vector<TransferId> ActiveIds() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<TransferId, std::shared_ptr<TransferCoordinator>> transfers_;
};

} // namespace shuttle::core
