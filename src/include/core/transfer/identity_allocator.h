#pragma once

#include <atomic>
#include <core/constant/transfer.h>

namespace shuttle::core {

// Hands out process unique identities for transfers and terminal notifications.
class IdentityAllocator {
public:
    IdentityAllocator() = default;
    IdentityAllocator(const IdentityAllocator&) = delete;
    IdentityAllocator& operator=(const IdentityAllocator&) = delete;

    TransferId Next() noexcept { return last_id_.fetch_add(1, std::memory_order_relaxed) + 1; }

private:
    std::atomic<TransferId> last_id_{kInvalidTransferId};
};

} // namespace shuttle::core
