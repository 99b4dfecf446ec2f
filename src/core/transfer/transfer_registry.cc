#include <core/transfer/transfer_coordinator.h>
#include <core/transfer/transfer_registry.h>
#include <spdlog/spdlog.h>

namespace shuttle::core {

bool TransferRegistry::Register(TransferId id, std::shared_ptr<TransferCoordinator> coordinator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = transfers_.try_emplace(id, std::move(coordinator));
    if (!inserted) {
        spdlog::error("Transfer #{} is already registered, ignoring the new transfer", id);
        return false;
    }
    return true;
}

void TransferRegistry::RequestStop(TransferId id) {
    std::shared_ptr<TransferCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = transfers_.find(id); it != transfers_.end()) {
            coordinator = it->second;
        }
    }
    if (!coordinator) {
        spdlog::debug("Stop requested for unknown transfer #{}, it may have finished already", id);
        return;
    }
    spdlog::info("Try to stop transfer #{}", id);
    coordinator->RequestStop();
}

bool TransferRegistry::Remove(TransferId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transfers_.erase(id) == 0) {
        spdlog::warn("Transfer #{} is not registered, nothing to remove", id);
        return false;
    }
    return true;
}

bool TransferRegistry::Contains(TransferId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.contains(id);
}

std::size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

std::vector<TransferId> TransferRegistry::ActiveIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferId> ids;
    ids.reserve(transfers_.size());
    for (const auto& [id, _] : transfers_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace shuttle::core
