#include <core/transfer/transfer_coordinator.h>
#include <core/transfer/transfer_service.h>
#include <exception>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace shuttle::core {

TransferService::TransferService(boost::asio::io_context& ioc,
                                 NotificationSurface& surface,
                                 SoundPreferenceFunc sound_preference,
                                 std::chrono::milliseconds progress_throttle_interval)
    : ioc_(ioc)
    , surface_(surface)
    , sound_preference_(std::move(sound_preference))
    , progress_throttle_interval_(progress_throttle_interval) {}

TransferService::~TransferService() {
    StopAll();
    Join();
    waitForCoordinators();
}

TransferId TransferService::StartTransfer(std::unique_ptr<Transfer> transfer) {
    auto coordinator = TransferCoordinator::Create(*this, std::move(transfer));
    if (!coordinator) {
        return kInvalidTransferId;
    }

    ReapFinishedWorkers();

    try {
        auto returned = std::make_shared<std::atomic<bool>>(false);
        auto thread = coordinator->Launch([returned] { returned->store(true); });
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace(coordinator->id(), Worker{std::move(thread), std::move(returned)});
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start thread for transfer #{}: {}", coordinator->id(), e.what());
        // The transfer never ran, retire it the way a finished one is retired
        registry_.Remove(coordinator->id());
        try {
            surface_.Stop(coordinator->id());
        } catch (const std::exception& stop_error) {
            spdlog::error("Failed to stop notification #{}: {}", coordinator->id(), stop_error.what());
        }
        return kInvalidTransferId;
    }
    return coordinator->id();
}

void TransferService::StopTransfer(TransferId id) {
    registry_.RequestStop(id);
}

void TransferService::StopAll() {
    for (auto id : registry_.ActiveIds()) {
        registry_.RequestStop(id);
    }
}

void TransferService::Join() {
    std::unordered_map<TransferId, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    if (!workers.empty()) {
        spdlog::debug("Joined {} transfer threads", workers.size());
    }
}

std::size_t TransferService::ReapFinishedWorkers() {
    std::vector<std::thread> finished;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second.returned->load()) {
                finished.push_back(std::move(it->second.thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        remaining = workers_.size();
    }
    // Run() has returned, so these joins only wait for the thread to exit
    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    return remaining;
}

std::size_t TransferService::WorkerCount() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

bool TransferService::SoundEnabled() const {
    if (!sound_preference_) {
        return false;
    }
    try {
        return sound_preference_();
    } catch (const std::exception& e) {
        spdlog::error("Failed to read the notification sound preference: {}", e.what());
        return false;
    }
}

void TransferService::coordinatorAttached() {
    std::lock_guard<std::mutex> lock(coordinators_mutex_);
    ++live_coordinators_;
}

void TransferService::coordinatorReleased() {
    // Notified under the lock, the service may be destroyed as soon as it is released
    std::lock_guard<std::mutex> lock(coordinators_mutex_);
    --live_coordinators_;
    coordinators_released_.notify_all();
}

void TransferService::waitForCoordinators() {
    std::unique_lock<std::mutex> lock(coordinators_mutex_);
    if (live_coordinators_ > 0) {
        spdlog::debug("Waiting for {} transfers to be released", live_coordinators_);
    }
    coordinators_released_.wait(lock, [this] { return live_coordinators_ == 0; });
}

} // namespace shuttle::core
