#include <algorithm>
#include <core/constant/transfer.h>
#include <core/transfer/simulated_transfer.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace shuttle::core {

SimulatedTransfer::SimulatedTransfer(Options options)
    : options_(std::move(options)) {
    options_.progress_step = std::max(options_.progress_step, 1);
}

void SimulatedTransfer::SetEventHandler(EventHandler handler) {
    handler_ = std::move(handler);
}

void SimulatedTransfer::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

bool SimulatedTransfer::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

void SimulatedTransfer::emit(TransferEvent&& event) {
    if (handler_) {
        handler_(std::move(event));
    }
}

bool SimulatedTransfer::waitStep() {
    std::unique_lock<std::mutex> lock(mutex_);
    return !stop_cv_.wait_for(lock, options_.step_interval, [this] { return stop_requested_; });
}

void SimulatedTransfer::Run() {
    spdlog::debug("SimulatedTransfer::Run with {}", options_.remote_device_name);

    if (options_.direction == TransferDirection::kSend) {
        if (!waitStep()) {
            emit(event::Error{"Transfer stopped"});
            emit(event::Finish{});
            return;
        }
        emit(event::Connect{});
    }
    emit(event::TransferHeader{options_.item_count});

    int reported = -1;
    for (int progress = 0; progress <= transfer::kMaxProgress; progress += options_.progress_step) {
        if (options_.fail_at_progress && progress >= *options_.fail_at_progress) {
            emit(event::Error{options_.error_message});
            emit(event::Finish{});
            return;
        }
        emit(event::Progress{progress});
        reported = progress;
        if (!waitStep()) {
            emit(event::Error{"Transfer stopped"});
            emit(event::Finish{});
            return;
        }
    }
    if (reported != transfer::kMaxProgress) {
        emit(event::Progress{transfer::kMaxProgress});
    }
    emit(event::Success{});
    emit(event::Finish{});
}

} // namespace shuttle::core
