#pragma once

#include <chrono>
#include <condition_variable>
#include <core/transfer/transfer.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace shuttle::core {

// Transfer engine stand-in producing a realistic event sequence without any I/O.
// Honours Stop() by reporting an error and finishing at the next progress step.
class SimulatedTransfer : public Transfer {
public:
    struct Options {
        TransferDirection direction = TransferDirection::kSend;
        std::string remote_device_name;
        std::uint64_t item_count = 1;
        int progress_step = 5;
        std::chrono::milliseconds step_interval{100};
        std::optional<int> fail_at_progress; // report error_message once progress reaches it
        std::string error_message = "connection reset";
    };

    explicit SimulatedTransfer(Options options);

    TransferDirection direction() const override { return options_.direction; }
    std::string remote_device_name() const override { return options_.remote_device_name; }

    void SetEventHandler(EventHandler handler) override;
    void Run() override;
    void Stop() override;

    bool stop_requested() const;

private:
    void emit(TransferEvent&& event);

    // Sleeps for one step, returns false if a stop was requested meanwhile
    bool waitStep();

    Options options_;
    EventHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
};

} // namespace shuttle::core
