#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/notification_state.h>
#include <core/model/transfer_direction.h>
#include <core/model/transfer_event.h>
#include <core/model/transfer_phase.h>
#include <core/transfer/transfer.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace shuttle::core {

class TransferService;

/**
 * @brief Drives one transfer and keeps its notification in sync with its lifecycle.
 *
 * @details Events raised by the transfer are posted to a per transfer strand, so they are
 * handled one at a time and in the order they were raised. Every notification call for
 * this transfer is made from that strand as well.
 *
 * The live notification uses the transfer id. Success and error are announced under a
 * freshly allocated id, so the result stays visible after the live notification is
 * retired on Finish.
 */
class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator> {
public:
    // Subscribes to the transfer, registers it and shows the live notification.
    // Returns nullptr if the transfer could not be registered.
    static std::shared_ptr<TransferCoordinator> Create(TransferService& service,
                                                       std::unique_ptr<Transfer> transfer);

    ~TransferCoordinator();
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Starts Transfer::Run() on a new thread, the caller owns the thread.
    // on_returned is invoked on that thread once Run() has returned.
    std::thread Launch(std::function<void()> on_returned = nullptr);

    void RequestStop();

    TransferId id() const { return id_; }
    TransferDirection direction() const { return direction_; }
    const std::string& remote_device_name() const { return remote_device_name_; }
    TransferPhase phase() const { return phase_.load(); }

private:
    TransferCoordinator(TransferService& service, std::unique_ptr<Transfer> transfer);

    using Clock = std::chrono::steady_clock;

    // Called on the transfer thread, hands the event over to the strand
    void post(TransferEvent&& event);

    void execute();

    void handleEvent(const TransferEvent& event);
    void onEvent(const event::Connect& event);
    void onEvent(const event::TransferHeader& event);
    void onEvent(const event::Progress& event);
    void onEvent(const event::Success& event);
    void onEvent(const event::Error& event);
    void onEvent(const event::Finish& event);

    void publishProgress(Clock::time_point now);
    void flushProgress();
    void cancelPendingProgress();

    NotificationState buildLiveState() const;
    void publishLive();
    void publishTerminal(std::string_view error_message = {});

    template<typename Fn>
    void notify(std::string_view action, TransferId notification_id, Fn&& fn);

    TransferService& service_;
    std::unique_ptr<Transfer> transfer_;
    const TransferId id_;
    const TransferDirection direction_;
    const std::string remote_device_name_;

    std::atomic<TransferPhase> phase_{TransferPhase::kCreated};
    std::atomic<bool> finish_raised_{false};

    // Owned by the strand
    std::optional<int> progress_;
    std::optional<Clock::time_point> last_progress_publish_;
    bool progress_pending_{false};

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer progress_timer_;
};

} // namespace shuttle::core
