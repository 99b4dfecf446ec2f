#include <algorithm>
#include <boost/asio/post.hpp>
#include <core/transfer/notification_builder.h>
#include <core/transfer/transfer_coordinator.h>
#include <core/transfer/transfer_service.h>
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>

namespace net = boost::asio;

namespace shuttle::core {

TransferCoordinator::TransferCoordinator(TransferService& service,
                                         std::unique_ptr<Transfer> transfer)
    : service_(service)
    , transfer_(std::move(transfer))
    , id_(service.identities().Next())
    , direction_(transfer_->direction())
    , remote_device_name_(transfer_->remote_device_name())
    , strand_(net::make_strand(service.io_context()))
    , progress_timer_(strand_) {
    service_.coordinatorAttached();
}

template<typename Fn>
void TransferCoordinator::notify(std::string_view action, TransferId notification_id, Fn&& fn) {
    try {
        fn(service_.surface());
    } catch (const std::exception& e) {
        spdlog::error("Failed to {} notification #{} of transfer #{}: {}",
                      action,
                      notification_id,
                      id_,
                      e.what());
    }
}

TransferCoordinator::~TransferCoordinator() {
    spdlog::debug("Transfer #{} released in phase {}", id_, TransferPhaseToString(phase_.load()));
    service_.coordinatorReleased();
}

std::shared_ptr<TransferCoordinator> TransferCoordinator::Create(TransferService& service,
                                                                 std::unique_ptr<Transfer> transfer) {
    if (!transfer) {
        spdlog::error("Cannot coordinate an empty transfer");
        return nullptr;
    }

    std::shared_ptr<TransferCoordinator> coordinator(
        new TransferCoordinator(service, std::move(transfer)));

    std::weak_ptr<TransferCoordinator> weak = coordinator;
    coordinator->transfer_->SetEventHandler([weak](TransferEvent&& event) {
        if (auto self = weak.lock(); self) {
            self->post(std::move(event));
        } else {
            spdlog::warn("Dropping {} event of a released transfer", TransferEventName(event));
        }
    });

    if (!service.registry().Register(coordinator->id_, coordinator)) {
        return nullptr;
    }

    coordinator->notify("start", coordinator->id_, [&](NotificationSurface& surface) {
        surface.Start(coordinator->id_, coordinator->buildLiveState());
    });
    spdlog::info("Created transfer #{} ({} {})",
                 coordinator->id_,
                 coordinator->direction_ == TransferDirection::kReceive ? "from" : "to",
                 coordinator->remote_device_name_);
    return coordinator;
}

std::thread TransferCoordinator::Launch(std::function<void()> on_returned) {
    phase_ = TransferPhase::kConnecting;
    return std::thread([self = shared_from_this(), on_returned = std::move(on_returned)] {
        self->execute();
        if (on_returned) {
            on_returned();
        }
    });
}

void TransferCoordinator::RequestStop() {
    try {
        transfer_->Stop();
    } catch (const std::exception& e) {
        spdlog::error("Failed to stop transfer #{}: {}", id_, e.what());
    }
}

void TransferCoordinator::post(TransferEvent&& event) {
    if (std::holds_alternative<event::Finish>(event)) {
        finish_raised_ = true;
    }
    net::post(strand_, [self = shared_from_this(), event = std::move(event)]() {
        self->handleEvent(event);
    });
}

void TransferCoordinator::execute() {
    spdlog::debug("Transfer #{} running", id_);
    try {
        transfer_->Run();
        if (!finish_raised_) {
            spdlog::warn("Transfer #{} returned without finishing", id_);
            post(event::Finish{});
        }
    } catch (const std::exception& e) {
        spdlog::error("Transfer #{} aborted: {}", id_, e.what());
        if (!finish_raised_) {
            post(event::Error{e.what()});
            post(event::Finish{});
        }
    }
    spdlog::debug("Transfer #{} returned from Run()", id_);
}

void TransferCoordinator::handleEvent(const TransferEvent& event) {
    if (phase_ == TransferPhase::kFinished) {
        spdlog::warn("Transfer #{} already finished, ignoring {} event",
                     id_,
                     TransferEventName(event));
        return;
    }
    std::visit([this](const auto& e) { onEvent(e); }, event);
}

void TransferCoordinator::onEvent(const event::Connect&) {
    if (IsTerminal(phase_)) {
        spdlog::warn("Transfer #{} connected after its outcome, ignoring", id_);
        return;
    }
    spdlog::info("Transfer #{} connected to {}", id_, remote_device_name_);
    phase_ = TransferPhase::kActive;
    publishLive();
}

void TransferCoordinator::onEvent(const event::TransferHeader& event) {
    spdlog::info("Transfer #{} contains {} items", id_, event.item_count);
    if (IsTerminal(phase_)) {
        return;
    }
    if (direction_ == TransferDirection::kReceive) {
        phase_ = TransferPhase::kActive;
        publishLive();
    }
}

void TransferCoordinator::onEvent(const event::Progress& event) {
    if (IsTerminal(phase_)) {
        spdlog::warn("Transfer #{} reported progress after its outcome, ignoring", id_);
        return;
    }
    phase_ = TransferPhase::kActive;
    progress_ = std::clamp(event.percent, transfer::kMinProgress, transfer::kMaxProgress);

    auto now = Clock::now();
    auto interval = service_.progress_throttle_interval();
    if (!last_progress_publish_ || now - *last_progress_publish_ >= interval) {
        publishProgress(now);
        return;
    }

    // Inside the throttle window, the latest value is published when it reopens
    if (!progress_pending_) {
        progress_pending_ = true;
        progress_timer_.expires_at(*last_progress_publish_ + interval);
        progress_timer_.async_wait(
            [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                self->flushProgress();
            });
    }
}

void TransferCoordinator::onEvent(const event::Success&) {
    if (IsTerminal(phase_)) {
        spdlog::warn("Transfer #{} already has an outcome, ignoring success", id_);
        return;
    }
    cancelPendingProgress();
    phase_ = TransferPhase::kSucceeded;
    spdlog::info("Transfer #{} succeeded", id_);
    publishTerminal();
}

void TransferCoordinator::onEvent(const event::Error& event) {
    if (IsTerminal(phase_)) {
        spdlog::warn("Transfer #{} already has an outcome, ignoring error: {}", id_, event.message);
        return;
    }
    cancelPendingProgress();
    phase_ = TransferPhase::kFailed;
    spdlog::info("Transfer #{} failed: {}", id_, event.message);
    publishTerminal(event.message);
}

void TransferCoordinator::onEvent(const event::Finish&) {
    if (!IsTerminal(phase_)) {
        spdlog::warn("Transfer #{} finished without reporting an outcome", id_);
    }
    cancelPendingProgress();
    phase_ = TransferPhase::kFinished;
    service_.registry().Remove(id_);
    notify("stop", id_, [this](NotificationSurface& surface) { surface.Stop(id_); });
    spdlog::info("Transfer #{} finished", id_);
}

void TransferCoordinator::publishProgress(Clock::time_point now) {
    progress_pending_ = false;
    last_progress_publish_ = now;
    publishLive();
}

void TransferCoordinator::flushProgress() {
    if (!progress_pending_ || IsTerminal(phase_)) {
        return;
    }
    publishProgress(Clock::now());
}

void TransferCoordinator::cancelPendingProgress() {
    if (progress_pending_) {
        spdlog::debug("Transfer #{} drops throttled progress {}%", id_, progress_.value_or(0));
        progress_pending_ = false;
    }
    progress_timer_.cancel();
}

NotificationState TransferCoordinator::buildLiveState() const {
    return BuildNotificationState(NotificationInput{
        .transfer_id = id_,
        .direction = direction_,
        .phase = phase_,
        .remote_device_name = remote_device_name_,
        .progress = progress_,
    });
}

void TransferCoordinator::publishLive() {
    auto state = buildLiveState();
    notify("update", id_, [&](NotificationSurface& surface) { surface.Update(id_, state); });
}

void TransferCoordinator::publishTerminal(std::string_view error_message) {
    auto notification_id = service_.identities().Next();
    auto state = BuildNotificationState(NotificationInput{
        .transfer_id = id_,
        .direction = direction_,
        .phase = phase_,
        .remote_device_name = remote_device_name_,
        .done = true,
        .sound_enabled = service_.SoundEnabled(),
        .error_message = error_message,
    });
    notify("publish result", notification_id, [&](NotificationSurface& surface) {
        surface.Update(notification_id, state);
    });
}

} // namespace shuttle::core
