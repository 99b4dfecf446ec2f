#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/model/feedback.h>
#include <core/util/config.h>
#include <ipc/ipc_backend_service.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace shuttle::ipc {

namespace {

constexpr auto kOperationPollInterval = std::chrono::milliseconds(20);

} // namespace

IpcBackendService::IpcBackendService(net::io_context& ioc,
                                     IpcEventStream& event_stream,
                                     core::TransferService& transfer_service)
    : ioc_(ioc)
    , event_stream_(event_stream)
    , transfer_service_(transfer_service) {}

void IpcBackendService::Start() {
    if (is_running_) {
        return;
    }
    is_running_ = true;
    feedback(core::Feedback{
        .type = core::FeedbackType::kSettings,
        .data = core::feedback::Settings::FromConfigSettings(),
    });
    net::co_spawn(ioc_, run(), net::detached);
    spdlog::debug("IpcBackendService started");
}

void IpcBackendService::Shutdown(bool stop_transfers) {
    spdlog::info("Shutting down, {} transfers active", transfer_service_.ActiveTransferCount());
    is_exiting_ = true;
    if (stop_transfers) {
        transfer_service_.StopAll();
    }
}

void IpcBackendService::SetExitAppCallback(std::function<void()>&& callback) {
    exit_app_callback_ = std::move(callback);
}

net::awaitable<void> IpcBackendService::run() {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);

    while (is_running_) {
        while (auto operation = event_stream_.PollOperation()) {
            DispatchOperation(*operation);
        }
        if (is_exiting_ && transfer_service_.ActiveTransferCount() == 0) {
            is_running_ = false;
            break;
        }
        timer.expires_after(kOperationPollInterval);
        co_await timer.async_wait(net::use_awaitable);
    }

    spdlog::debug("IpcBackendService stopped");
    if (exit_app_callback_) {
        exit_app_callback_();
    }
}

void IpcBackendService::DispatchOperation(const Operation& operation) {
    switch (operation.type) {
    case OperationType::kStopTransfer: {
        spdlog::debug("IpcBackendService: dispatch operation \"StopTransfer\"");
        if (auto data = operation.getData<operation::StopTransfer>(); data) {
            stopTransfer(data->transfer_id);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"StopTransfer\"");
        }
        break;
    }
    case OperationType::kModifySettings: {
        spdlog::debug("IpcBackendService: dispatch operation \"ModifySettings\"");
        if (auto data = operation.getData<operation::ModifySettings>(); data) {
            modifySettings(data->key, data->value);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"ModifySettings\"");
        }
        break;
    }
    case OperationType::kExitApp: {
        spdlog::debug("IpcBackendService: dispatch operation \"ExitApp\"");
        Shutdown(true);
        break;
    }
    case OperationType::kUnknown:
    default:
        spdlog::error("IPC Error: Unknown operation");
        break;
    }
}

void IpcBackendService::stopTransfer(core::TransferId transfer_id) {
    if (transfer_id == core::kInvalidTransferId) {
        spdlog::error("IPC Error: StopTransfer without a transfer id");
        return;
    }
    transfer_service_.StopTransfer(transfer_id);
}

void IpcBackendService::modifySettings(std::string_view key, const nlohmann::json& value) {
    try {
        if (key == "notification-sound") {
            core::settings.notification_sound = value.get<bool>();
        } else {
            spdlog::error("IPC Error: Invalid key for ModifySettings: {}", key);
            return;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("IPC Error: Failed to modify settings: {}", e.what());
        return;
    }
    feedback(core::Feedback{
        .type = core::FeedbackType::kSettings,
        .data = core::feedback::Settings::FromConfigSettings(),
    });
}

} // namespace shuttle::ipc
