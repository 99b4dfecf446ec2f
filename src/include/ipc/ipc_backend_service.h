#pragma once

#include "ipc_event_stream.h"
#include "model.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/transfer/transfer_service.h>
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <string_view>

/**
 * @brief Dispatches frontend operations to the transfer service.
 *
 * @details Polls operations from the IpcEventStream and applies them: stopping transfers,
 * modifying settings and shutting down. On shutdown it waits until every transfer has
 * finished, so their last notifications still reach the frontend, then invokes the exit
 * callback.
 *
 * @note This class is neither copyable nor assignable.
 */
namespace shuttle::ipc {

class IpcBackendService {
public:
    IpcBackendService(boost::asio::io_context& ioc,
                      IpcEventStream& event_stream,
                      core::TransferService& transfer_service);
    ~IpcBackendService() = default;
    IpcBackendService(const IpcBackendService&) = delete;
    IpcBackendService& operator=(const IpcBackendService&) = delete;

    void Start();

    // Exits once no transfer is active. Running transfers are stopped if stop_transfers is set.
    void Shutdown(bool stop_transfers);

    void SetExitAppCallback(std::function<void()>&& callback);

    // Applies one operation, exposed for callers that bypass the event stream
    void DispatchOperation(const Operation& operation);

private:
    boost::asio::awaitable<void> run();

    void stopTransfer(core::TransferId transfer_id);
    void modifySettings(std::string_view key, const nlohmann::json& value);

    void feedback(core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); }

    boost::asio::io_context& ioc_;
    IpcEventStream& event_stream_;
    core::TransferService& transfer_service_;
    std::function<void()> exit_app_callback_ = nullptr;
    bool is_running_{false};
    bool is_exiting_{false};
};

} // namespace shuttle::ipc
