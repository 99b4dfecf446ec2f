#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ipc/ipc_service.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace net = boost::asio;

namespace shuttle::ipc {

namespace {

constexpr std::size_t kMaxMessageSize = 1024 * 1024;
constexpr auto kFeedbackPollInterval = std::chrono::milliseconds(20);

bool isPipeClosed(const boost::system::error_code& ec) {
    return ec == net::error::eof || ec == net::error::connection_reset
           || ec == net::error::connection_aborted || ec == net::error::broken_pipe;
}

void logException(std::string_view loop, std::exception_ptr e) {
    if (!e) {
        return;
    }
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        spdlog::error("{} exception: {}", loop, ex.what());
    }
}

} // namespace

IpcService::IpcService(net::io_context& io_context, IpcEventStream& event_stream)
    : io_context_(io_context)
    , event_stream_(event_stream)
    , input_(io_context)
    , output_(io_context) {
    openDescriptor(input_, STDIN_FILENO, "stdin");
    openDescriptor(output_, STDOUT_FILENO, "stdout");
}

void IpcService::openDescriptor(net::posix::stream_descriptor& descriptor, int fd, std::string_view name) {
    int duplicate = ::dup(fd);
    if (duplicate < 0) {
        spdlog::error("IPC Error: Failed to duplicate {}: {}", name, std::strerror(errno));
        return;
    }
    boost::system::error_code ec;
    descriptor.assign(duplicate, ec);
    if (ec) {
        spdlog::error("IPC Error: Failed to watch {}: {}", name, ec.message());
        ::close(duplicate);
    }
}

void IpcService::Start() {
    if (running_) {
        return;
    }
    running_ = true;

    spdlog::info("Pipe communication started");
    if (input_.is_open()) {
        net::co_spawn(io_context_, readMessageLoop(), [](std::exception_ptr e) {
            logException("Read message loop", e);
        });
    } else {
        // Without stdin no operation can arrive, behave as if the frontend went away
        spdlog::error("IPC Error: stdin unavailable, no operations will be read");
        net::post(io_context_, [this] {
            if (input_closed_callback_) {
                input_closed_callback_();
            }
        });
    }
    if (output_.is_open()) {
        net::co_spawn(io_context_, writeFeedbackLoop(), [](std::exception_ptr e) {
            logException("Write feedback loop", e);
        });
    } else {
        spdlog::error("IPC Error: stdout unavailable, feedback will be dropped");
    }
}

void IpcService::Stop() {
    running_ = false;
    if (!input_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    input_.cancel(ec);
    if (ec) {
        spdlog::warn("Failed to cancel stdin read: {}", ec.message());
    }
}

void IpcService::SetInputClosedCallback(std::function<void()>&& callback) {
    input_closed_callback_ = std::move(callback);
}

net::awaitable<void> IpcService::SendMessage(const std::string& type, const nlohmann::json& data) {
    nlohmann::json message = {
        {"feedback", type},
        {"data", data},
        {"timestamp",
         std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
             .count()},
    };
    std::string line = message.dump() + "\n";
    spdlog::debug("Sending message: {}", type);
    co_await net::async_write(output_, net::buffer(line), net::use_awaitable);
}

net::awaitable<void> IpcService::readMessageLoop() {
    spdlog::info("Starting read message loop");
    std::string buffer;

    while (running_) {
        boost::system::error_code ec;
        std::size_t n = co_await net::async_read_until(input_,
                                                       net::dynamic_buffer(buffer, kMaxMessageSize),
                                                       '\n',
                                                       net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (isPipeClosed(ec)) {
                spdlog::info("Input pipe closed, exiting read loop");
            } else if (ec == net::error::operation_aborted) {
                spdlog::debug("Read loop cancelled");
            } else {
                spdlog::error("Failed to read message: {}", ec.message());
            }
            break;
        }

        std::string line = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        if (!line.empty()) {
            handleMessage(line);
        }
    }

    spdlog::info("Exiting read message loop");
    running_ = false;
    if (input_closed_callback_) {
        input_closed_callback_();
    }
}

net::awaitable<void> IpcService::writeFeedbackLoop() {
    spdlog::info("Starting write feedback loop");
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);

    while (running_) {
        for (auto& feedback : event_stream_.DrainFeedback()) {
            std::string feedback_type = nlohmann::json(feedback.type).get<std::string>();
            try {
                co_await SendMessage(feedback_type, feedback.data);
            } catch (const boost::system::system_error& e) {
                spdlog::error("Failed to send feedback {}: {}", feedback_type, e.what());
                if (isPipeClosed(e.code())) {
                    running_ = false;
                    break;
                }
            }
        }
        timer.expires_after(kFeedbackPollInterval);
        co_await timer.async_wait(net::use_awaitable);
    }

    // Flush what was posted while shutting down
    for (auto& feedback : event_stream_.DrainFeedback()) {
        std::string feedback_type = nlohmann::json(feedback.type).get<std::string>();
        auto line = nlohmann::json{{"feedback", feedback_type}, {"data", feedback.data}}.dump() + "\n";
        boost::system::error_code ec;
        net::write(output_, net::buffer(line), ec);
        if (ec) {
            spdlog::warn("Dropping feedback {} on exit: {}", feedback_type, ec.message());
            break;
        }
    }
    spdlog::info("Exiting write feedback loop");
}

void IpcService::handleMessage(const std::string& message_str) {
    try {
        auto message = nlohmann::json::parse(message_str);
        if (!message.contains("operation") || !message["operation"].is_string()) {
            spdlog::error("Invalid message format: missing operation field");
            return;
        }
        auto data = message.contains("data") ? message["data"] : nlohmann::json();
        event_stream_.PostOperation(Operation{message["operation"].get<OperationType>(), std::move(data)});
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to process message: {}", e.what());
    }
}

} // namespace shuttle::ipc
