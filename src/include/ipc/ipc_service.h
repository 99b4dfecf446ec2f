#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <functional>
#include <ipc/ipc_event_stream.h>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace shuttle::ipc {

// Reads operations from stdin and posts them to the IpcEventStream,
// drains feedback from the IpcEventStream and writes it to stdout.
// Both directions carry one JSON document per line.
class IpcService {
public:
    IpcService(boost::asio::io_context& io_context, IpcEventStream& event_stream);
    IpcService(const IpcService&) = delete;
    IpcService& operator=(const IpcService&) = delete;

    void Start();
    void Stop();

    // Invoked once stdin is closed, or right after Start() if it could not be opened
    void SetInputClosedCallback(std::function<void()>&& callback);

    boost::asio::awaitable<void> SendMessage(const std::string& type, const nlohmann::json& data);

private:
    boost::asio::awaitable<void> readMessageLoop();
    boost::asio::awaitable<void> writeFeedbackLoop();
    void handleMessage(const std::string& message_str);

    // Watches a duplicate of fd, leaves the descriptor closed if that fails
    static void openDescriptor(boost::asio::posix::stream_descriptor& descriptor,
                               int fd,
                               std::string_view name);

    boost::asio::io_context& io_context_;
    IpcEventStream& event_stream_;
    boost::asio::posix::stream_descriptor input_;
    boost::asio::posix::stream_descriptor output_;
    std::function<void()> input_closed_callback_ = nullptr;
    bool running_{false};
};

} // namespace shuttle::ipc
