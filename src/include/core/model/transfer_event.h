#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace shuttle::core {

namespace event {

struct Connect {};

struct TransferHeader {
    std::uint64_t item_count;
};

struct Progress {
    int percent;
};

struct Success {};

struct Error {
    std::string message;
};

struct Finish {};

} // namespace event

// Lifecycle events raised by a transfer, in this relative order:
// Connect, TransferHeader, Progress*, Success | Error, Finish
using TransferEvent = std::variant<event::Connect,
                                   event::TransferHeader,
                                   event::Progress,
                                   event::Success,
                                   event::Error,
                                   event::Finish>;

constexpr std::string_view TransferEventName(const TransferEvent& event) {
    constexpr std::string_view kNames[] = {
        "Connect",
        "TransferHeader",
        "Progress",
        "Success",
        "Error",
        "Finish",
    };
    if (event.valueless_by_exception()) {
        return "Unknown";
    }
    return kNames[event.index()];
}

} // namespace shuttle::core
