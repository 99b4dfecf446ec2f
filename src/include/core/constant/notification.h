#pragma once

#include <string_view>

namespace shuttle::core {

namespace notification {

constexpr std::string_view kTitle = "Shuttle Transfer";
constexpr std::string_view kCategory = "status";
constexpr std::string_view kUnknownDevice = "Unknown device";

// fmt format strings, {} is the remote device name
constexpr std::string_view kStatusConnecting = "Connecting to {}...";
constexpr std::string_view kStatusSending = "Sending to {}...";
constexpr std::string_view kStatusReceiving = "Receiving from {}...";
constexpr std::string_view kStatusSuccess = "Transfer succeeded with {}";
// second {} is the error message reported by the transfer
constexpr std::string_view kStatusError = "Transfer with {} failed: {}";

constexpr std::string_view kActionStop = "Stop";

} // namespace notification

} // namespace shuttle::core
