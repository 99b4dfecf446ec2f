#pragma once

#include <chrono>
#include <cstdint>

namespace shuttle::core {

using TransferId = std::uint32_t;

// Reserved identity meaning "no transfer"
constexpr TransferId kInvalidTransferId = 0;

namespace transfer {

// Minimum interval between two progress driven notification updates
constexpr std::chrono::milliseconds kProgressThrottleInterval{1000};

constexpr int kMinProgress = 0;
constexpr int kMaxProgress = 100;

} // namespace transfer

} // namespace shuttle::core
