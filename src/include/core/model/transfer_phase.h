#pragma once

#include <string_view>

namespace shuttle::core {

enum class TransferPhase {
    kCreated,    // registered, live notification shown
    kConnecting, // Run() launched, waiting for the connection
    kActive,     // connected, progress reported
    kSucceeded,  // terminal success notification published
    kFailed,     // terminal error notification published
    kFinished,   // live notification retired, removed from the registry
};

constexpr std::string_view TransferPhaseToString(TransferPhase phase) {
    switch (phase) {
    case TransferPhase::kCreated:
        return "Created";
    case TransferPhase::kConnecting:
        return "Connecting";
    case TransferPhase::kActive:
        return "Active";
    case TransferPhase::kSucceeded:
        return "Succeeded";
    case TransferPhase::kFailed:
        return "Failed";
    case TransferPhase::kFinished:
        return "Finished";
    }
    return "Unknown";
}

constexpr bool IsTerminal(TransferPhase phase) {
    return phase == TransferPhase::kSucceeded || phase == TransferPhase::kFailed
           || phase == TransferPhase::kFinished;
}

} // namespace shuttle::core
