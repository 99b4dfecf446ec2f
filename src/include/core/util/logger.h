#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/spdlog.h>
#include <string>

namespace shuttle::core {

// Installs the process wide async logger for the lifetime of the object.
// Records go to a daily rotated file under log_dir and to stderr, since stdout carries IPC.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    static constexpr std::size_t kQueueSize = 8192;
    static constexpr std::uint16_t kMaxLogFiles = 7;

    Logger(Level level, const std::filesystem::path& log_dir, const std::string& name = "shuttle");
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    std::shared_ptr<spdlog::details::thread_pool> worker_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace shuttle::core
