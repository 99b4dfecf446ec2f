#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>

namespace shuttle::core {

namespace {

// Separates the runs of the backend inside one daily file
void writeSessionMarker(std::FILE* file, std::string_view marker) {
    if (file == nullptr) {
        return;
    }
    auto line = fmt::format("==== {} {:%Y-%m-%d %H:%M:%S} ====\n",
                            marker,
                            fmt::localtime(std::time(nullptr)));
    std::fputs(line.c_str(), file);
}

std::shared_ptr<spdlog::sinks::daily_file_sink_mt> makeFileSink(const std::filesystem::path& file) {
    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t&, std::FILE* f) {
        writeSessionMarker(f, "shuttle started");
    };
    handlers.before_close = [](const spdlog::filename_t&, std::FILE* f) {
        writeSessionMarker(f, "shuttle stopped");
    };
    return std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        file.string(), 0, 0, false, Logger::kMaxLogFiles, handlers);
}

} // namespace

Logger::Logger(Level level, const std::filesystem::path& log_dir, const std::string& name) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] %^%-5l%$ [t%t] %v");
#ifdef SHUTTLE_RELEASE
    console_sink->set_level(Level::off);
#endif

    spdlog::sinks_init_list sinks{console_sink};
    worker_ = std::make_shared<spdlog::details::thread_pool>(kQueueSize, 1);
    if (ec) {
        // Still usable without the file, the console keeps the records
        logger_ = std::make_shared<spdlog::async_logger>(name, sinks, worker_);
    } else {
        auto file_sink = makeFileSink(log_dir / (name + ".log"));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
        logger_ = std::make_shared<spdlog::async_logger>(
            name, spdlog::sinks_init_list{file_sink, console_sink}, worker_);
    }

    logger_->set_level(level);
    logger_->flush_on(Level::warn);
    logger_->set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "shuttle logger error: %s\n", msg.c_str());
    });
    spdlog::set_default_logger(logger_);

    if (ec) {
        spdlog::warn("Cannot create log directory \"{}\": {}", log_dir.string(), ec.message());
    }
}

Logger::~Logger() {
    spdlog::shutdown();
}

} // namespace shuttle::core
