#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace puresend::core {

namespace {

constexpr const char* kLoggerName = "puresend";
constexpr const char* kLogFileName = "puresend.log";

void stamp(std::FILE* stream, const char* tag, const spdlog::filename_t& filename) {
    if (!stream) {
        return;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    // ctime() ends with '\n'
    std::fprintf(stream, "[%s: %s | %s]\n", tag, filename.c_str(), std::ctime(&now));
}

std::shared_ptr<spdlog::sinks::daily_file_sink_mt> makeFileSink(
    const std::filesystem::path& log_dir) {
    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* stream) {
        stamp(stream, "Log Start", filename);
    };
    handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* stream) {
        stamp(stream, "Log End", filename);
    };
    // rotate at 00:00, keep every file
    return std::make_shared<spdlog::sinks::daily_file_sink_mt>((log_dir / kLogFileName).string(),
                                                                0,
                                                                0,
                                                                false,
                                                                0,
                                                                handlers);
}

} // namespace

Logger::Logger(Level level,
               const std::filesystem::path& log_dir,
               std::size_t queue_size,
               std::size_t worker_count) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        std::fprintf(stderr, "Failed to create log directory %s: %s\n",
                     log_dir.string().c_str(), ec.message().c_str());
    }

    auto file_sink = makeFileSink(log_dir);
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    /* more about pattern:
     * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
     */
    stdout_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
#ifdef PURESEND_RELEASE
    stdout_sink->set_level(Level::off);
#endif

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(queue_size, worker_count);
    logger_ = std::make_shared<spdlog::async_logger>(kLoggerName,
                                                     spdlog::sinks_init_list{file_sink, stdout_sink},
                                                     thread_pool_);
    logger_->set_level(level);
    logger_->set_error_handler([this](const std::string& msg) {
        logger_->error("*** LOGGER ERROR ***: {}", msg);
    });
    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    spdlog::shutdown();
}

} // namespace puresend::core
