#pragma once

#include <core/constant/path.h>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/spdlog.h>

namespace puresend::core {

/**
 * @brief Process-wide log setup
 *
 * @details Builds an async spdlog logger writing to a daily rotated file in `log_dir`
 * and to a coloured stdout sink, and makes it spdlog's default logger, so the rest of
 * the code logs through spdlog::info() and friends. Stdout is silenced in release
 * builds. spdlog is shut down when the object goes away.
 */
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(Level level,
                    const std::filesystem::path& log_dir = path::kLogDir,
                    std::size_t queue_size = 8192,
                    std::size_t worker_count = 1);
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::async_logger>& logger() { return logger_; }
    [[nodiscard]] Level level() const { return logger_->level(); }
    void SetLevel(Level level) { logger_->set_level(level); }

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace puresend::core
