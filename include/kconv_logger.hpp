#pragma once

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thread-safe singleton logger class.
 *
 * Every component of the conversion engine and the command-line driver
 * writes through this single asynchronous logger, so progress messages
 * and conversion warnings end up interleaved on one console sink.
 */
class KConvLogger {
  public:
    /**
     * @brief Retrieves the singleton instance of the logger.
     *
     * The logger is created on the first call and the same instance is
     * returned on subsequent calls.
     *
     * @return std::shared_ptr<spdlog::logger>& A shared pointer to the logger instance.
     */
    static std::shared_ptr<spdlog::logger>& getInstance() {
        static std::shared_ptr<spdlog::logger> instance = createLogger();
        return instance;
    }

    /**
     * @brief Sets the logging level dynamically at runtime.
     *
     * @param level The desired logging level (e.g., spdlog::level::info, spdlog::level::debug).
     */
    static void setLevel(spdlog::level::level_enum level) {
        getInstance()->set_level(level);
    }

  private:
    KConvLogger() = default;

    /**
     * @brief Creates and configures the logger instance.
     *
     * Initializes an asynchronous logger with a coloured console sink. The
     * level is taken from the LOG_LEVEL environment variable when set.
     *
     * @return std::shared_ptr<spdlog::logger> The configured logger instance.
     */
    static std::shared_ptr<spdlog::logger> createLogger() {
        try {
            // Queue size for async messages
            size_t queue_size = 8192;

            // Initialize spdlog asynchronous mode with a background worker thread
            spdlog::init_thread_pool(queue_size, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [thread %t] [%^%l%$] %v");

            std::vector<spdlog::sink_ptr> sinks{console_sink};
            auto async_logger = std::make_shared<spdlog::async_logger>(
              "KConvLogger",
              sinks.begin(),
              sinks.end(),
              spdlog::thread_pool(),
              spdlog::async_overflow_policy::block  // Block if queue is full
            );

            const char* logLevelEnv = std::getenv("LOG_LEVEL");
            if (logLevelEnv) {
                async_logger->set_level(spdlog::level::from_str(logLevelEnv));
            } else {
                async_logger->set_level(spdlog::level::info);  // Default log level
            }

            spdlog::register_logger(async_logger);

            return async_logger;
        } catch (const spdlog::spdlog_ex& ex) {
            throw std::runtime_error(std::string("Logger initialization failed: ")
                                     + ex.what());
        }
    }
};

/// Process-wide logger handle used throughout the code base
inline spdlog::logger& logger = *KConvLogger::getInstance();
