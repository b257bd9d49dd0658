#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    /**
     * @brief Configure level and optional rotating file output
     * @param log_level TRACE, DEBUG, INFO, WARN or ERROR
     * @param log_file Rotating log file path, empty for console only
     * @param max_size_mb Size at which the log file is rotated
     * @param backup_count Number of rotated files kept
     */
    static void init(const std::string &log_level = "INFO",
                     const std::string &log_file = "",
                     int max_size_mb = 10,
                     int backup_count = 5)
    {
        if (!log_file.empty())
        {
            try
            {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, static_cast<size_t>(max_size_mb) * 1024 * 1024, static_cast<size_t>(backup_count));
                getLogger()->sinks().push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex &e)
            {
                warn("Could not open log file " + log_file + ": " + e.what());
            }
        }

        getLogger()->set_level(toSpdlogLevel(log_level));
        getLogger()->flush_on(spdlog::level::warn);
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("moviecp");
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;

        // Invalid levels fall back to INFO
        getLogger()->warn("Invalid log level: " + log_level + ", defaulting to INFO");
        return spdlog::level::info;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }
};
