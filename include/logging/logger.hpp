#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
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

    static void init(const std::string &log_level = "INFO")
    {
        getLogger()->set_level(toSpdlogLevel(log_level));
    }

    static void setLevel(const std::string &log_level)
    {
        if (!isValidLevel(log_level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        getLogger()->set_level(toSpdlogLevel(log_level));
        info("Log level changed to: " + log_level);
    }

    static bool isValidLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "ERROR";
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
        // stderr keeps stdout free for reports
        static auto logger = spdlog::stderr_color_mt("doc_forensics");
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info; // Default to INFO
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
