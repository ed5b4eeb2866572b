#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

/**
 * @brief Process-wide logging facade over one spdlog logger
 *
 * Level names are TRACE, DEBUG, INFO, WARN and ERROR, matched
 * case-insensitively ("warning" is accepted for WARN).
 */
class Logger
{
public:
    static void init(const std::string &log_level = "INFO")
    {
        auto logger = instance();
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        spdlog::level::level_enum level = spdlog::level::info;
        parseLevel(log_level, level);
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
    }

    /**
     * @brief Switch the active level at runtime
     *
     * An unknown name keeps INFO and reports the bad value.
     */
    static void setLevel(const std::string &log_level)
    {
        spdlog::level::level_enum level = spdlog::level::info;
        if (!parseLevel(log_level, level))
        {
            instance()->warn("Unknown log level '{}', using INFO", log_level);
        }
        instance()->set_level(level);
        instance()->debug("Log level set to {}", spdlog::level::to_string_view(level));
    }

    static bool isValidLevel(const std::string &log_level)
    {
        spdlog::level::level_enum ignored;
        return parseLevel(log_level, ignored);
    }

    static void trace(const std::string &message) { instance()->trace(message); }
    static void debug(const std::string &message) { instance()->debug(message); }
    static void info(const std::string &message) { instance()->info(message); }
    static void warn(const std::string &message) { instance()->warn(message); }
    static void error(const std::string &message) { instance()->error(message); }

    static void flush() { instance()->flush(); }

private:
    static std::shared_ptr<spdlog::logger> instance()
    {
        static std::shared_ptr<spdlog::logger> logger = []
        {
            auto registered = spdlog::get("deeplink_server");
            return registered ? registered : spdlog::stdout_color_mt("deeplink_server");
        }();
        return logger;
    }

    static bool parseLevel(std::string name, spdlog::level::level_enum &level)
    {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        struct Entry
        {
            const char *name;
            spdlog::level::level_enum level;
        };
        static const Entry kLevels[] = {
            {"TRACE", spdlog::level::trace},
            {"DEBUG", spdlog::level::debug},
            {"INFO", spdlog::level::info},
            {"WARN", spdlog::level::warn},
            {"WARNING", spdlog::level::warn},
            {"ERROR", spdlog::level::err},
        };
        for (const auto &entry : kLevels)
        {
            if (name == entry.name)
            {
                level = entry.level;
                return true;
            }
        }
        return false;
    }
};
