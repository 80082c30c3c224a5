#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

/**
 * Logger utility
 *
 * A single "schemasync" spdlog logger writing to stderr, so stdout stays free
 * for the SQL and prompts the workflows print for the operator.
 */
class Log {
public:
    // Safe to call more than once; the last call wins.
    static void init(const std::string& level = "info");
    static void shutdown();

    // Lazily initialised at info level when init() was never called (tests).
    static std::shared_ptr<spdlog::logger> get();

    // "trace" .. "off"; unknown names map to info.
    static spdlog::level::level_enum parse_level(const std::string& name);
    static bool is_level_name(const std::string& name);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) Log::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) Log::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  Log::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  Log::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) Log::get()->error(__VA_ARGS__)
