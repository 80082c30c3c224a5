#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>

std::shared_ptr<spdlog::logger> Log::s_logger;

spdlog::level::level_enum Log::parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

bool Log::is_level_name(const std::string& name) {
    return name == "trace" || name == "debug" || name == "info" || name == "warn" || name == "warning"
        || name == "error" || name == "err" || name == "critical" || name == "off";
}

void Log::init(const std::string& level) {
    try {
        if (!s_logger) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            s_logger = std::make_shared<spdlog::logger>("schemasync", sink);
            spdlog::register_logger(s_logger);
        }
        s_logger->set_level(parse_level(level));
        s_logger->flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
        s_logger = spdlog::default_logger();
    }
}

void Log::shutdown() {
    if (s_logger) s_logger->flush();
}

std::shared_ptr<spdlog::logger> Log::get() {
    if (!s_logger) init();
    return s_logger;
}
