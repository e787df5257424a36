// log.cpp: stderr logger setup
#include "core/log.hpp"

#include <mutex>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace core {
namespace log {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mu;

void init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lk(g_logger_mu);
    if (!g_logger) {
        // A host program may have registered "dmob" already; adopt it with its sinks.
        g_logger = spdlog::get("dmob");
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt("dmob");
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
        }
        spdlog::set_default_logger(g_logger);
    }
    g_logger->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
    {
        std::lock_guard<std::mutex> lk(g_logger_mu);
        if (g_logger) return g_logger;
    }
    init();
    return g_logger;
}

spdlog::level::level_enum parse_level(std::string_view name) {
    const auto lvl = spdlog::level::from_str(std::string(name));
    // from_str falls back to off for unknown names
    if (lvl == spdlog::level::off && name != "off") return spdlog::level::info;
    return lvl;
}

} // namespace log
} // namespace core
