// log.hpp: named spdlog logger shared by the engine
#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace core {
namespace log {

// Install the "dmob" logger as spdlog's default, creating a stderr logger
// unless one with that name is already registered.
// Safe to call more than once; later calls only change the level.
void init(spdlog::level::level_enum level = spdlog::level::info);

// The "dmob" logger; initializes it with defaults on first use.
std::shared_ptr<spdlog::logger> get();

// Parse "trace|debug|info|warn|error|critical|off"; unknown names map to info.
spdlog::level::level_enum parse_level(std::string_view name);

} // namespace log
} // namespace core
