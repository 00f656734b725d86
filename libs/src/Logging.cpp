#include "tdma/common/Logging.h"

#include <map>

namespace tdma::common {

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

void configureLogging(const std::string& level) {
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    spdlog::set_level(parseLogLevel(level));
    spdlog::debug("Log level set to '{}'", level);
}

}  // namespace tdma::common
