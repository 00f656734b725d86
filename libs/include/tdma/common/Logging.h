#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace tdma::common {

spdlog::level::level_enum parseLogLevel(const std::string& name);

void configureLogging(const std::string& level);

}  // namespace tdma::common
