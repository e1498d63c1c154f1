#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include "docnet/StoreConfig.hpp"

namespace docnet {

inline constexpr const char* kLoggerName = "docnet";

// Installs the "docnet" logger as the spdlog default: colored console plus
// a file sink when config.log_file is set. Calling it again replaces it.
std::shared_ptr<spdlog::logger> setup_logging(const StoreConfig& config);

}
