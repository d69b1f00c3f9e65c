#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace gw {

// Shared "gridwar" logger (colour stdout), created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace" | "debug" | "info" | "warn" | "error" | "off". Returns false for an
// unknown name and leaves the level unchanged.
bool set_log_level(const std::string& level);

} // namespace gw
