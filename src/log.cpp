#include "gw/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gw {

std::shared_ptr<spdlog::logger> logger(){
  static std::shared_ptr<spdlog::logger> lg = []{
    auto existing = spdlog::get("gridwar");
    if (existing) return existing;
    auto l = spdlog::stdout_color_mt("gridwar");
    l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    l->set_level(spdlog::level::info);
    return l;
  }();
  return lg;
}

bool set_log_level(const std::string& level){
  auto lvl = spdlog::level::from_str(level);
  // from_str falls back to "off" for unknown names
  if (lvl == spdlog::level::off && level != "off") return false;
  logger()->set_level(lvl);
  return true;
}

} // namespace gw
