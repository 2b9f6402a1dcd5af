#include "csnake_log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <new>
#include <system_error>
#include <vector>

namespace csnake {
namespace logging {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

/// XDG_DATA_HOME или ~/.local/share
std::string data_home() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && xdg[0] != '\0') {
    return xdg;
  }

  const char* home = std::getenv("HOME");
  if (home && home[0] != '\0') {
    return std::string(home) + "/.local/share";
  }

  return "";
}

}  // namespace

bool parse_level(const std::string& name,
                 spdlog::level::level_enum& level) noexcept {
  // from_str возвращает off и для неизвестных имён
  spdlog::level::level_enum parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  level = parsed;
  return true;
}

LogConfig apply_environment(LogConfig config) {
  const char* level = std::getenv("CSNAKE_LOG_LEVEL");
  if (level && level[0] != '\0') {
    parse_level(level, config.level);
  }

  const char* file = std::getenv("CSNAKE_LOG_FILE");
  if (file && file[0] != '\0') {
    config.file_path = file;
  }
  return config;
}

std::string resolve_log_file_path(const std::string& override_path) {
  if (!override_path.empty()) {
    return override_path;
  }

  std::string base = data_home();
  if (base.empty()) {
    return "/tmp/csnake.log";
  }
  return base + "/csnake/csnake.log";
}

bool init(const LogConfig& config) noexcept {
  bool file_ok = true;
  std::string path;

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (config.enable_file) {
      path = resolve_log_file_path(config.file_path);
      std::error_code ec;
      std::filesystem::path dir = std::filesystem::path(path).parent_path();
      if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
      }
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, kMaxLogFileSize, kMaxLogFiles));
      } catch (const spdlog::spdlog_ex&) {
        file_ok = false;
      }
    }

    auto logger =
        std::make_shared<spdlog::logger>("csnake", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const std::bad_alloc&) {
    return false;
  }

  if (!file_ok) {
    spdlog::warn("[Logging] Cannot open log file {}", path);
  }
  spdlog::debug("[Logging] Initialized: level={}, console={}, file={}",
                spdlog::level::to_string_view(config.level),
                config.enable_console ? "yes" : "no",
                file_ok && config.enable_file ? path : "no");
  return file_ok;
}

}  // namespace logging
}  // namespace csnake
