/**
 * @file cli_main.cpp
 * @brief Точка входа терминальной версии csnake
 *
 * Лог пишется только в файл: экраном владеет ncurses.
 */

#include <spdlog/spdlog.h>

#include <cstdio>

#include "csnake_controller.hpp"
#include "csnake_log.hpp"

extern "C" {
#include "cli.h"
#include "csnake.h"
}

int main() {
  csnake::logging::LogConfig log_config;
  log_config.enable_console = false;
  log_config = csnake::logging::apply_environment(log_config);
  if (!csnake::logging::init(log_config)) {
    std::fprintf(stderr, "csnake: cannot open log file %s\n",
                 csnake::logging::resolve_log_file_path(log_config.file_path)
                     .c_str());
  }

  int rc = 1;
  {
    csnake::Controller controller(cli_view, snake_get_interface());
    if (controller.init(nullptr)) {
      rc = controller.run();
    }
  }
  if (rc != 0) {
    std::fputs("csnake: failed to start the terminal view\n", stderr);
  }

  spdlog::info("[Main] Exit with code {}", rc);
  spdlog::shutdown();
  return rc;
}
