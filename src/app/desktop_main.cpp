/**
 * @file desktop_main.cpp
 * @brief Точка входа оконной версии csnake (Qt6)
 *
 * Главный цикл принадлежит контроллеру; события Qt обрабатываются
 * в qt_view.poll_input().
 */

#include <QApplication>

#include <spdlog/spdlog.h>

#include "csnake_controller.hpp"
#include "csnake_log.hpp"
#include "qt_view.hpp"

extern "C" {
#include "csnake.h"
}

int main(int argc, char* argv[]) {
  QApplication app(argc, argv);

  // Предупреждение о недоступном файле журнала уходит в консоль
  const bool file_log = csnake::logging::init(
      csnake::logging::apply_environment(csnake::logging::LogConfig{}));
  spdlog::debug("[Main] File log {}", file_log ? "enabled" : "disabled");

  int rc = 1;
  {
    csnake::Controller controller(qt_view, snake_get_interface());
    if (controller.init(nullptr)) {
      rc = controller.run();
    }
  }

  spdlog::info("[Main] Exit with code {}", rc);
  spdlog::shutdown();
  return rc;
}
