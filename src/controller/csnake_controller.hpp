/**
 * @file csnake_controller.hpp
 * @brief Контроллер: связывает игровую сессию и представление
 *
 * Контроллер владеет главным циклом. Каждый кадр он:
 * 1. вычитывает все события ввода из представления
 * 2. переводит клавиши в команды и передаёт их сессии
 * 3. раз в тик (GameInfo_t::speed мс) вызывает update()
 * 4. рисует снимок в зоны `field`, `score`, `best`, `status`
 *
 * И сессия, и представление подключаются через таблицы функций
 * (GameInterface_t и ViewInterface), поэтому контроллер тестируется
 * с поддельным представлением.
 *
 * @author provemet
 * @version 1.0
 */

#ifndef CSNAKE_CONTROLLER_HPP
#define CSNAKE_CONTROLLER_HPP

extern "C" {
#include "csnake_bgame.h"
#include "view.h"
}

#define CSNAKE_ESCAPE 27
#define CSNAKE_ENTER_KEY 10
#define CSNAKE_DEFAULT_FPS 60

namespace csnake {

/// Команды пользователя после нормализации клавиш
enum class Command { NONE, LEFT, RIGHT, UP, DOWN, PAUSE, START, RESTART, QUIT };

/**
 * @brief Переводит код клавиши в команду
 *
 * w/a/s/d — направления, p — пауза, q или ESC — выход, c — новая игра,
 * Enter или пробел — старт. Регистр не важен.
 */
Command key_to_command(int key_code) noexcept;

/// Текст зоны `status` для статуса сессии
const char* status_text(int status) noexcept;

/// Размеры зон в символах для поля rows x cols
struct Layout {
  int field_w, field_h;
  int panel_x;
  int status_y;
  int width, height;
};

Layout make_layout(int rows, int cols) noexcept;

class Controller {
 public:
  Controller(const ViewInterface& view, const GameInterface_t& game) noexcept;
  ~Controller() noexcept;

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /**
   * @brief Создаёт сессию и представление, настраивает зоны
   * @param config Конфигурация сессии, nullptr — по умолчанию
   * @return false, если сессию или представление создать не удалось
   */
  bool init(const SnakeConfig_t* config, int fps = CSNAKE_DEFAULT_FPS) noexcept;

  /**
   * @brief Один кадр главного цикла
   * @param tick Продвинуть ли игру на один шаг
   * @return false после команды выхода
   */
  bool frame(bool tick) noexcept;

  /**
   * @brief Главный цикл до выхода
   * @return Код завершения процесса: 0 — выход пользователем
   */
  int run() noexcept;

  const GameInfo_t* info() const noexcept;
  bool quitRequested() const noexcept { return quit_; }

 private:
  void handleCommand_(Command cmd) noexcept;
  bool configureZones_(const Layout& layout) noexcept;
  void draw_() noexcept;

  const ViewInterface& view_;
  GameInterface_t game_;
  ViewHandle_t handle_ = nullptr;
  void* session_ = nullptr;
  int fps_ = CSNAKE_DEFAULT_FPS;
  int lastStatus_ = -1;
  bool quit_ = false;
};

}  // namespace csnake

#endif  // CSNAKE_CONTROLLER_HPP
