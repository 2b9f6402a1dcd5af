/**
 * @file csnake_internals.hpp
 * @brief Игровая сессия "Змейки": FSM, ввод и снимок для отрисовки
 *
 * `csnake::SnakeGame` владеет одним GameState и продвигает его функцией
 * csnake::advance() из csnake_model.hpp. Сверху модели сессия добавляет:
 * - конечный автомат фаз игры (ожидание, игра, пауза, поражение, победа)
 * - буфер направления между тиками
 * - лучший счёт за время жизни сессии
 * - снимок GameInfo_t для представлений
 *
 * Доступ снаружи только через статические функции с непрозрачным
 * указателем (см. csnake.h). Все они `noexcept`: исключения не
 * пересекают границу C.
 *
 * @note Потокобезопасность не гарантируется: все вызовы из одного потока.
 *
 * @author provemet
 * @version 1.2
 * @see csnake.cpp — C API обёртка
 */

#ifndef CSNAKE_INTERNALS_HPP
#define CSNAKE_INTERNALS_HPP

#include <deque>
#include <memory>
#include <utility>

#include "csnake.h"
#include "csnake_model.hpp"
#include "csnake_random.hpp"

extern "C" {
#include "fsm.h"
}

namespace csnake {

/**
 * @brief Состояния автомата сессии
 */
enum class SnakeState : fsm_state_t {
  INIT = 0,   ///< змейка стоит, ждём старта
  MOVE,       ///< игра идёт
  PAUSED,     ///< пауза
  GAME_OVER,  ///< столкновение
  WON         ///< поле заполнено
};

/**
 * @brief События автомата сессии
 *
 * MOVE_* не являются переходами: они только меняют буфер направления.
 */
enum class SnakeEvent : fsm_event_t {
  NONE = FSM_EVENT_NONE,
  START,
  PAUSE_TOGGLE,
  TERMINATE,
  WIN,
  MOVE_LEFT,
  MOVE_RIGHT,
  MOVE_UP,
  MOVE_DOWN
};

constexpr fsm_state_t to_fsm_state(SnakeState s) noexcept {
  return static_cast<fsm_state_t>(s);
}

constexpr fsm_event_t to_fsm_event(SnakeEvent e) noexcept {
  return static_cast<fsm_event_t>(e);
}

constexpr SnakeState from_fsm_state(fsm_state_t s) noexcept {
  return static_cast<SnakeState>(s);
}

class SnakeGame {
 public:
  /** @name C API (непрозрачный указатель) */
  ///@{
  static void* create(const SnakeConfig_t* config) noexcept;
  static void* create(const SnakeConfig_t* config,
                      std::unique_ptr<RandomSource> rng) noexcept;
  static void destroy(void* game) noexcept;
  static void handle_input(void* game, UserAction_t action,
                           bool hold) noexcept;
  static void update(void* game) noexcept;
  static const GameInfo_t* get_info(const void* game) noexcept;
  ///@}

  static SnakeConfig_t default_config() noexcept;
  static SnakeConfigResult_t validate_config(
      const SnakeConfig_t* config) noexcept;

  SnakeGame(const SnakeGame&) = delete;
  SnakeGame& operator=(const SnakeGame&) = delete;
  SnakeGame(SnakeGame&&) = delete;
  SnakeGame& operator=(SnakeGame&&) = delete;
  ~SnakeGame() noexcept;

  SnakeState getState() const noexcept { return from_fsm_state(fsm_.current); }
  const GameState& getModel() const noexcept { return state_; }

#ifdef SNAKE_TEST_ACCESS
  // Для тестирования: ручная установка еды и тела змейки
  void set_food_for_testing(int x, int y) noexcept {
    state_.food = Position(x, y);
  }

  void set_body_for_testing(std::deque<Position> body,
                            Direction heading) noexcept {
    state_.body = std::move(body);
    state_.heading = heading;
    requested_ = heading;
  }
#endif

 private:
  SnakeGame(const SnakeConfig_t& config, std::unique_ptr<RandomSource> rng);

  static const fsm_transition_t transitions_[];
  static void on_state_enter_(fsm_context_t ctx);

  SnakeEvent mapActionToEvent_(UserAction_t action) const noexcept;
  void processEvent_(SnakeEvent ev) noexcept;
  void requestDirection_(Direction direction) noexcept;
  void resetSession_();
  void move_() noexcept;
  void updateFieldState_() noexcept;
  SnakeStatus_t status_() const noexcept;

  SnakeConfig_t config_;
  std::unique_ptr<RandomSource> rng_;
  GameState state_;
  Direction requested_ = Direction::RIGHT;
  GameInfo_t info_{};
  fsm_t fsm_{};
};

}  // namespace csnake

#endif  // CSNAKE_INTERNALS_HPP
