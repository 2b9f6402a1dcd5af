/**
 * @file csnake_internals.cpp
 * @brief Реализация игровой сессии "Змейки" на C++17
 *
 * Содержит реализацию класса `csnake::SnakeGame`:
 * - управление фазами игры через конечный автомат (FSM)
 * - буферизацию направления между тиками
 * - вызов шага модели и реакцию на его исход
 * - учёт лучшего счёта сессии
 * - синхронизацию снимка GameInfo_t для отрисовки
 *
 * Архитектурные особенности:
 * - **Непрозрачный указатель**: экземпляр скрыт от C API, доступ только
 *   через статические методы `create` / `destroy` / `handle_input` / ...
 * - **Модель отдельно от сессии**: правила движения, роста и столкновений
 *   живут в csnake_model.cpp и не знают о FSM и снимке.
 * - **Таблица переходов FSM** с типизацией через `enum class`.
 *
 * @note Все публичные методы помечены `noexcept`.
 * @note Потокобезопасность не гарантируется.
 *
 * @warning Не изменяйте `transitions_` без синхронизации с
 *          `mapActionToEvent_()` и `on_state_enter_()`.
 *
 * @author provemet
 * @version 1.2
 * @see csnake_internals.hpp — объявление класса и типов
 * @see csnake_model.hpp     — игровая логика
 * @see csnake.cpp           — C API обёртка (extern "C")
 */

#include "csnake_internals.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <new>
#include <utility>

#include "csnake_bgame_cmn.h"
#include "csnake_gamepref.h"

namespace csnake {

/**
 * @internal
 * @brief Таблица переходов FSM игровой сессии
 *
 * { текущее_состояние, событие, новое_состояние, on_exit, on_enter }
 *
 * - INIT + START → MOVE: первый ход, змейка поехала.
 * - MOVE + PAUSE_TOGGLE → PAUSED и обратно.
 * - MOVE / PAUSED + TERMINATE → GAME_OVER: столкновение или выход.
 * - MOVE + WIN → WON: свободных клеток не осталось.
 * - GAME_OVER / WON + START → INIT: перезапуск, новая змейка стоит в центре.
 *
 * @note Тики не являются событиями FSM: update() двигает змейку только
 *       в состоянии MOVE.
 */
const fsm_transition_t SnakeGame::transitions_[] = {
    {to_fsm_state(SnakeState::INIT), to_fsm_event(SnakeEvent::START),
     to_fsm_state(SnakeState::MOVE), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::MOVE), to_fsm_event(SnakeEvent::PAUSE_TOGGLE),
     to_fsm_state(SnakeState::PAUSED), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::PAUSED), to_fsm_event(SnakeEvent::PAUSE_TOGGLE),
     to_fsm_state(SnakeState::MOVE), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::MOVE), to_fsm_event(SnakeEvent::TERMINATE),
     to_fsm_state(SnakeState::GAME_OVER), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::PAUSED), to_fsm_event(SnakeEvent::TERMINATE),
     to_fsm_state(SnakeState::GAME_OVER), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::MOVE), to_fsm_event(SnakeEvent::WIN),
     to_fsm_state(SnakeState::WON), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::GAME_OVER), to_fsm_event(SnakeEvent::START),
     to_fsm_state(SnakeState::INIT), nullptr, &SnakeGame::on_state_enter_},

    {to_fsm_state(SnakeState::WON), to_fsm_event(SnakeEvent::START),
     to_fsm_state(SnakeState::INIT), nullptr, &SnakeGame::on_state_enter_},
};

SnakeConfig_t SnakeGame::default_config() noexcept {
  SnakeConfig_t config{};
  config.cols = CSNAKE_FIELD_COLS;
  config.rows = CSNAKE_FIELD_ROWS;
  config.initial_length = CSNAKE_INITIAL_LENGTH;
  config.tick_ms = CSNAKE_TICK_MS;
  config.seed = 0;
  return config;
}

/**
 * @brief Проверяет параметры сессии
 *
 * - стороны поля в [CSNAKE_MIN_FIELD_SIDE, CSNAKE_MAX_FIELD_SIDE]
 * - змейка длиной initial_length помещается от центра влево:
 *   1 <= initial_length <= cols / 2 + 1
 * - tick_ms > 0
 *
 * Поле 4×4 минимум вмещает змейку максимальной длины (3 клетки) и
 * оставляет свободные клетки для еды.
 */
SnakeConfigResult_t SnakeGame::validate_config(
    const SnakeConfig_t* config) noexcept {
  if (config == nullptr) {
    return SNAKE_CONFIG_NULL;
  }
  if (config->cols < CSNAKE_MIN_FIELD_SIDE ||
      config->cols > CSNAKE_MAX_FIELD_SIDE ||
      config->rows < CSNAKE_MIN_FIELD_SIDE ||
      config->rows > CSNAKE_MAX_FIELD_SIDE) {
    return SNAKE_CONFIG_BAD_SIZE;
  }
  if (config->initial_length < 1 ||
      config->initial_length > config->cols / 2 + 1) {
    return SNAKE_CONFIG_BAD_LENGTH;
  }
  if (config->tick_ms <= 0) {
    return SNAKE_CONFIG_BAD_TICK;
  }
  return SNAKE_CONFIG_OK;
}

/**
 * @brief Создаёт новый экземпляр игры
 * @param[in] config Конфигурация; nullptr — конфигурация по умолчанию
 * @return Непрозрачный указатель или nullptr при ошибке
 *
 * Генератор еды: MtRandomSource с зерном `config->seed`, либо со
 * случайным зерном, если seed == 0.
 *
 * @note nullptr возвращается при некорректной конфигурации (причина
 *       пишется в лог) и при нехватке памяти.
 * @warning Освобождать только через destroy().
 */
void* SnakeGame::create(const SnakeConfig_t* config) noexcept {
  const SnakeConfig_t effective =
      config != nullptr ? *config : default_config();

  try {
    std::unique_ptr<RandomSource> rng =
        effective.seed != 0 ? std::make_unique<MtRandomSource>(effective.seed)
                            : std::make_unique<MtRandomSource>();
    return create(&effective, std::move(rng));
  } catch (const std::bad_alloc&) {
    spdlog::error("[SnakeGame] Out of memory while creating random source");
    return nullptr;
  }
}

/**
 * @brief Создаёт игру с внешним источником случайности
 *
 * Используется тестами для детерминированного размещения еды.
 */
void* SnakeGame::create(const SnakeConfig_t* config,
                        std::unique_ptr<RandomSource> rng) noexcept {
  const SnakeConfig_t effective =
      config != nullptr ? *config : default_config();

  SnakeConfigResult_t check = validate_config(&effective);
  if (check != SNAKE_CONFIG_OK) {
    spdlog::error("[SnakeGame] Invalid config {}x{} len={} tick={}ms: {}",
                  effective.cols, effective.rows, effective.initial_length,
                  effective.tick_ms, snake_config_result_str(check));
    return nullptr;
  }
  if (!rng) {
    spdlog::error("[SnakeGame] No random source");
    return nullptr;
  }

  try {
    auto game = std::unique_ptr<SnakeGame>(
        new SnakeGame(effective, std::move(rng)));
    if (game->info_.field == nullptr) {
      spdlog::error("[SnakeGame] Failed to allocate {}x{} field",
                    effective.cols, effective.rows);
      return nullptr;
    }
    spdlog::info("[SnakeGame] Created {}x{} session, tick {} ms",
                 effective.cols, effective.rows, effective.tick_ms);
    return game.release();
  } catch (const std::bad_alloc&) {
    spdlog::error("[SnakeGame] Out of memory while creating session");
    return nullptr;
  }
}

void SnakeGame::destroy(void* game) noexcept {
  if (game != nullptr) {
    delete static_cast<SnakeGame*>(game);
  }
}

/**
 * @brief Обрабатывает действие пользователя
 * @param[in] game   Экземпляр игры (nullptr игнорируется)
 * @param[in] action Действие
 * @param[in] hold   Флаг удержания клавиши, змейкой не используется
 *
 * Поведение зависит от фазы:
 * - INIT: направление запоминается и сразу запускает игру, Start
 *   запускает игру в текущем направлении
 * - MOVE: направления буферизуются до следующего тика, Pause и
 *   Terminate обрабатываются немедленно
 * - PAUSED: только Pause и Terminate
 * - GAME_OVER / WON: только Start (перезапуск)
 *
 * Разворот на 180° не отсекается здесь: его игнорирует шаг модели.
 */
void SnakeGame::handle_input(void* game, UserAction_t action,
                             bool hold) noexcept {
  (void)hold;
  if (game == nullptr || !csnake_is_valid_action(action)) return;
  auto* self = static_cast<SnakeGame*>(game);
  auto event = self->mapActionToEvent_(action);
  if (event != SnakeEvent::NONE) {
    self->processEvent_(event);
  }
}

/**
 * @brief Продвигает игру на один тик
 *
 * В состоянии MOVE вызывает шаг модели ровно один раз, в остальных
 * состояниях ничего не делает.
 *
 * @note Должна вызываться с периодом GameInfo_t::speed миллисекунд.
 */
void SnakeGame::update(void* game) noexcept {
  if (game == nullptr) return;
  auto* self = static_cast<SnakeGame*>(game);

  if (self->getState() == SnakeState::MOVE) {
    self->move_();
  }
}

/**
 * @brief Снимок состояния для отрисовки
 *
 * Перед возвратом перерисовывает info_.field по текущему состоянию
 * модели: тело — SNAKE_BODY_CELL, голова — SNAKE_HEAD_CELL, еда —
 * SNAKE_FOOD_CELL.
 *
 * @warning Указатель действителен до следующего вызова update(),
 *          handle_input() или destroy().
 */
const GameInfo_t* SnakeGame::get_info(const void* game) noexcept {
  if (game == nullptr) {
    return nullptr;
  }
  // Снимок является кэшем внутри объекта
  auto* self = const_cast<SnakeGame*>(static_cast<const SnakeGame*>(game));
  self->updateFieldState_();
  return &self->info_;
}

/**
 * @private
 * @brief Готовит сессию в состоянии INIT
 *
 * Выделяет поле снимка, создаёт начальное состояние модели и
 * инициализирует FSM.
 *
 * @throw std::bad_alloc при нехватке памяти (перехватывается в create())
 */
SnakeGame::SnakeGame(const SnakeConfig_t& config,
                     std::unique_ptr<RandomSource> rng)
    : config_(config), rng_(std::move(rng)) {
  info_ = csnake_create_game_info(config_.rows, config_.cols);
  info_.speed = config_.tick_ms;

  if (info_.field == nullptr) {
    return;
  }

  resetSession_();

  bool ok = fsm_init(&fsm_, this, transitions_,
                     sizeof(transitions_) / sizeof(transitions_[0]),
                     to_fsm_state(SnakeState::INIT));
  if (!ok) {
    // create() проверяет field и вернёт nullptr
    csnake_destroy_game_info(&info_);
  }
}

SnakeGame::~SnakeGame() noexcept {
  fsm_destroy(&fsm_);
  csnake_destroy_game_info(&info_);
}

SnakeEvent SnakeGame::mapActionToEvent_(UserAction_t action) const noexcept {
  switch (action) {
    case Start:
      return SnakeEvent::START;
    case Pause:
      return SnakeEvent::PAUSE_TOGGLE;
    case Terminate:
      return SnakeEvent::TERMINATE;
    case Left:
      return SnakeEvent::MOVE_LEFT;
    case Right:
      return SnakeEvent::MOVE_RIGHT;
    case Up:
      return SnakeEvent::MOVE_UP;
    case Down:
      return SnakeEvent::MOVE_DOWN;
    case Action:
      return SnakeEvent::NONE;
  }
  return SnakeEvent::NONE;
}

void SnakeGame::processEvent_(SnakeEvent ev) noexcept {
  switch (ev) {
    case SnakeEvent::NONE:
      return;
    case SnakeEvent::MOVE_LEFT:
      requestDirection_(Direction::LEFT);
      return;
    case SnakeEvent::MOVE_RIGHT:
      requestDirection_(Direction::RIGHT);
      return;
    case SnakeEvent::MOVE_UP:
      requestDirection_(Direction::UP);
      return;
    case SnakeEvent::MOVE_DOWN:
      requestDirection_(Direction::DOWN);
      return;
    default:
      if (fsm_process_event(&fsm_, to_fsm_event(ev))) {
        spdlog::debug("[SnakeGame] State -> {}", fsm_current(&fsm_));
      }
      break;
  }
}

void SnakeGame::requestDirection_(Direction direction) noexcept {
  switch (getState()) {
    case SnakeState::INIT:
      // Первое направление одновременно запускает игру
      requested_ = direction;
      processEvent_(SnakeEvent::START);
      break;
    case SnakeState::MOVE:
      requested_ = direction;
      break;
    default:
      break;
  }
}

void SnakeGame::resetSession_() {
  state_ = makeInitialState(Grid{config_.cols, config_.rows},
                            config_.initial_length, *rng_);
  requested_ = state_.heading;
  info_.score = 0;
  info_.pause = 0;
}

void SnakeGame::move_() noexcept {
  StepOutcome outcome;
  try {
    outcome = advance(state_, requested_, *rng_);
  } catch (const std::bad_alloc&) {
    spdlog::critical("[SnakeGame] Out of memory during tick, ending game");
    state_.alive = false;
    outcome = StepOutcome::FINISHED;
  }
  requested_ = state_.heading;

  info_.score = state_.score;
  info_.high_score = std::max(info_.high_score, info_.score);

  switch (outcome) {
    case StepOutcome::MOVED:
      break;
    case StepOutcome::ATE:
      spdlog::debug("[SnakeGame] Ate food, score {} length {}", state_.score,
                    state_.body.size());
      break;
    case StepOutcome::FILLED_GRID:
      spdlog::info("[SnakeGame] Snake filled the grid, you win! Score: {}",
                   state_.score);
      processEvent_(SnakeEvent::WIN);
      break;
    case StepOutcome::HIT_WALL:
    case StepOutcome::HIT_SELF:
    case StepOutcome::FINISHED:
      spdlog::info("[SnakeGame] Game over ({}) heading {}. Score: {} | Best: {}",
                   toString(outcome), toString(state_.heading), state_.score,
                   info_.high_score);
      processEvent_(SnakeEvent::TERMINATE);
      break;
  }
}

void SnakeGame::updateFieldState_() noexcept {
  csnake_clear_field(info_.field, info_.rows, info_.cols);

  const Grid& grid = state_.grid;
  if (grid.contains(state_.food)) {
    info_.field[state_.food.y][state_.food.x] = SNAKE_FOOD_CELL;
  }

  // Тело рисуется после еды: при победе голова стоит на месте еды
  bool head = true;
  for (const auto& seg : state_.body) {
    if (grid.contains(seg)) {
      info_.field[seg.y][seg.x] = head ? SNAKE_HEAD_CELL : SNAKE_BODY_CELL;
    }
    head = false;
  }

  info_.score = state_.score;
  info_.pause = getState() == SnakeState::PAUSED ? 1 : 0;
  info_.status = status_();
}

SnakeStatus_t SnakeGame::status_() const noexcept {
  switch (getState()) {
    case SnakeState::INIT:
      return SNAKE_STATUS_READY;
    case SnakeState::MOVE:
      return SNAKE_STATUS_RUNNING;
    case SnakeState::PAUSED:
      return SNAKE_STATUS_PAUSED;
    case SnakeState::GAME_OVER:
      return SNAKE_STATUS_LOST;
    case SnakeState::WON:
      return SNAKE_STATUS_WON;
  }
  return SNAKE_STATUS_READY;
}

void SnakeGame::on_state_enter_(fsm_context_t ctx) {
  auto* self = static_cast<SnakeGame*>(ctx);

  switch (self->getState()) {
    case SnakeState::INIT:
      // Перезапуск после GAME_OVER / WON
      try {
        self->resetSession_();
      } catch (const std::bad_alloc&) {
        spdlog::critical("[SnakeGame] Out of memory on restart");
        self->state_.alive = false;
        return;
      }
      spdlog::info("[SnakeGame] Restarted, best score {}",
                   self->info_.high_score);
      break;

    case SnakeState::MOVE:
      self->info_.pause = 0;
      break;

    case SnakeState::PAUSED:
      self->info_.pause = 1;
      break;

    case SnakeState::GAME_OVER:
    case SnakeState::WON:
      self->info_.pause = 0;
      break;
  }
}

}  // namespace csnake
