/**
 * @file csnake_model.hpp
 * @brief Игровая логика "Змейки": состояние и шаг симуляции
 *
 * Модуль не зависит от отрисовки, ввода и времени. Состояние игры —
 * обычное значение GameState, которым владеет вызывающий код; функция
 * шага получает его, продвигает на один тик и возвращает результат.
 *
 * Система координат экранная: x растёт вправо, y — вниз.
 *
 * Инварианты живой змейки:
 * - все сегменты лежат внутри поля
 * - сегменты не повторяются
 * - еда не совпадает ни с одним сегментом
 *
 * @author provemet
 * @version 1.0
 * @see csnake_internals.hpp — игровая сессия поверх модели
 */

#ifndef CSNAKE_MODEL_HPP
#define CSNAKE_MODEL_HPP

#include <deque>

#include "csnake_random.hpp"

namespace csnake {

/**
 * @brief Направление движения змейки
 */
enum class Direction { UP, DOWN, LEFT, RIGHT };

/**
 * @brief Клетка поля
 */
struct Position {
  int x = 0;
  int y = 0;

  constexpr Position() noexcept = default;
  constexpr Position(int x_, int y_) noexcept : x(x_), y(y_) {}
};

constexpr bool operator==(const Position& a, const Position& b) noexcept {
  return a.x == b.x && a.y == b.y;
}

constexpr bool operator!=(const Position& a, const Position& b) noexcept {
  return !(a == b);
}

/**
 * @brief Размеры поля в клетках. Не меняются в течение сессии.
 */
struct Grid {
  int width = 0;
  int height = 0;

  constexpr bool contains(const Position& p) const noexcept {
    return p.x >= 0 && p.x < width && p.y >= 0 && p.y < height;
  }

  constexpr int cellCount() const noexcept { return width * height; }
};

/**
 * @brief Полное состояние одной игры
 *
 * `body` упорядочено от головы к хвосту.
 */
struct GameState {
  Grid grid;
  std::deque<Position> body;
  Direction heading = Direction::RIGHT;
  Position food{-1, -1};
  int score = 0;
  bool alive = true;
  bool won = false;  ///< змейка заняла всё поле

  /// Игра окончена поражением или победой
  bool finished() const noexcept { return !alive || won; }
};

/**
 * @brief Что произошло за тик
 */
enum class StepOutcome {
  MOVED,        ///< обычный ход
  ATE,          ///< съедена еда, змейка выросла
  HIT_WALL,     ///< голова вышла за поле
  HIT_SELF,     ///< голова попала в тело
  FILLED_GRID,  ///< съедена последняя еда, свободных клеток не осталось
  FINISHED      ///< состояние уже было терминальным, ничего не изменилось
};

/// Противоположное направление
constexpr Direction opposite(Direction d) noexcept {
  switch (d) {
    case Direction::UP:
      return Direction::DOWN;
    case Direction::DOWN:
      return Direction::UP;
    case Direction::LEFT:
      return Direction::RIGHT;
    case Direction::RIGHT:
      break;
  }
  return Direction::LEFT;
}

/// Единичный вектор направления
constexpr Position offset(Direction d) noexcept {
  switch (d) {
    case Direction::UP:
      return {0, -1};
    case Direction::DOWN:
      return {0, 1};
    case Direction::LEFT:
      return {-1, 0};
    case Direction::RIGHT:
      break;
  }
  return {1, 0};
}

/**
 * @brief Эффективное направление тика
 *
 * Разворот на 180° игнорируется: змейка продолжает двигаться прямо.
 */
constexpr Direction resolveHeading(Direction current,
                                   Direction requested) noexcept {
  return requested == opposite(current) ? current : requested;
}

/**
 * @brief Занята ли клетка телом змейки
 * @param include_tail учитывать ли последний сегмент
 */
bool occupies(const GameState& state, const Position& p,
              bool include_tail) noexcept;

/**
 * @brief Поставить еду на случайную свободную клетку
 *
 * Клетка выбирается равномерно среди всех клеток, не занятых телом.
 *
 * @return false, если свободных клеток нет; еда при этом не меняется
 */
bool placeFood(GameState& state, RandomSource& rng);

/**
 * @brief Создать начальное состояние
 *
 * Голова стоит в (width / 2, height / 2), тело вытянуто влево,
 * направление — вправо, счёт 0, еда на случайной свободной клетке.
 *
 * @param grid           Размеры поля
 * @param initial_length Длина змейки; ограничивается так, чтобы хвост
 *                       остался внутри поля
 * @param rng            Источник для размещения еды
 */
GameState makeInitialState(const Grid& grid, int initial_length,
                           RandomSource& rng);

/**
 * @brief Продвинуть состояние на один тик (на месте)
 *
 * 1. Эффективное направление — resolveHeading(heading, requested).
 * 2. Новая голова = голова + offset(направление).
 * 3. Вне поля → alive = false.
 * 4. Попадание в тело → alive = false. Хвост не считается, если змейка
 *    не ест в этот тик: он освободит клетку.
 * 5. Еда → рост, +1 к счёту, новая еда; нет свободных клеток → won.
 *    Иначе голова добавляется, хвост удаляется.
 *
 * При столкновении состояние, кроме флага alive, не меняется.
 * Терминальное состояние возвращается без изменений.
 */
StepOutcome advance(GameState& state, Direction requested, RandomSource& rng);

/**
 * @brief Функциональная форма advance(): старое состояние → новое
 */
GameState step(GameState state, Direction requested, RandomSource& rng);

/// Имя исхода для логов
const char* toString(StepOutcome outcome) noexcept;

/// Имя направления для логов
const char* toString(Direction direction) noexcept;

}  // namespace csnake

#endif  // CSNAKE_MODEL_HPP
