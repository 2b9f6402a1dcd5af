/**
 * @file csnake_bgame.h
 * @brief Публичные типы игрового движка csnake
 *
 * Общие для модели, контроллера и представлений структуры данных:
 * - UserAction_t — действия пользователя, которые понимает игра
 * - SnakeStatus_t — фаза игровой сессии для отрисовки экранов
 * - SnakeConfig_t — параметры новой сессии
 * - GameInfo_t — снимок состояния для отрисовки
 * - GameInterface_t — таблица функций игры (аналог vtable)
 *
 * Заголовок совместим с C: контроллер и представления работают с игрой
 * только через эти типы и не видят C++ реализацию.
 *
 * @author provemet
 * @version 1.0
 */

#ifndef CSNAKE_BGAME_H
#define CSNAKE_BGAME_H

#include <stdbool.h>

#ifdef __cplusplus
#define CSNAKE_NOEXCEPT noexcept
extern "C" {
#else
#define CSNAKE_NOEXCEPT
#endif

/**
 * @enum UserAction_t
 * @brief Действие пользователя, переданное в игру.
 */
typedef enum UserAction_t {
  Start,      ///< старт новой игры или перезапуск после окончания
  Pause,      ///< переключение паузы
  Terminate,  ///< принудительное завершение текущей игры
  Left,
  Right,
  Up,
  Down,
  Action      ///< не используется змейкой
} UserAction_t;

/**
 * @enum SnakeStatus_t
 * @brief Фаза игровой сессии.
 */
typedef enum {
  SNAKE_STATUS_READY,    ///< змейка стоит, ждём первого хода
  SNAKE_STATUS_RUNNING,  ///< игра идёт
  SNAKE_STATUS_PAUSED,   ///< пауза
  SNAKE_STATUS_LOST,     ///< столкновение, экран "game over"
  SNAKE_STATUS_WON       ///< змейка заняла всё поле
} SnakeStatus_t;

/**
 * @struct SnakeConfig_t
 * @brief Параметры игровой сессии.
 *
 * Значения по умолчанию возвращает snake_default_config().
 * Корректность проверяет snake_validate_config().
 */
typedef struct SnakeConfig_t {
  int cols;            ///< ширина поля в клетках
  int rows;            ///< высота поля в клетках
  int initial_length;  ///< длина змейки при старте
  int tick_ms;         ///< длительность одного тика
  unsigned seed;       ///< зерно генератора еды; 0 — случайное
} SnakeConfig_t;

/**
 * @brief Значения ячеек в GameInfo_t::field.
 */
enum {
  SNAKE_EMPTY_CELL = 0,
  SNAKE_BODY_CELL = 1,
  SNAKE_HEAD_CELL = 2,
  SNAKE_FOOD_CELL = 3
};

/**
 * @struct GameInfo_t
 * @brief Снимок состояния игры для отрисовки.
 *
 * `field` — массив из `rows` указателей на строки по `cols` ячеек.
 * Строки лежат одним непрерывным блоком, поэтому `field[0]` можно
 * передавать как row-major матрицу rows × cols.
 */
typedef struct GameInfo_t {
  int **field;     ///< игровое поле, field[y][x]
  int rows;        ///< высота поля
  int cols;        ///< ширина поля
  int score;       ///< текущий счёт
  int high_score;  ///< лучший счёт за время работы процесса
  int speed;       ///< длительность тика в миллисекундах
  int pause;       ///< 1 — игра на паузе
  int status;      ///< значение SnakeStatus_t
} GameInfo_t;

/**
 * @struct GameInterface_t
 * @brief Таблица функций игры.
 *
 * Контроллер работает с игрой только через эту таблицу, что позволяет
 * подменять реализацию в тестах.
 */
typedef struct GameInterface_t {
  void *(*create)(const SnakeConfig_t *config);
  void (*destroy)(void *game);
  void (*input)(void *game, UserAction_t action, bool hold);
  void (*update)(void *game);
  const GameInfo_t *(*get_info)(const void *game);
} GameInterface_t;

#ifdef __cplusplus
}
#endif

#endif /* CSNAKE_BGAME_H */
