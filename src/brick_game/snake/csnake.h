/**
 * @file csnake.h
 * @brief Публичный C интерфейс игры "Змейка"
 *
 * Экземпляр игры — непрозрачный указатель. Все функции безопасны при
 * вызове с NULL и не выбрасывают исключений.
 *
 * @code
 * void *game = snake_create();
 * snake_handle_input(game, Start, false);
 * while (running) {
 *     snake_update(game);
 *     const GameInfo_t *info = snake_get_info(game);
 *     draw(info);
 *     sleep_ms(info->speed);
 * }
 * snake_destroy(game);
 * @endcode
 *
 * @see csnake_internals.hpp — C++ реализация
 */

#ifndef CSNAKE_H
#define CSNAKE_H

#include "csnake_bgame.h"
#include "csnake_gamepref.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum SnakeConfigResult_t
 * @brief Результат проверки SnakeConfig_t.
 */
typedef enum {
  SNAKE_CONFIG_OK,          ///< конфигурация корректна
  SNAKE_CONFIG_NULL,        ///< передан NULL
  SNAKE_CONFIG_BAD_SIZE,    ///< размеры поля вне допустимых границ
  SNAKE_CONFIG_BAD_LENGTH,  ///< змейка не помещается левее центра
  SNAKE_CONFIG_BAD_TICK     ///< длительность тика не положительна
} SnakeConfigResult_t;

/** @brief Конфигурация по умолчанию (см. csnake_gamepref.h). */
SnakeConfig_t snake_default_config(void) CSNAKE_NOEXCEPT;

/** @brief Проверить конфигурацию. */
SnakeConfigResult_t snake_validate_config(const SnakeConfig_t *config)
    CSNAKE_NOEXCEPT;

/** @brief Текстовое описание результата проверки для логов. */
const char *snake_config_result_str(SnakeConfigResult_t result)
    CSNAKE_NOEXCEPT;

/**
 * @brief Создать игру с конфигурацией по умолчанию.
 * @return Экземпляр игры или NULL при нехватке памяти.
 */
void *snake_create(void) CSNAKE_NOEXCEPT;

/**
 * @brief Создать игру с заданной конфигурацией.
 * @return Экземпляр игры или NULL, если конфигурация некорректна или
 *         не удалось выделить память. NULL в config означает
 *         конфигурацию по умолчанию.
 */
void *snake_create_ex(const SnakeConfig_t *config) CSNAKE_NOEXCEPT;

/** @brief Уничтожить игру. Безопасна для NULL. */
void snake_destroy(void *game) CSNAKE_NOEXCEPT;

/**
 * @brief Передать действие пользователя.
 *
 * Направления буферизуются до следующего snake_update(): в тике
 * участвует последнее полученное направление.
 */
void snake_handle_input(void *game, UserAction_t action,
                        bool hold) CSNAKE_NOEXCEPT;

/** @brief Продвинуть игру на один тик. */
void snake_update(void *game) CSNAKE_NOEXCEPT;

/**
 * @brief Снимок состояния для отрисовки.
 *
 * Указатель принадлежит игре и действителен до следующего вызова
 * snake_update(), snake_handle_input() или snake_destroy().
 */
const GameInfo_t *snake_get_info(const void *game) CSNAKE_NOEXCEPT;

/** @brief Таблица функций игры для контроллера. */
GameInterface_t snake_get_interface(void) CSNAKE_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif /* CSNAKE_H */
