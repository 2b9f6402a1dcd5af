/**
 * @file csnake_bgame_cmn.h
 * @brief Общие утилиты для работы со снимком игры
 *
 * Функции этого модуля используются моделью (выделение и очистка поля),
 * контроллером и тестами (проверка корректности снимка):
 * - управление памятью игрового поля произвольного размера
 * - создание и освобождение структуры GameInfo_t
 * - валидация действий пользователя, поля и снимка
 *
 * Поле хранится одним непрерывным блоком rows × cols, поверх которого
 * лежит массив указателей на строки. Благодаря этому `field[y][x]`
 * работает как обычный двумерный массив, а `field[0]` — как row-major
 * матрица для ViewInterface::draw_element().
 *
 * @author provemet
 * @version 1.1
 */

#ifndef CSNAKE_BGAME_CMN_H
#define CSNAKE_BGAME_CMN_H

#include "csnake_bgame.h"

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Выделить память для игрового поля rows × cols
 *
 * Все ячейки инициализируются значением SNAKE_EMPTY_CELL.
 *
 * @code
 * int **field = csnake_allocate_field(20, 20);
 * field[3][5] = SNAKE_FOOD_CELL;
 * csnake_free_field(field);
 * @endcode
 *
 * @param rows Число строк (> 0)
 * @param cols Число столбцов (> 0)
 * @return Указатель на поле или NULL при ошибке выделения или неверном размере
 *
 * @note Освобождать только через csnake_free_field().
 */
int **csnake_allocate_field(int rows, int cols) CSNAKE_NOEXCEPT;

/**
 * @brief Освободить поле, выделенное csnake_allocate_field().
 *
 * Безопасна при вызове с NULL.
 */
void csnake_free_field(int **field) CSNAKE_NOEXCEPT;

/**
 * @brief Заполнить все ячейки поля значением SNAKE_EMPTY_CELL.
 *
 * Память не освобождается. Безопасна при вызове с NULL.
 */
void csnake_clear_field(int **field, int rows, int cols) CSNAKE_NOEXCEPT;

/**
 * @brief Создать снимок с выделенным полем rows × cols
 *
 * Начальные значения: score = 0, high_score = 0, pause = 0,
 * status = SNAKE_STATUS_READY, speed = 0.
 *
 * @return Инициализированная структура. При ошибке выделения памяти
 *         поле `field` равно NULL — проверьте его перед использованием.
 *
 * @see csnake_destroy_game_info()
 */
GameInfo_t csnake_create_game_info(int rows, int cols) CSNAKE_NOEXCEPT;

/**
 * @brief Освободить поле снимка и обнулить структуру
 *
 * Безопасна при вызове с NULL и с уже освобождённой структурой.
 */
void csnake_destroy_game_info(GameInfo_t *info) CSNAKE_NOEXCEPT;

/**
 * @brief Проверить, что значение входит в перечисление UserAction_t.
 */
bool csnake_is_valid_action(UserAction_t action) CSNAKE_NOEXCEPT;

/**
 * @brief Проверить поле
 *
 * - указатель не NULL, размеры положительные
 * - каждая ячейка содержит одно из значений SNAKE_*_CELL
 */
bool csnake_is_valid_field(int **field, int rows, int cols) CSNAKE_NOEXCEPT;

/**
 * @brief Проверить снимок целиком
 *
 * - поле корректно (см. csnake_is_valid_field())
 * - score и high_score неотрицательны, score <= high_score
 * - speed положительна, pause равна 0 или 1
 * - status входит в SnakeStatus_t
 *
 * @code
 * const GameInfo_t *info = snake_get_info(game);
 * if (info != NULL && csnake_is_valid_game_info(info)) {
 *     // можно рисовать
 * }
 * @endcode
 */
bool csnake_is_valid_game_info(const GameInfo_t *info) CSNAKE_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif /* CSNAKE_BGAME_CMN_H */
