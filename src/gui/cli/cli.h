/**
 * @file cli.h
 * @brief Терминальное представление csnake на ncurses
 *
 * Реализует @ref ViewInterface поверх stdscr:
 * - матрица поля рисуется в рамке, клетка занимает два символа
 * - текст переносится по '\n' и обрезается по размерам зоны
 * - стрелки нормализуются в 'w', 'a', 's', 'd'
 *
 * Пример использования:
 * @code
 * ViewHandle_t view = cli_view.init(64, 22, 60);
 * cli_view.configure_zone(view, "field", 0, 0, 42, 22);
 * // ... draw_element, render, poll_input
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Реализация сама вызывает initscr() и endwin(). Не используйте
 *       ncurses напрямую, пока представление активно.
 *
 * @defgroup Cli_view Терминальное представление
 * @ingroup View
 *
 * @author provemet
 * @version 1.1
 */

#ifndef CSNAKE_CLI_H
#define CSNAKE_CLI_H

#include "view.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Экземпляр интерфейса отображения для ncurses.
 *
 * Все функции вызываются из одного потока. Повторный init() без
 * shutdown() возвращает NULL.
 */
extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif // CSNAKE_CLI_H

/** @} */
