/**
 * @file view.h
 * @brief Универсальный интерфейс отображения csnake
 *
 * Таблица функций (аналог vtable), через которую контроллер рисует снимок
 * игры и читает клавиатуру. Представление ничего не знает об игровой
 * логике: оно получает только зоны, числа, строки и матрицы клеток.
 *
 * Реализации:
 * - `cli_view` — терминал через ncurses (cli.h)
 * - `qt_view`  — окно Qt6 Widgets (qt_view.hpp)
 *
 * Координаты и размеры зон задаются в символах терминала. Клетка поля
 * занимает два символа по ширине и один по высоте; Qt масштабирует
 * символ в пиксели.
 *
 * Коды клавиш нормализуются реализацией: стрелки приходят как
 * 'w', 'a', 's', 'd', остальные клавиши передаются своим кодом.
 *
 * @author provemet
 * @defgroup View Интерфейс отображения csnake
 * @{
 */

#ifndef CSNAKE_VIEW_H
#define CSNAKE_VIEW_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @typedef ViewHandle_t
 * @brief Абстрактный указатель на внутренний контекст View-модуля.
 *
 * Контроллер получает этот handle при инициализации интерфейса и передаёт во все функции View.
 * Содержимое скрыто от пользователя — это обеспечивает независимость и безопасность.
 */
typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат выполнения операций View.
 */
typedef enum {
    VIEW_OK,              ///< Операция успешна
    VIEW_ERROR,           ///< Общая ошибка
    VIEW_INVALID_ID,      ///< Недопустимый element_id
    VIEW_BAD_DATA,        ///< Некорректные данные (например, NULL data при matrix)
    VIEW_NOT_INITIALIZED, ///< View не инициализирован
    VIEW_NO_EVENT         ///< Событие ввода отсутствует (для poll_input)
} ViewResult_t;

/**
 * @struct InputEvent_t
 * @brief Описывает событие ввода пользователя.
 *
 * @var InputEvent_t::key_code
 *     Нормализованный код клавиши ('w', 'a', 's', 'd' для стрелок). Если
 *     событие отсутствует, key_code == 0.
 * @var InputEvent_t::key_state
 *     - 0: однократное нажатие
 *     - 1: удержание
 *
 * @note Если события нет, poll_input() возвращает VIEW_NO_EVENT.
 */
typedef struct {
    int key_code;
    int key_state;
} InputEvent_t;

/**
 * @enum ElementType_t
 * @brief Тип содержимого для отрисовки.
 */
typedef enum {
    ELEMENT_TEXT,   ///< const char* (поддерживает '\n')
    ELEMENT_NUMBER, ///< int
    ELEMENT_MATRIX  ///< двумерный массив int (значения клеток SNAKE_*_CELL)
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Универсальный контейнер для передачи данных.
 *
 * @note Память, на которую указывают content.text и content.matrix.data,
 *       может не копироваться. Данные должны быть валидны до вызова render().
 * @note Массив хранится в row-major порядке: элемент (x,y) → индекс = y * width + x.
 * @note Максимальная длина строки text — 512 байт (включая '\0').
 */
typedef struct ElementData_t {
    ElementType_t type;
    union {
        const char *text;      ///< для ELEMENT_TEXT
        int         number;    ///< для ELEMENT_NUMBER
        struct {               ///< для ELEMENT_MATRIX
            const int *data;   ///< указатель на данные (row-major)
            int        width;  ///< ширина матрицы
            int        height; ///< высота матрицы
        } matrix;
    } content;
} ElementData_t;

/**
 * @brief Главный интерфейс View (аналог vtable).
 *
 * Реализация должна экспортировать экземпляр этой структуры.
 *
 * Пример:
 * @code
 * extern const ViewInterface cli_view;
 * ViewHandle_t view = cli_view.init(64, 22, 60);
 * @endcode
 */
typedef struct ViewInterface {
    int version; ///< Версия интерфейса (текущая: 1)

    /**
     * @brief Инициализация движка отображения.
     * @param width  Ширина всей раскладки зон в символах
     * @param height Высота всей раскладки зон в символах
     * @param fps    Частота опроса ввода и перерисовки
     * @return Контекст или NULL при ошибке
     *
     * @note Одновременно может существовать только один контекст
     *       каждой реализации.
     */
    ViewHandle_t (*init)(int width, int height, int fps);

    /**
     * @brief Настраивает зону вывода.
     * @param handle     Контекст
     * @param element_id Имя зоны (макс. 31 символ, без '\0')
     * @param x, y       Позиция в символах
     * @param max_width  Макс. ширина (в символах)
     * @param max_height Макс. высота (в символах)
     * @return VIEW_OK при успехе
     *
     * @note Если зона уже существует — перезаписывается.
     */
    ViewResult_t (*configure_zone)(ViewHandle_t handle,
                                   const char   *element_id,
                                   int           x,
                                   int           y,
                                   int           max_width,
                                   int           max_height);

    /**
     * @brief Отрисовывает элемент в буфер.
     * @param handle     Контекст
     * @param element_id Идентификатор зоны
     * @param data       Данные для отрисовки
     * @return VIEW_OK при успехе
     *
     * @note Данные не копируются. Убедитесь, что память валидна до render().
     * @note type должен соответствовать заполненному полю content.
     */
    ViewResult_t (*draw_element)(ViewHandle_t          handle,
                                 const char            *element_id,
                                 const ElementData_t   *data);

    /**
     * @brief Выводит буфер на экран.
     * @param handle Контекст
     * @return VIEW_OK при успехе
     */
    ViewResult_t (*render)(ViewHandle_t handle);

    /**
     * @brief Читает событие ввода.
     * @param handle Контекст
     * @param event  Указатель, куда записать событие
     * @return VIEW_OK при наличии события, VIEW_NO_EVENT — если нет
     *
     * @note Не блокирует. Всегда проверяйте возвращаемое значение.
     */
    ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

    /**
     * @brief Завершает работу и освобождает ресурсы.
     * @param handle Контекст
     * @return VIEW_OK или VIEW_ERROR
     *
     * @note handle становится недействительным после вызова.
     */
    ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

/* Текущая версия API */
#define VIEW_INTERFACE_VERSION 1

#ifdef __cplusplus
}
#endif

#endif // CSNAKE_VIEW_H

/** @} */  // end of View module