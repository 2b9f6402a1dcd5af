/**
 * @file qt_view.hpp
 * @brief Оконное представление csnake на Qt6 Widgets
 *
 * Зоны задаются в символах, как для терминала, и переводятся в пиксели
 * (символ 8×16, клетка поля 16×16). Закрытие окна приходит в poll_input()
 * как клавиша 'q'.
 *
 * @warning Требует существующего QApplication до вызова init().
 * @author provemet
 */

#pragma once

extern "C" {
#include "view.h"  // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-интерфейса для csnake.
 *
 * Реализует контракт ViewInterface, используя Qt-виджеты.
 */
extern const ViewInterface qt_view;
