/**
 * @file fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Табличный конечный автомат для игровых сессий csnake
 *
 * Автомат не знает ничего о конкретной игре: состояния и события задаются
 * целыми числами в пользовательском коде, поведение описывается массивом
 * переходов, а реакция на смену состояния — колбэками on_exit / on_enter.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_START = 1, EVT_PAUSE, EVT_CRASH };
 * enum { ST_READY = 0, ST_RUNNING, ST_PAUSED, ST_LOST };
 *
 * static const fsm_transition_t table[] = {
 *   {ST_READY,   EVT_START, ST_RUNNING, NULL, on_enter_running},
 *   {ST_RUNNING, EVT_PAUSE, ST_PAUSED,  NULL, NULL},
 *   {ST_PAUSED,  EVT_PAUSE, ST_RUNNING, NULL, on_enter_running},
 *   {ST_RUNNING, EVT_CRASH, ST_LOST,    NULL, on_enter_lost},
 * };
 *
 * fsm_t fsm;
 * fsm_init(&fsm, &session, table, 4, ST_READY);
 * fsm_process_event(&fsm, EVT_START);
 * @endcode
 *
 * @author provemet
 * @date December 2024
 *
 * @{
 */

#ifndef CSNAKE_FSM_H
#define CSNAKE_FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Событие автоматического перехода (без внешнего триггера).
 *
 * Такие переходы выполняет только fsm_update(). Пользовательские события
 * не должны принимать это значение.
 */
#define FSM_EVENT_NONE 0

/** @brief Идентификатор события. Значение 0 зарезервировано. */
typedef int fsm_event_t;

/** @brief Идентификатор состояния. */
typedef int fsm_state_t;

/** @brief Пользовательский контекст, передаётся во все колбэки. */
typedef void *fsm_context_t;

/**
 * @brief Колбэк входа/выхода из состояния.
 *
 * @note Вызов fsm_process_event() изнутри колбэка игнорируется —
 *       автомат защищён флагом `processing`.
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило "из `src` по `event` в `dst`".
 *
 * При нескольких совпадениях выполняется первое правило в таблице.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;   ///< вызывается до смены состояния (может быть NULL)
  fsm_cb_t on_enter;  ///< вызывается после смены состояния (может быть NULL)
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Экземпляр автомата.
 *
 * Таблица переходов не копируется и должна жить дольше автомата.
 * Поля не предназначены для изменения вручную.
 */
typedef struct {
  const fsm_transition_t *transitions;
  size_t count;
  fsm_state_t current;
  fsm_context_t ctx;
  bool processing;
} fsm_t;

/**
 * @brief Инициализировать автомат.
 *
 * @param[out] fsm         Автомат (не NULL).
 * @param[in]  ctx         Контекст для колбэков (может быть NULL).
 * @param[in]  transitions Таблица переходов (не NULL).
 * @param[in]  count       Число переходов (> 0).
 * @param[in]  start_state Начальное состояние.
 * @return false, если аргументы некорректны.
 *
 * @note on_enter для start_state не вызывается.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Сбросить автомат в нерабочее состояние. Безопасна для NULL.
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Обработать событие.
 *
 * Ищет переход с `src == current` и `event == event` и выполняет
 * on_exit → смена состояния → on_enter.
 *
 * @return true, если переход выполнен.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Выполнить первый автоматический переход из текущего состояния.
 *
 * @see FSM_EVENT_NONE
 */
void fsm_update(fsm_t *fsm);

/**
 * @brief Текущее состояние автомата.
 * @return Текущее состояние или -1 для NULL.
 */
fsm_state_t fsm_current(const fsm_t *fsm);

/**
 * @brief Проверить, есть ли в таблице переход из текущего состояния по
 *        событию, не выполняя его.
 */
bool fsm_can_process(const fsm_t *fsm, fsm_event_t event);

#ifdef __cplusplus
}
#endif

#endif /* CSNAKE_FSM_H */

/** @} */  // end of FSM module
