/**
 * @file fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Табличный конечный автомат для игровой логики
 *
 * Библиотека не знает ничего о конкретной игре: состояния и события задаются
 * целыми числами в пользовательском коде, а правила перехода описываются
 * статической таблицей. Колбэки on_exit / on_enter получают пользовательский
 * контекст.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_LAUNCH = 1, EVT_BALL_LOST, EVT_OUT_OF_LIVES, EVT_RESTART };
 * enum { ST_WAITING = 1, ST_IN_PLAY, ST_GAME_OVER };
 *
 * typedef struct {
 *   int lives;
 *   bool launched;
 * } Match;
 *
 * static void on_enter_play(fsm_context_t ctx) {
 *   ((Match *)ctx)->launched = true;
 * }
 *
 * static const fsm_transition_t table[] = {
 *   {ST_WAITING, EVT_LAUNCH, ST_IN_PLAY, NULL, on_enter_play},
 *   {ST_IN_PLAY, EVT_BALL_LOST, ST_WAITING, NULL, NULL},
 *   {ST_IN_PLAY, EVT_OUT_OF_LIVES, ST_GAME_OVER, NULL, NULL},
 *   {ST_GAME_OVER, EVT_RESTART, ST_WAITING, NULL, NULL},
 * };
 *
 * fsm_t fsm;
 * Match match = {3, false};
 * fsm_init(&fsm, &match, table, 4, ST_WAITING);
 * fsm_process_event(&fsm, EVT_LAUNCH);  // ST_WAITING -> ST_IN_PLAY
 * @endcode
 *
 * @{
 */

#ifndef CODEBREAK_FSM_H
#define CODEBREAK_FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Зарезервированное значение "нет события".
 *
 * fsm_process_event() никогда не выполняет переход по этому событию.
 * Пользовательские события должны начинаться с 1.
 */
#define FSM_EVENT_NONE 0

/**
 * @typedef fsm_event_t
 * @brief Идентификатор события (триггера) автомата.
 */
typedef int fsm_event_t;

/**
 * @typedef fsm_state_t
 * @brief Идентификатор состояния автомата.
 *
 * @note Рекомендуется задавать состояния через enum class на стороне C++
 *       и приводить их явными функциями-конвертерами.
 */
typedef int fsm_state_t;

/**
 * @typedef fsm_context_t
 * @brief Пользовательский контекст, передаваемый в колбэки (может быть NULL).
 */
typedef void *fsm_context_t;

/**
 * @typedef fsm_cb_t
 * @brief Колбэк входа или выхода из состояния.
 *
 * @note Вызов fsm_process_event() из колбэка отклоняется: во время перехода
 *       флаг processing выставлен.
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило "из `src` по `event` перейти в `dst`".
 *
 * Допускаются переходы в то же состояние (`src == dst`): колбэки при этом
 * вызываются как при обычном переходе.
 *
 * @note При нескольких подходящих правилах выполняется первое в таблице.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;
  fsm_cb_t on_enter;
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Экземпляр автомата.
 *
 * @var fsm_t::transitions
 *      Таблица переходов (память не принадлежит автомату).
 * @var fsm_t::count
 *      Количество правил в таблице.
 * @var fsm_t::current
 *      Текущее состояние.
 * @var fsm_t::ctx
 *      Пользовательский контекст.
 * @var fsm_t::processing
 *      Выставлен на время выполнения перехода.
 *
 * @note Поля только для чтения. Изменяйте автомат через API.
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
 * @param[in]  count       Количество правил (> 0).
 * @param[in]  start_state Начальное состояние.
 * @return true при успехе, false при некорректных аргументах.
 *
 * @note on_enter начального состояния не вызывается.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Отвязать автомат от таблицы и контекста.
 *
 * После вызова любые события отклоняются до повторного fsm_init().
 * Безопасна при передаче NULL.
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Обработать событие.
 *
 * Ищет первое правило с `src == current` и `event == event` и выполняет
 * on_exit, смену состояния, on_enter.
 *
 * @param[in,out] fsm   Автомат.
 * @param[in]     event Событие.
 * @return true, если переход выполнен; false, если правила нет, событие
 *         равно FSM_EVENT_NONE, автомат уже выполняет переход или fsm == NULL.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Проверить, есть ли в текущем состоянии правило для события.
 *
 * @return true, если fsm_process_event() с этим событием выполнит переход.
 */
bool fsm_can_process(const fsm_t *fsm, fsm_event_t event);

#ifdef __cplusplus
}
#endif

#endif /* CODEBREAK_FSM_H */

/** @} */  // end of FSM module
