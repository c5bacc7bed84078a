/**
 * @file view.h
 * @brief Публичный API модуля отображения Code Break
 *
 * Абстрактный интерфейс (View) для любых видов отображения игры (CLI, GUI).
 * View не знает о модели: контроллер получает от него размеры области и
 * метрики шрифта, передаёт их модели, а снимок GameInfo_t отдаёт обратно на
 * отрисовку.
 *
 * Основные идеи:
 * - ViewHandle_t: абстрактный указатель на внутренний контекст интерфейса;
 * - размеры области отрисовки в пикселях (CLI пересчитывает их в ячейки);
 * - ввод описывается через InputEvent_t с нажатием и отпусканием клавиш;
 * - все функции возвращают ViewResult_t.
 *
 * @defgroup View Публичный интерфейс библиотек отображения
 * @ingroup BrickGame
 * @{
 */

#ifndef CODEBREAK_VIEW_H
#define CODEBREAK_VIEW_H

#include <stdbool.h>

#include "../../brick_game/common/cb_bgame.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @typedef ViewHandle_t
 * @brief Абстрактный указатель на внутренний контекст View-модуля.
 */
typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат выполнения операций View.
 */
typedef enum {
  VIEW_OK,               ///< Операция успешна
  VIEW_ERROR,            ///< Общая ошибка
  VIEW_BAD_DATA,         ///< Некорректные данные (NULL, неверный снимок)
  VIEW_NOT_INITIALIZED,  ///< View не инициализирован
  VIEW_NO_EVENT          ///< Событие ввода отсутствует (для poll_input)
} ViewResult_t;

/**
 * @enum KeyState_t
 * @brief Вид события клавиши.
 *
 * Терминал не сообщает об отпускании клавиш, поэтому CLI выдаёт
 * KEY_STATE_TAP; оконный интерфейс выдаёт пары KEY_STATE_DOWN / KEY_STATE_UP.
 */
typedef enum {
  KEY_STATE_TAP = 0,   ///< однократное нажатие
  KEY_STATE_DOWN = 1,  ///< клавиша нажата (удерживается)
  KEY_STATE_UP = 2     ///< клавиша отпущена
} KeyState_t;

/**
 * @struct InputEvent_t
 * @brief Событие ввода пользователя.
 *
 * @var InputEvent_t::key_code
 *     Логический код клавиши: стрелки приводятся к 'a' / 'd', Esc = 27.
 * @var InputEvent_t::key_state
 *     Значение KeyState_t.
 */
typedef struct {
  int key_code;
  int key_state;
} InputEvent_t;

/* Код клавиши Esc */
#define VIEW_KEY_ESCAPE 27

/**
 * @brief Главный интерфейс View (аналог vtable).
 *
 * @code
 * ViewHandle_t view = cli_view.init(800, 520, 60);
 * int w = 0, h = 0;
 * cli_view.get_viewport(view, &w, &h);
 * @endcode
 */
typedef struct ViewInterface {
  int version;  ///< Версия интерфейса (VIEW_INTERFACE_VERSION)

  /**
   * @brief Инициализация движка отображения.
   * @param width  Желаемая ширина области в пикселях
   * @param height Желаемая высота области в пикселях
   * @param fps    Частота обновления кадров
   * @return Контекст или NULL при ошибке
   */
  ViewHandle_t (*init)(int width, int height, int fps);

  /**
   * @brief Текущий размер области отрисовки в пикселях.
   *
   * Размер может меняться между кадрами (изменение окна или терминала).
   */
  ViewResult_t (*get_viewport)(ViewHandle_t handle, int *width, int *height);

  /**
   * @brief Метрики шрифта, которым рисуется код.
   *
   * Заполненная структура передаётся в GameConfig_t::metrics. Поле ctx
   * действительно до shutdown().
   */
  ViewResult_t (*get_font_metrics)(ViewHandle_t handle, FontMetrics_t *out);

  /**
   * @brief Отрисовывает снимок игры в буфер.
   *
   * @note Снимок копируется: после возврата его можно освобождать.
   */
  ViewResult_t (*draw_frame)(ViewHandle_t handle, const GameInfo_t *info);

  /// Выводит буфер на экран.
  ViewResult_t (*render)(ViewHandle_t handle);

  /**
   * @brief Читает событие ввода.
   * @return VIEW_OK при наличии события, VIEW_NO_EVENT если его нет
   */
  ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

  /**
   * @brief Завершает работу и освобождает ресурсы.
   * @note handle становится недействительным после вызова.
   */
  ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

/* Текущая версия API */
#define VIEW_INTERFACE_VERSION 2

#ifdef __cplusplus
}
#endif

#endif  // CODEBREAK_VIEW_H

/** @} */
