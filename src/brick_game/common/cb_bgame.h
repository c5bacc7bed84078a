/**
 * @file cb_bgame.h
 * @brief Публичные C-типы движка Code Break
 *
 * Общий контракт между моделью игры, контроллером и модулями отображения:
 * - действия пользователя (UserAction_t);
 * - снимок состояния для отрисовки (GameInfo_t);
 * - метрики шрифта, которыми модуль отображения измеряет текст (FontMetrics_t);
 * - параметры создания игры (GameConfig_t);
 * - таблица функций игры (GameInterface_t).
 *
 * Все координаты в пикселях области отрисовки, ось Y направлена вниз.
 *
 * @defgroup BrickGame Движок Code Break
 * @{
 */

#ifndef CODEBREAK_BGAME_H
#define CODEBREAK_BGAME_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum UserAction_t
 * @brief Действия пользователя.
 *
 * - Left / Right: удерживаемые направления (hold = клавиша нажата);
 * - Launch, Restart, Refresh: однократные команды;
 * - Terminate: выход, обрабатывается контроллером.
 */
typedef enum UserAction_t {
  Launch,
  Restart,
  Refresh,
  Terminate,
  Left,
  Right
} UserAction_t;

/**
 * @enum GameStatus_t
 * @brief Состояние партии.
 */
typedef enum {
  GAME_STATUS_WAITING_FOR_LAUNCH,  ///< мяч лежит на ракетке
  GAME_STATUS_IN_PLAY,             ///< мяч в движении
  GAME_STATUS_GAME_OVER            ///< жизни закончились
} GameStatus_t;

/**
 * @struct CbRect_t
 * @brief Прямоугольник: левый верхний угол и размеры.
 */
typedef struct {
  double x;
  double y;
  double width;
  double height;
} CbRect_t;

/**
 * @struct BrickInfo_t
 * @brief Живой кирпич в снимке.
 *
 * @note Строки принадлежат игре и действительны до следующего изменяющего
 *       вызова (update, input, resize, destroy).
 */
typedef struct {
  int id;                   ///< порядковый номер в раскладке
  CbRect_t rect;            ///< границы кирпича
  const char *label;        ///< токен
  const char *source_text;  ///< вся исходная строка
  int line_number;          ///< номер исходной строки (с 1)
} BrickInfo_t;

/**
 * @struct LineInfo_t
 * @brief Номер строки для колонки слева от кода.
 */
typedef struct {
  int line_number;
  double baseline_y;
} LineInfo_t;

/**
 * @struct GameInfo_t
 * @brief Снимок состояния игры для отрисовки.
 *
 * Содержит только живые кирпичи. Снимок не меняется при отрисовке.
 */
typedef struct GameInfo_t {
  CbRect_t paddle;
  double ball_x;
  double ball_y;
  double ball_radius;
  const BrickInfo_t *bricks;
  size_t brick_count;
  const LineInfo_t *lines;
  size_t line_count;
  int score;
  int high_score;
  int lives;
  int game_over;  ///< 1 после потери последней жизни
  GameStatus_t status;
  int viewport_width;   ///< эффективная ширина (с учётом минимума)
  int viewport_height;  ///< эффективная высота (с учётом минимума)
} GameInfo_t;

/**
 * @struct FontMetrics_t
 * @brief Метрики шрифта, которым модуль отображения рисует код.
 *
 * @var FontMetrics_t::text_width
 *      Ширина текста в пикселях (len байт UTF-8, без '\0').
 *      Если NULL, используется моноширинная сетка char_width.
 * @var FontMetrics_t::char_width
 *      Ширина символа моноширинной сетки (используется при text_width == NULL).
 */
typedef struct {
  void *ctx;
  int (*text_width)(void *ctx, const char *text, size_t len);
  int char_width;
  int height;
  int ascent;
} FontMetrics_t;

/**
 * @struct GameConfig_t
 * @brief Параметры создания игры.
 *
 * @var GameConfig_t::source_path
 *      Текстовый файл с кодом. NULL или недоступный файл: встроенные строки.
 * @var GameConfig_t::cursor_line
 *      Строка курсора (с 1), с которой начинается раскладка; 0: неизвестна.
 */
typedef struct {
  const char *source_path;
  int cursor_line;
  int viewport_width;
  int viewport_height;
  FontMetrics_t metrics;
} GameConfig_t;

/**
 * @struct GameInterface_t
 * @brief Таблица функций игры для контроллера.
 */
typedef struct {
  void *(*create)(const GameConfig_t *config);
  void (*destroy)(void *game);
  void (*input)(void *game, UserAction_t action, bool hold);
  void (*update)(void *game);
  void (*resize)(void *game, int width, int height);
  const GameInfo_t *(*get_info)(const void *game);
} GameInterface_t;

#ifdef __cplusplus
}
#endif

#endif /* CODEBREAK_BGAME_H */

/** @} */
