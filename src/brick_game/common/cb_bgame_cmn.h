/**
 * @file cb_bgame_cmn.h
 * @brief Общие утилиты над C-снимком Code Break
 *
 * Функции только читают переданные данные и подходят для вызова из любого
 * модуля отображения:
 * - проверка действий пользователя и снимка состояния;
 * - поиск кирпича под курсором мыши;
 * - текст всплывающей подсказки для кирпича.
 */

#ifndef CODEBREAK_BGAME_COMMON_H
#define CODEBREAK_BGAME_COMMON_H

#ifdef __cplusplus
extern "C" {
#endif

#include "cb_bgame.h"

/**
 * @brief Проверить корректность значения UserAction_t
 *
 * @param action Значение действия
 * @return true если действие входит в перечисление (от Launch до Right)
 */
bool brickgame_is_valid_action(UserAction_t action);

/**
 * @brief Проверить корректность снимка GameInfo_t
 *
 * Проверяет:
 * - info не NULL;
 * - при ненулевом числе кирпичей / строк указатели на массивы не NULL;
 * - у каждого кирпича положительные размеры и непустые строки;
 * - score, high_score и lives неотрицательны, score <= high_score;
 * - game_over согласован со status;
 * - радиус мяча и размеры ракетки положительны.
 *
 * @param info Снимок
 * @return true если снимок корректен
 *
 * @code
 * const GameInfo_t *info = codebreak_get_info(game);
 * if (brickgame_is_valid_game_info(info)) {
 *     view->draw_frame(handle, info);
 * }
 * @endcode
 */
bool brickgame_is_valid_game_info(const GameInfo_t *info);

/**
 * @brief Найти кирпич под точкой
 *
 * Возвращает первый (в порядке раскладки) кирпич снимка, прямоугольник
 * которого содержит точку. Левая и верхняя границы входят в прямоугольник,
 * правая и нижняя нет.
 *
 * @param info Снимок (может быть NULL)
 * @param x, y Координаты точки
 * @return Указатель на элемент info->bricks или NULL
 */
const BrickInfo_t *brickgame_find_brick_at(const GameInfo_t *info, double x,
                                           double y);

/**
 * @brief Текст подсказки для кирпича
 *
 * Подсказка показывает строку целиком и нужна только тогда, когда строка
 * длиннее токена.
 *
 * @param brick Кирпич (может быть NULL)
 * @return brick->source_text, если он отличается от brick->label; иначе NULL
 */
const char *brickgame_tooltip_text(const BrickInfo_t *brick);

#ifdef __cplusplus
}
#endif

#endif /* CODEBREAK_BGAME_COMMON_H */
