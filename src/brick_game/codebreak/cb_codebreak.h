/**
 * @file cb_codebreak.h
 * @brief C API игры Code Break
 *
 * Игра доступна через непрозрачный указатель. Типичный цикл контроллера:
 *
 * @code
 * GameConfig_t cfg = {"main.c", 42, 800, 520, {NULL, NULL, 8, 16, 12}};
 * void *game = codebreak_create(&cfg);
 * if (!game) {
 *     fprintf(stderr, "Ошибка: не удалось создать игру\n");
 *     return 1;
 * }
 * codebreak_handle_input(game, Launch, false);
 * while (running) {
 *     codebreak_update(game);
 *     draw(codebreak_get_info(game));
 * }
 * codebreak_destroy(game);
 * @endcode
 *
 * @see cb_bgame.h
 */

#ifndef CODEBREAK_CODEBREAK_H
#define CODEBREAK_CODEBREAK_H

#include "../common/cb_bgame.h"

#ifdef __cplusplus
#define CODEBREAK_NOEXCEPT noexcept
extern "C" {
#else
#define CODEBREAK_NOEXCEPT
#endif

/**
 * @brief Создать игру
 * @param config Параметры; NULL: встроенные строки и минимальная область
 * @return Контекст игры или NULL при ошибке
 */
void *codebreak_create(const GameConfig_t *config) CODEBREAK_NOEXCEPT;

/// Уничтожить игру; NULL игнорируется.
void codebreak_destroy(void *game) CODEBREAK_NOEXCEPT;

/**
 * @brief Передать действие пользователя
 * @param hold Для Left/Right: true пока клавиша нажата, false при отпускании
 */
void codebreak_handle_input(void *game, UserAction_t action,
                            bool hold) CODEBREAK_NOEXCEPT;

/// Один тик симуляции.
void codebreak_update(void *game) CODEBREAK_NOEXCEPT;

/// Новый размер области отрисовки; кирпичи раскладываются заново.
void codebreak_resize(void *game, int width, int height) CODEBREAK_NOEXCEPT;

/**
 * @brief Снимок для отрисовки
 * @return Указатель, действительный до следующего изменяющего вызова; NULL
 *         для NULL-контекста
 */
const GameInfo_t *codebreak_get_info(const void *game) CODEBREAK_NOEXCEPT;

/// Таблица функций игры для контроллера.
GameInterface_t codebreak_get_interface(void) CODEBREAK_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif /* CODEBREAK_CODEBREAK_H */
