/**
 * @file cli.h
 * @brief CLI-реализация View для Code Break (через ncurses).
 *
 * Терминал рисует игру на сетке ячеек. Пиксельные координаты модели
 * переводятся в ячейки: одна ячейка CLI_CELL_WIDTH x CLI_CELL_HEIGHT пикселей.
 * Метрики шрифта моноширинные (text_width == NULL), поэтому один символ кода
 * занимает ровно одну ячейку.
 *
 * Пример использования:
 * @code
 * ViewHandle_t view = cli_view.init(0, 0, 60);
 * if (!view) {
 *     fprintf(stderr, "Не удалось инициализировать CLI-интерфейс\n");
 *     return -1;
 * }
 * // ... основной цикл: draw_frame, render, poll_input
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Для компиляции требуется библиотека ncurses.
 * @note Реализация сама вызывает initscr() и endwin(): не используйте ncurses
 *       напрямую при работе с этим интерфейсом.
 *
 * @defgroup Cli_view Реализация CLI-интерфейса
 * @ingroup View
 */

#ifndef CODEBREAK_CLI_H
#define CODEBREAK_CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Размер ячейки терминала в пикселях модели */
#define CLI_CELL_WIDTH 8
#define CLI_CELL_HEIGHT 18

/**
 * @brief Экземпляр интерфейса отображения для CLI на базе ncurses.
 *
 * Все функции потоконебезопасны и вызываются из основного цикла.
 * Одновременно может существовать только один контекст.
 */
extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif  // CODEBREAK_CLI_H

/** @} */
