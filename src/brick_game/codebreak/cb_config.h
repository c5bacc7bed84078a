/**
 * @file cb_config.h
 * @brief Настройки по умолчанию для игры Code Break
 *
 * Значения совпадают с исходной игрой. Все размеры в пикселях, скорости в
 * пикселях за тик. Во время выполнения их можно переопределить через
 * codebreak::Tuning.
 */

#ifndef CODEBREAK_CONFIG_H
#define CODEBREAK_CONFIG_H

/*
    Период игрового таймера (мс). Симуляция не масштабирует шаг по времени.
*/
#define CODEBREAK_TICK_MS 16

/*
    Минимальные размеры области отрисовки. Меньшие размеры поднимаются
    до этих значений.
*/
#define CODEBREAK_MIN_VIEWPORT_WIDTH 640
#define CODEBREAK_MIN_VIEWPORT_HEIGHT 360

/*
    Ракетка: размер, скорость и отступ от краёв.
    Верхняя грань ракетки на CODEBREAK_PADDLE_BOTTOM_OFFSET выше нижнего края.
*/
#define CODEBREAK_PADDLE_WIDTH 130.0
#define CODEBREAK_PADDLE_HEIGHT 12.0
#define CODEBREAK_PADDLE_SPEED 9.0
#define CODEBREAK_PADDLE_MARGIN 10.0
#define CODEBREAK_PADDLE_START_X 300.0
#define CODEBREAK_PADDLE_BOTTOM_OFFSET 30.0

/*
    Мяч. Перед запуском центр мяча на CODEBREAK_BALL_REST_OFFSET выше
    нижнего края.
*/
#define CODEBREAK_BALL_RADIUS 7.0
#define CODEBREAK_BALL_REST_OFFSET 42.0
#define CODEBREAK_LAUNCH_VX 3.8
#define CODEBREAK_LAUNCH_VY (-4.6)

/*
    Максимальное отклонение vx при ударе о край ракетки.
*/
#define CODEBREAK_MAX_DEFLECTION 10.0

#define CODEBREAK_BRICK_REWARD 10
#define CODEBREAK_INITIAL_LIVES 3

/*
    Раскладка строк кода в кирпичи.
*/
#define CODEBREAK_MAX_BRICK_LINES 56
#define CODEBREAK_CODE_LEFT 70
#define CODEBREAK_CODE_RIGHT_MARGIN 18
#define CODEBREAK_CODE_TOP 64
#define CODEBREAK_CODE_BOTTOM_MARGIN 70
#define CODEBREAK_MIN_LINE_HEIGHT 16
#define CODEBREAK_LINE_SPACING 2

/*
    Моноширинная сетка по умолчанию, если модуль отображения не сообщил
    метрики шрифта.
*/
#define CODEBREAK_DEFAULT_CHAR_WIDTH 8
#define CODEBREAK_DEFAULT_FONT_HEIGHT 16
#define CODEBREAK_DEFAULT_FONT_ASCENT 12

#endif /* CODEBREAK_CONFIG_H */
