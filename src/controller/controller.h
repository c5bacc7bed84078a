/**
 * @file controller.h
 * @brief Контроллер Code Break: связывает модель (GameInterface_t) и
 *        отображение (ViewInterface)
 *
 * Контроллер владеет игровым циклом с фиксированным шагом CODEBREAK_TICK_MS:
 * 1. разбирает все накопившиеся события ввода;
 * 2. передаёт модели новый размер области, если он изменился;
 * 3. выполняет один тик модели;
 * 4. отдаёт снимок на отрисовку и ждёт следующего срабатывания таймера.
 *
 * Клавиши: a / стрелка влево, d / стрелка вправо, пробел (запуск),
 * r (новая партия), n (перечитать код), q / Esc (выход).
 */

#ifndef CODEBREAK_CONTROLLER_H
#define CODEBREAK_CONTROLLER_H

extern "C" {
#include "../brick_game/common/cb_bgame.h"
#include "../gui/common/view.h"
}

namespace codebreak {

/**
 * @brief Параметры запуска из командной строки
 */
struct ControllerOptions {
  const char* source_path = nullptr;
  int cursor_line = 0;
  int width = 800;
  int height = 520;
};

/**
 * @brief Разобрать аргументы `[source_file] [cursor_line]`
 * @return false, если номер строки некорректен (сообщение уже выведено)
 */
bool parse_options(int argc, char** argv, ControllerOptions* out);

class Controller {
 public:
  /// Удержание направления после однократного нажатия (в тиках).
  static constexpr int kTapHoldTicks = 6;

  Controller(const ViewInterface& view, const GameInterface_t& game);

  /**
   * @brief Запустить игровой цикл до выхода пользователя
   * @return Код завершения процесса: 0 при обычном выходе
   */
  int run(const ControllerOptions& options);

 private:
  struct HeldKey {
    bool held = false;
    int ticks_left = 0;  ///< < 0: до отпускания клавиши
  };

  bool handleEvent_(void* game, const InputEvent_t& ev);
  void pressDirection_(void* game, UserAction_t action, HeldKey& key,
                       int state);
  void expireDirection_(void* game, UserAction_t action, HeldKey& key);

  const ViewInterface& view_;
  GameInterface_t game_;
  HeldKey left_;
  HeldKey right_;
};

}  // namespace codebreak

#endif  // CODEBREAK_CONTROLLER_H
