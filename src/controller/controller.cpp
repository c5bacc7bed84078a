/**
 * @file controller.cpp
 * @brief Игровой цикл и разбор ввода
 */

#include "controller.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

#include "../brick_game/codebreak/cb_config.h"

namespace codebreak {

bool parse_options(int argc, char** argv, ControllerOptions* out) {
  if (argc > 1) out->source_path = argv[1];
  if (argc > 2) {
    char* end = nullptr;
    errno = 0;
    long line = std::strtol(argv[2], &end, 10);
    if (errno != 0 || end == argv[2] || *end != '\0' || line < 0 ||
        line > 1000000000L) {
      std::fprintf(stderr, "Ошибка: некорректный номер строки '%s'\n",
                   argv[2]);
      std::fprintf(stderr, "Использование: %s [source_file] [cursor_line]\n",
                   argv[0]);
      return false;
    }
    out->cursor_line = static_cast<int>(line);
  }
  return true;
}

Controller::Controller(const ViewInterface& view, const GameInterface_t& game)
    : view_(view), game_(game) {}

int Controller::run(const ControllerOptions& options) {
  if (view_.version != VIEW_INTERFACE_VERSION) {
    std::fprintf(stderr, "Ошибка: неподдерживаемая версия View (%d)\n",
                 view_.version);
    return 1;
  }

  ViewHandle_t handle =
      view_.init(options.width, options.height, 1000 / CODEBREAK_TICK_MS);
  if (!handle) {
    std::fprintf(stderr, "Ошибка: не удалось инициализировать отображение\n");
    return 1;
  }

  const char* error = nullptr;
  FontMetrics_t metrics{};
  int width = 0;
  int height = 0;
  if (view_.get_font_metrics(handle, &metrics) != VIEW_OK ||
      view_.get_viewport(handle, &width, &height) != VIEW_OK) {
    view_.shutdown(handle);
    std::fprintf(stderr, "Ошибка: отображение не сообщило размеры\n");
    return 1;
  }

  GameConfig_t config{};
  config.source_path = options.source_path;
  config.cursor_line = options.cursor_line;
  config.viewport_width = width;
  config.viewport_height = height;
  config.metrics = metrics;

  void* game = game_.create(&config);
  if (!game) {
    view_.shutdown(handle);
    std::fprintf(stderr, "Ошибка: не удалось создать игру\n");
    return 1;
  }

  const auto period = std::chrono::milliseconds(CODEBREAK_TICK_MS);
  auto next = std::chrono::steady_clock::now();
  bool running = true;

  while (running) {
    InputEvent_t ev{};
    while (running && view_.poll_input(handle, &ev) == VIEW_OK) {
      running = handleEvent_(game, ev);
    }
    if (!running) break;

    int w = width;
    int h = height;
    if (view_.get_viewport(handle, &w, &h) == VIEW_OK &&
        (w != width || h != height)) {
      width = w;
      height = h;
      game_.resize(game, width, height);
    }

    game_.update(game);
    expireDirection_(game, Left, left_);
    expireDirection_(game, Right, right_);

    if (view_.draw_frame(handle, game_.get_info(game)) != VIEW_OK ||
        view_.render(handle) != VIEW_OK) {
      error = "Ошибка: не удалось отрисовать кадр";
      break;
    }

    next += period;
    std::this_thread::sleep_until(next);
  }

  game_.destroy(game);
  view_.shutdown(handle);

  if (error) {
    std::fprintf(stderr, "%s\n", error);
    return 1;
  }
  return 0;
}

bool Controller::handleEvent_(void* game, const InputEvent_t& ev) {
  const bool pressed = ev.key_state != KEY_STATE_UP;

  switch (ev.key_code) {
    case 'a':
    case 'A':
      if (ev.key_state == KEY_STATE_TAP && right_.held) {
        pressDirection_(game, Right, right_, KEY_STATE_UP);
      }
      pressDirection_(game, Left, left_, ev.key_state);
      break;
    case 'd':
    case 'D':
      if (ev.key_state == KEY_STATE_TAP && left_.held) {
        pressDirection_(game, Left, left_, KEY_STATE_UP);
      }
      pressDirection_(game, Right, right_, ev.key_state);
      break;
    case ' ':
      if (pressed) game_.input(game, Launch, false);
      break;
    case 'r':
    case 'R':
      if (pressed) game_.input(game, Restart, false);
      break;
    case 'n':
    case 'N':
      if (pressed) game_.input(game, Refresh, false);
      break;
    case 'q':
    case 'Q':
    case VIEW_KEY_ESCAPE:
      if (pressed) {
        game_.input(game, Terminate, false);
        return false;
      }
      break;
    default:
      break;
  }
  return true;
}

void Controller::pressDirection_(void* game, UserAction_t action,
                                 HeldKey& key, int state) {
  if (state == KEY_STATE_UP) {
    key = HeldKey{};
    game_.input(game, action, false);
    return;
  }

  key.held = true;
  key.ticks_left = (state == KEY_STATE_TAP) ? kTapHoldTicks : -1;
  game_.input(game, action, true);
}

void Controller::expireDirection_(void* game, UserAction_t action,
                                  HeldKey& key) {
  if (!key.held || key.ticks_left < 0) return;
  if (--key.ticks_left <= 0) {
    key = HeldKey{};
    game_.input(game, action, false);
  }
}

}  // namespace codebreak
