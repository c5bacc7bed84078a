/**
 * @file cb_session.cpp
 * @brief Контекст игры для C API и адаптер метрик шрифта
 *
 * GameSession связывает CodeBreakGame с C-интерфейсом: хранит удерживаемые
 * направления между тиками и собирает GameInfo_t из снимка игры. Все
 * статические методы помечены noexcept: исключения C++ не пересекают границу
 * C API.
 */

#include <algorithm>
#include <exception>
#include <utility>

#include "../common/cb_bgame_cmn.h"
#include "cb_codebreak_internals.hpp"

namespace codebreak {

namespace {

CbRect_t to_c_rect(const Rect& r) noexcept {
  CbRect_t out;
  out.x = r.x;
  out.y = r.y;
  out.width = r.width;
  out.height = r.height;
  return out;
}

GameStatus_t to_c_status(GameState state) noexcept {
  switch (state) {
    case GameState::IN_PLAY:
      return GAME_STATUS_IN_PLAY;
    case GameState::GAME_OVER:
      return GAME_STATUS_GAME_OVER;
    case GameState::WAITING_FOR_LAUNCH:
      break;
  }
  return GAME_STATUS_WAITING_FOR_LAUNCH;
}

}  // namespace

// ---------- CFontMetrics ----------

CFontMetrics::CFontMetrics(const FontMetrics_t& metrics) noexcept
    : metrics_(metrics),
      fallback_(metrics.char_width > 0 ? metrics.char_width
                                       : CODEBREAK_DEFAULT_CHAR_WIDTH,
                metrics.height > 0 ? metrics.height
                                   : CODEBREAK_DEFAULT_FONT_HEIGHT,
                metrics.ascent > 0 ? metrics.ascent
                                   : CODEBREAK_DEFAULT_FONT_ASCENT),
      height_(fallback_.height()),
      ascent_(fallback_.ascent()) {}

double CFontMetrics::advance(std::string_view text) const {
  if (metrics_.text_width == nullptr) {
    return fallback_.advance(text);
  }
  const int w = metrics_.text_width(metrics_.ctx, text.data(), text.size());
  return std::max(0, w);
}

// ---------- GameSession ----------

GameSession::GameSession(std::unique_ptr<CodeBreakGame> game)
    : game_(std::move(game)) {}

/**
 * @brief Создаёт игру по параметрам из C API
 * @param[in] config Параметры; nullptr равносилен нулевой структуре
 *                   (встроенные строки, минимальная область, сетка 8x16)
 * @return Непрозрачный контекст или nullptr при ошибке
 *
 * Указанный файл не читается здесь до конца: FileLineSource перечитывает его
 * при каждом опросе, а недоступный файл даёт встроенные строки.
 */
void* GameSession::create(const GameConfig_t* config) noexcept {
  try {
    GameConfig_t cfg{};
    if (config != nullptr) cfg = *config;

    std::unique_ptr<LineSource> source;
    if (cfg.source_path != nullptr && cfg.source_path[0] != '\0') {
      source = std::make_unique<FileLineSource>(cfg.source_path,
                                                cfg.cursor_line);
    }

    auto metrics = std::make_shared<CFontMetrics>(cfg.metrics);
    auto game = std::make_unique<CodeBreakGame>(
        std::move(source), std::move(metrics), cfg.viewport_width,
        cfg.viewport_height);
    return new GameSession(std::move(game));
  } catch (const std::exception&) {
    return nullptr;
  }
}

void GameSession::destroy(void* session) noexcept {
  if (session != nullptr) {
    delete static_cast<GameSession*>(session);
  }
}

/**
 * @brief Обрабатывает действие пользователя
 *
 * Left и Right запоминаются как удерживаемые (hold == true, пока клавиша
 * нажата) и применяются в каждом следующем тике. Launch, Restart и Refresh
 * выполняются сразу. Terminate обрабатывает контроллер.
 */
void GameSession::handle_input(void* session, UserAction_t action,
                               bool hold) noexcept {
  if (session == nullptr || !brickgame_is_valid_action(action)) return;
  auto* self = static_cast<GameSession*>(session);

  switch (action) {
    case Left:
      self->input_.move_left = hold;
      break;
    case Right:
      self->input_.move_right = hold;
      break;
    case Launch:
      self->game_->launch();
      break;
    case Restart:
      self->game_->restart();
      break;
    case Refresh:
      self->game_->refresh_source();
      break;
    case Terminate:
      break;
  }
}

void GameSession::update(void* session) noexcept {
  if (session == nullptr) return;
  auto* self = static_cast<GameSession*>(session);
  self->game_->tick(self->input_);
}

void GameSession::resize(void* session, int width, int height) noexcept {
  if (session == nullptr) return;
  static_cast<GameSession*>(session)->game_->resize(width, height);
}

/**
 * @brief Снимок состояния для отрисовки
 *
 * @note Указатель и строки внутри действительны до следующего вызова
 *       update, input, resize или destroy.
 */
const GameInfo_t* GameSession::get_info(const void* session) noexcept {
  if (session == nullptr) return nullptr;
  auto* self = const_cast<GameSession*>(static_cast<const GameSession*>(session));
  self->refreshInfo_();
  return &self->info_;
}

void GameSession::refreshInfo_() {
  snapshot_ = game_->snapshot();

  brick_infos_.clear();
  brick_infos_.reserve(snapshot_.bricks.size());
  for (const Brick& b : snapshot_.bricks) {
    BrickInfo_t bi{};
    bi.id = b.id;
    bi.rect = to_c_rect(b.rect);
    bi.label = b.label.c_str();
    bi.source_text = b.source_text.c_str();
    bi.line_number = b.line_number;
    brick_infos_.push_back(bi);
  }

  line_infos_.clear();
  line_infos_.reserve(snapshot_.render_lines.size());
  for (const RenderLine& rl : snapshot_.render_lines) {
    line_infos_.push_back({rl.line_number, rl.baseline_y});
  }

  info_.paddle = to_c_rect(snapshot_.paddle);
  info_.ball_x = snapshot_.ball.x;
  info_.ball_y = snapshot_.ball.y;
  info_.ball_radius = snapshot_.ball.radius;
  info_.bricks = brick_infos_.empty() ? nullptr : brick_infos_.data();
  info_.brick_count = brick_infos_.size();
  info_.lines = line_infos_.empty() ? nullptr : line_infos_.data();
  info_.line_count = line_infos_.size();
  info_.score = snapshot_.score;
  info_.high_score = snapshot_.high_score;
  info_.lives = snapshot_.lives;
  info_.game_over = snapshot_.game_over ? 1 : 0;
  info_.status = to_c_status(snapshot_.state);
  info_.viewport_width = snapshot_.viewport_width;
  info_.viewport_height = snapshot_.viewport_height;
}

}  // namespace codebreak
