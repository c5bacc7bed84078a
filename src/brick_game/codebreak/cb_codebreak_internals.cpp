/**
 * @file cb_codebreak_internals.cpp
 * @brief Реализация симуляции Code Break
 *
 * Партией управляет табличный конечный автомат (fsm.h). Переходы и их
 * колбэки:
 * - WAITING_FOR_LAUNCH + LAUNCH -> IN_PLAY: мяч отпускается;
 * - IN_PLAY + BALL_LOST -> WAITING_FOR_LAUNCH: мяч на ракетку;
 * - IN_PLAY + OUT_OF_LIVES -> GAME_OVER: физика останавливается;
 * - любое состояние + RESTART -> WAITING_FOR_LAUNCH: на выходе сбрасываются
 *   счёт и жизни и перестраиваются кирпичи, на входе мяч ставится на ракетку;
 * - WAITING_FOR_LAUNCH / IN_PLAY + RELOAD -> WAITING_FOR_LAUNCH: кирпичи уже
 *   перестроены, мяч на ракетку.
 *
 * Для GAME_OVER правила RELOAD нет: перестройка кирпичей в конце партии
 * возвращает мяч на ракетку, но партия остаётся завершённой.
 *
 * @warning Колбэки не должны отправлять события автомату: во время перехода
 *          fsm_process_event() отклоняет вложенные вызовы.
 */

#include "cb_codebreak_internals.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace codebreak {

const fsm_transition_t CodeBreakGame::transitions_[] = {
    {to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     to_fsm_event(GameEvent::LAUNCH), to_fsm_state(GameState::IN_PLAY),
     nullptr, &CodeBreakGame::on_enter_play_},

    {to_fsm_state(GameState::IN_PLAY), to_fsm_event(GameEvent::BALL_LOST),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH), nullptr,
     &CodeBreakGame::on_enter_waiting_},

    {to_fsm_state(GameState::IN_PLAY), to_fsm_event(GameEvent::OUT_OF_LIVES),
     to_fsm_state(GameState::GAME_OVER), nullptr,
     &CodeBreakGame::on_enter_game_over_},

    // RESTART принимается в любом состоянии
    {to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     to_fsm_event(GameEvent::RESTART),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     &CodeBreakGame::on_exit_restart_, &CodeBreakGame::on_enter_waiting_},

    {to_fsm_state(GameState::IN_PLAY), to_fsm_event(GameEvent::RESTART),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     &CodeBreakGame::on_exit_restart_, &CodeBreakGame::on_enter_waiting_},

    {to_fsm_state(GameState::GAME_OVER), to_fsm_event(GameEvent::RESTART),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     &CodeBreakGame::on_exit_restart_, &CodeBreakGame::on_enter_waiting_},

    {to_fsm_state(GameState::WAITING_FOR_LAUNCH),
     to_fsm_event(GameEvent::RELOAD),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH), nullptr,
     &CodeBreakGame::on_enter_waiting_},

    {to_fsm_state(GameState::IN_PLAY), to_fsm_event(GameEvent::RELOAD),
     to_fsm_state(GameState::WAITING_FOR_LAUNCH), nullptr,
     &CodeBreakGame::on_enter_waiting_},
};

CodeBreakGame::CodeBreakGame(std::unique_ptr<LineSource> source,
                             std::shared_ptr<const FontMetrics> metrics,
                             int viewport_width, int viewport_height,
                             Tuning tuning)
    : source_(std::move(source)),
      metrics_(std::move(metrics)),
      tuning_(std::move(tuning)),
      viewport_width_(viewport_width),
      viewport_height_(viewport_height) {
  if (!metrics_) {
    throw std::invalid_argument("CodeBreakGame: метрики шрифта не заданы");
  }

  paddle_.x = tuning_.paddle_start_x;
  paddle_.width = tuning_.paddle_width;
  paddle_.height = tuning_.paddle_height;
  paddle_.speed = tuning_.paddle_speed;
  ball_.radius = tuning_.ball_radius;
  lives_ = tuning_.initial_lives;

  bool ok = fsm_init(&fsm_, this, transitions_,
                     sizeof(transitions_) / sizeof(transitions_[0]),
                     to_fsm_state(GameState::WAITING_FOR_LAUNCH));
  if (!ok) {
    throw std::runtime_error("CodeBreakGame: не удалось инициализировать FSM");
  }

  pullSource_();
  buildBricks_();
  resetBallOnPaddle_();
}

CodeBreakGame::~CodeBreakGame() { fsm_destroy(&fsm_); }

void CodeBreakGame::tick(const InputFlags& input) noexcept {
  applyPaddleInput_(input);

  switch (state()) {
    case GameState::WAITING_FOR_LAUNCH:
      // мяч лежит на ракетке и движется вместе с ней
      ball_.x = paddle_.x + paddle_.width / 2.0;
      ball_.y = height_() - tuning_.ball_rest_offset;
      return;
    case GameState::GAME_OVER:
      return;
    case GameState::IN_PLAY:
      break;
  }

  ball_.x += ball_.vx;
  ball_.y += ball_.vy;

  resolveWalls_();
  resolvePaddle_();
  resolveBricks_();

  if (isLevelCleared_()) {
    pullSource_();
    rebuildAndReset_();
  }

  if (ball_.y - ball_.radius > height_()) {
    handleBallLost_();
  }
}

void CodeBreakGame::launch() noexcept { processEvent_(GameEvent::LAUNCH); }

void CodeBreakGame::restart() noexcept { processEvent_(GameEvent::RESTART); }

void CodeBreakGame::refresh_source() noexcept {
  pullSource_();
  rebuildAndReset_();
}

void CodeBreakGame::reload_bricks(std::vector<DisplayLine> lines,
                                  int anchor_index) noexcept {
  source_ = std::make_unique<StaticLineSource>(std::move(lines), anchor_index);
  pullSource_();
  rebuildAndReset_();
}

void CodeBreakGame::resize(int viewport_width, int viewport_height) noexcept {
  viewport_width_ = viewport_width;
  viewport_height_ = viewport_height;
  buildBricks_();
  clampPaddle_();
}

Snapshot CodeBreakGame::snapshot() const {
  Snapshot s;
  s.paddle = paddleRect_();
  s.ball = ball_;
  std::copy_if(bricks_.begin(), bricks_.end(), std::back_inserter(s.bricks),
               [](const Brick& b) { return b.alive; });
  s.render_lines = render_lines_;
  s.score = score_;
  s.high_score = high_score_;
  s.lives = lives_;
  s.state = state();
  s.game_over = s.state == GameState::GAME_OVER;
  s.viewport_width = width_();
  s.viewport_height = height_();
  return s;
}

#ifdef CODEBREAK_TEST_ACCESS
void CodeBreakGame::set_ball_for_testing(double x, double y, double vx,
                                         double vy) {
  ball_.x = x;
  ball_.y = y;
  ball_.vx = vx;
  ball_.vy = vy;
}

void CodeBreakGame::set_lives_for_testing(int lives) { lives_ = lives; }

void CodeBreakGame::set_paddle_x_for_testing(double x) {
  paddle_.x = x;
  clampPaddle_();
}
#endif

// ---------- Автомат ----------

void CodeBreakGame::on_enter_waiting_(fsm_context_t ctx) {
  static_cast<CodeBreakGame*>(ctx)->resetBallOnPaddle_();
}

void CodeBreakGame::on_enter_play_(fsm_context_t ctx) {
  static_cast<CodeBreakGame*>(ctx)->ball_.launched = true;
}

void CodeBreakGame::on_enter_game_over_(fsm_context_t ctx) {
  static_cast<CodeBreakGame*>(ctx)->ball_.launched = false;
}

void CodeBreakGame::on_exit_restart_(fsm_context_t ctx) {
  auto* self = static_cast<CodeBreakGame*>(ctx);
  self->score_ = 0;
  self->lives_ = self->tuning_.initial_lives;
  self->pullSource_();
  self->buildBricks_();
}

bool CodeBreakGame::processEvent_(GameEvent ev) noexcept {
  if (ev == GameEvent::NONE) return false;
  return fsm_process_event(&fsm_, to_fsm_event(ev));
}

// ---------- Кирпичи ----------

void CodeBreakGame::pullSource_() noexcept {
  SourceLines got;
  if (source_) {
    try {
      got = source_->collect();
    } catch (const std::exception&) {
      // источник недоступен: играем на встроенных строках
      got = SourceLines{};
    }
  }

  if (got.lines.empty()) {
    got.lines = placeholder_lines();
    got.anchor_index = 0;
  }

  lines_ = std::move(got.lines);
  anchor_ = got.anchor_index;
}

void CodeBreakGame::buildBricks_() noexcept {
  LayoutResult result =
      layout(lines_, anchor_, tuning_.max_brick_lines, viewport_width_,
             viewport_height_, *metrics_, tuning_.layout);
  bricks_ = std::move(result.bricks);
  render_lines_ = std::move(result.render_lines);
}

void CodeBreakGame::rebuildAndReset_() noexcept {
  buildBricks_();
  if (!processEvent_(GameEvent::RELOAD)) {
    // GAME_OVER: партия не возобновляется, но мяч возвращается на ракетку
    resetBallOnPaddle_();
  }
}

void CodeBreakGame::resetBallOnPaddle_() noexcept {
  clampPaddle_();
  ball_.x = paddle_.x + paddle_.width / 2.0;
  ball_.y = height_() - tuning_.ball_rest_offset;
  ball_.vx = tuning_.launch_vx;
  ball_.vy = tuning_.launch_vy;
  ball_.launched = false;
}

bool CodeBreakGame::isLevelCleared_() const noexcept {
  return !bricks_.empty() &&
         std::none_of(bricks_.begin(), bricks_.end(),
                      [](const Brick& b) { return b.alive; });
}

// ---------- Физика ----------

void CodeBreakGame::applyPaddleInput_(const InputFlags& input) noexcept {
  if (input.move_left) paddle_.x -= paddle_.speed;
  if (input.move_right) paddle_.x += paddle_.speed;
  clampPaddle_();
}

void CodeBreakGame::clampPaddle_() noexcept {
  const double max_x = width_() - paddle_.width - tuning_.paddle_margin;
  paddle_.x = std::max(tuning_.paddle_margin, std::min(paddle_.x, max_x));
}

void CodeBreakGame::resolveWalls_() noexcept {
  const double w = width_();

  if (ball_.x - ball_.radius <= 0.0) {
    ball_.x = ball_.radius;
    ball_.vx = -ball_.vx;
  }
  if (ball_.x + ball_.radius >= w) {
    ball_.x = w - ball_.radius;
    ball_.vx = -ball_.vx;
  }
  if (ball_.y - ball_.radius <= 0.0) {
    ball_.y = ball_.radius;
    ball_.vy = -ball_.vy;
  }
}

void CodeBreakGame::resolvePaddle_() noexcept {
  const Rect paddle = paddleRect_();
  if (ball_.vy <= 0.0 || !ballRect_().intersects(paddle)) return;

  ball_.y = paddle.y - ball_.radius;
  ball_.vy = -std::abs(ball_.vy);

  // удар у края ракетки отклоняет мяч сильнее, чем удар в центр
  const double hit = (ball_.x - paddle_.x) / paddle_.width;
  ball_.vx = (hit - 0.5) * tuning_.max_deflection;
}

void CodeBreakGame::resolveBricks_() noexcept {
  const Rect ball = ballRect_();
  for (Brick& brick : bricks_) {
    if (brick.alive && ball.intersects(brick.rect)) {
      brick.alive = false;
      addScore_(tuning_.brick_reward);
      ball_.vy = -ball_.vy;
      break;  // не больше одного кирпича за тик
    }
  }
}

void CodeBreakGame::handleBallLost_() noexcept {
  lives_ = std::max(0, lives_ - 1);
  if (lives_ == 0) {
    processEvent_(GameEvent::OUT_OF_LIVES);
  } else {
    processEvent_(GameEvent::BALL_LOST);
  }
}

void CodeBreakGame::addScore_(int points) noexcept {
  score_ += points;
  high_score_ = std::max(high_score_, score_);
}

Rect CodeBreakGame::ballRect_() const noexcept {
  return {ball_.x - ball_.radius, ball_.y - ball_.radius, ball_.radius * 2.0,
          ball_.radius * 2.0};
}

Rect CodeBreakGame::paddleRect_() const noexcept {
  return {paddle_.x, height_() - tuning_.paddle_bottom_offset, paddle_.width,
          paddle_.height};
}

int CodeBreakGame::width_() const noexcept {
  return effective_width(viewport_width_, tuning_.layout);
}

int CodeBreakGame::height_() const noexcept {
  return effective_height(viewport_height_, tuning_.layout);
}

}  // namespace codebreak
