/**
 * @file cb_codebreak_internals.hpp
 * @brief Модель игры Code Break на C++17
 *
 * Содержит:
 * - codebreak::CodeBreakGame: симуляция Breakout над кирпичами из строк кода
 *   (ракетка, мяч, кирпичи, счёт, жизни, конечный автомат партии);
 * - codebreak::GameSession: непрозрачный контекст для C API, который
 *   хранит игру, удерживаемые клавиши и C-снимок GameInfo_t.
 *
 * Состояния партии:
 * - WAITING_FOR_LAUNCH: мяч лежит на ракетке и движется вместе с ней;
 * - IN_PLAY: мяч летит, работают столкновения;
 * - GAME_OVER: жизни закончились, физика остановлена до перезапуска.
 *
 * @note Класс не потокобезопасен: все вызовы из одного потока (таймер
 *       контроллера).
 * @see cb_codebreak.h (C API), cb_layout.hpp (раскладка кирпичей)
 */

#ifndef CODEBREAK_CODEBREAK_INTERNALS_HPP
#define CODEBREAK_CODEBREAK_INTERNALS_HPP

#include <cstddef>
#include <memory>
#include <vector>

#include "../../fsm/fsm.h"
#include "../common/cb_bgame.h"
#include "cb_config.h"
#include "cb_layout.hpp"
#include "cb_line_source.hpp"

namespace codebreak {

/**
 * @brief Состояния партии (значения совпадают с fsm_state_t)
 */
enum class GameState : fsm_state_t {
  WAITING_FOR_LAUNCH = 1,
  IN_PLAY,
  GAME_OVER
};

/**
 * @brief События конечного автомата партии
 *
 * NONE совпадает с FSM_EVENT_NONE и никогда не вызывает переход.
 */
enum class GameEvent : fsm_event_t {
  NONE = FSM_EVENT_NONE,
  LAUNCH,        ///< запуск мяча с ракетки
  BALL_LOST,     ///< мяч упал, жизни ещё есть
  OUT_OF_LIVES,  ///< мяч упал, жизней не осталось
  RESTART,       ///< новая партия
  RELOAD         ///< кирпичи перестроены (обновление, уровень пройден)
};

constexpr fsm_state_t to_fsm_state(GameState s) noexcept {
  return static_cast<fsm_state_t>(s);
}

constexpr GameState from_fsm_state(fsm_state_t s) noexcept {
  return static_cast<GameState>(s);
}

constexpr fsm_event_t to_fsm_event(GameEvent e) noexcept {
  return static_cast<fsm_event_t>(e);
}

/**
 * @brief Настраиваемые параметры симуляции
 *
 * Значения по умолчанию из cb_config.h повторяют исходную игру.
 */
struct Tuning {
  double paddle_width = CODEBREAK_PADDLE_WIDTH;
  double paddle_height = CODEBREAK_PADDLE_HEIGHT;
  double paddle_speed = CODEBREAK_PADDLE_SPEED;
  double paddle_margin = CODEBREAK_PADDLE_MARGIN;
  double paddle_start_x = CODEBREAK_PADDLE_START_X;
  double paddle_bottom_offset = CODEBREAK_PADDLE_BOTTOM_OFFSET;
  double ball_radius = CODEBREAK_BALL_RADIUS;
  double ball_rest_offset = CODEBREAK_BALL_REST_OFFSET;
  double launch_vx = CODEBREAK_LAUNCH_VX;
  double launch_vy = CODEBREAK_LAUNCH_VY;
  double max_deflection = CODEBREAK_MAX_DEFLECTION;
  int brick_reward = CODEBREAK_BRICK_REWARD;
  int initial_lives = CODEBREAK_INITIAL_LIVES;
  std::size_t max_brick_lines = CODEBREAK_MAX_BRICK_LINES;
  LayoutParams layout;
};

/**
 * @brief Удерживаемые направления, читаются один раз за тик
 */
struct InputFlags {
  bool move_left = false;
  bool move_right = false;
};

struct PaddleState {
  double x = 0.0;
  double width = 0.0;
  double height = 0.0;
  double speed = 0.0;
};

struct BallState {
  double x = 0.0;
  double y = 0.0;
  double radius = 0.0;
  double vx = 0.0;
  double vy = 0.0;
  bool launched = false;
};

/**
 * @brief Снимок состояния для отрисовки
 *
 * bricks содержит только живые кирпичи в порядке раскладки.
 */
struct Snapshot {
  Rect paddle;
  BallState ball;
  std::vector<Brick> bricks;
  std::vector<RenderLine> render_lines;
  int score = 0;
  int high_score = 0;
  int lives = 0;
  bool game_over = false;
  GameState state = GameState::WAITING_FOR_LAUNCH;
  int viewport_width = 0;
  int viewport_height = 0;
};

/**
 * @brief Симуляция Breakout над кирпичами из строк кода
 *
 * Шаг симуляции фиксирован: один вызов tick() соответствует одному
 * срабатыванию таймера (CODEBREAK_TICK_MS), скорости заданы в пикселях за тик.
 *
 * Порядок тика:
 * 1. ракетка сдвигается по флагам ввода и зажимается в границы;
 * 2. вне IN_PLAY тик заканчивается (в WAITING_FOR_LAUNCH мяч следует за
 *    ракеткой);
 * 3. мяч смещается на (vx, vy);
 * 4. отражение от левой, правой и верхней стен;
 * 5. отражение от ракетки, vx зависит от точки удара;
 * 6. не более одного разбитого кирпича;
 * 7. если все кирпичи разбиты, раскладка строится заново;
 * 8. падение мяча ниже нижнего края отнимает жизнь.
 *
 * @par Пример:
 * @code
 * auto metrics = std::make_shared<codebreak::MonospaceMetrics>(8, 16, 12);
 * codebreak::CodeBreakGame game(
 *     std::make_unique<codebreak::FileLineSource>("main.c", 42), metrics,
 *     800, 520);
 * game.launch();
 * game.tick({false, true});  // ракетка вправо
 * codebreak::Snapshot s = game.snapshot();
 * @endcode
 */
class CodeBreakGame {
 public:
  /**
   * @param source          Источник строк (nullptr: встроенные строки)
   * @param metrics         Метрики шрифта для раскладки (не nullptr)
   * @param viewport_width  Ширина области отрисовки
   * @param viewport_height Высота области отрисовки
   * @param tuning          Параметры симуляции
   *
   * @throw std::invalid_argument если metrics == nullptr
   * @throw std::runtime_error если не удалось инициализировать автомат
   */
  CodeBreakGame(std::unique_ptr<LineSource> source,
                std::shared_ptr<const FontMetrics> metrics,
                int viewport_width, int viewport_height,
                Tuning tuning = Tuning{});
  ~CodeBreakGame();

  CodeBreakGame(const CodeBreakGame&) = delete;
  CodeBreakGame& operator=(const CodeBreakGame&) = delete;
  CodeBreakGame(CodeBreakGame&&) = delete;
  CodeBreakGame& operator=(CodeBreakGame&&) = delete;

  /// Один шаг симуляции с заданными флагами ввода.
  void tick(const InputFlags& input) noexcept;

  /// Один шаг симуляции с флагами, заданными через set_input().
  void tick() noexcept { tick(input_); }

  void set_input(const InputFlags& input) noexcept { input_ = input; }
  const InputFlags& input() const noexcept { return input_; }

  /**
   * @brief Запустить мяч с ракетки
   *
   * Действует только в WAITING_FOR_LAUNCH, в остальных состояниях
   * игнорируется.
   */
  void launch() noexcept;

  /**
   * @brief Новая партия из любого состояния
   *
   * Счёт 0, жизни по умолчанию, источник строк опрашивается заново, мяч на
   * ракетке. Рекорд сохраняется.
   */
  void restart() noexcept;

  /**
   * @brief Заново опросить источник строк и перестроить кирпичи
   *
   * Мяч возвращается на ракетку. В GAME_OVER партия остаётся завершённой.
   */
  void refresh_source() noexcept;

  /**
   * @brief Заменить строки кода и перестроить кирпичи
   *
   * Переданные строки становятся источником для следующих перестроек.
   * Пустой набор заменяется встроенными строками.
   */
  void reload_bricks(std::vector<DisplayLine> lines, int anchor_index) noexcept;

  /**
   * @brief Изменить размер области отрисовки
   *
   * Кирпичи раскладываются заново из текущих строк (разбитые возвращаются),
   * мяч, счёт и жизни не меняются.
   */
  void resize(int viewport_width, int viewport_height) noexcept;

  /// Снимок для отрисовки; не меняет состояние.
  Snapshot snapshot() const;

  GameState state() const noexcept { return from_fsm_state(fsm_.current); }

#ifdef CODEBREAK_TEST_ACCESS
  void set_ball_for_testing(double x, double y, double vx, double vy);
  void set_lives_for_testing(int lives);
  void set_paddle_x_for_testing(double x);
  const std::vector<Brick>& bricks_for_testing() const { return bricks_; }
  const BallState& ball_for_testing() const { return ball_; }
#endif

 private:
  static const fsm_transition_t transitions_[];

  static void on_enter_waiting_(fsm_context_t ctx);
  static void on_enter_play_(fsm_context_t ctx);
  static void on_enter_game_over_(fsm_context_t ctx);
  static void on_exit_restart_(fsm_context_t ctx);

  bool processEvent_(GameEvent ev) noexcept;

  void pullSource_() noexcept;
  void buildBricks_() noexcept;
  void rebuildAndReset_() noexcept;
  void resetBallOnPaddle_() noexcept;

  void applyPaddleInput_(const InputFlags& input) noexcept;
  void clampPaddle_() noexcept;
  void resolveWalls_() noexcept;
  void resolvePaddle_() noexcept;
  void resolveBricks_() noexcept;
  bool isLevelCleared_() const noexcept;
  void handleBallLost_() noexcept;
  void addScore_(int points) noexcept;

  Rect ballRect_() const noexcept;
  Rect paddleRect_() const noexcept;
  int width_() const noexcept;
  int height_() const noexcept;

  std::unique_ptr<LineSource> source_;
  std::shared_ptr<const FontMetrics> metrics_;
  Tuning tuning_;
  int viewport_width_;
  int viewport_height_;

  std::vector<DisplayLine> lines_;
  int anchor_ = 0;
  std::vector<Brick> bricks_;
  std::vector<RenderLine> render_lines_;

  PaddleState paddle_;
  BallState ball_;
  InputFlags input_;

  int score_ = 0;
  int high_score_ = 0;
  int lives_ = 0;

  fsm_t fsm_{};
};

/**
 * @brief Контекст игры за непрозрачным указателем C API
 *
 * Хранит удерживаемые клавиши и C-снимок. Строки, на которые указывает
 * GameInfo_t, принадлежат сохранённому здесь Snapshot и действительны до
 * следующего изменяющего вызова.
 */
class GameSession {
 public:
  static void* create(const GameConfig_t* config) noexcept;
  static void destroy(void* session) noexcept;
  static void handle_input(void* session, UserAction_t action,
                           bool hold) noexcept;
  static void update(void* session) noexcept;
  static void resize(void* session, int width, int height) noexcept;
  static const GameInfo_t* get_info(const void* session) noexcept;

  CodeBreakGame& game() noexcept { return *game_; }

 private:
  explicit GameSession(std::unique_ptr<CodeBreakGame> game);

  void refreshInfo_();

  std::unique_ptr<CodeBreakGame> game_;
  InputFlags input_;
  Snapshot snapshot_;
  std::vector<BrickInfo_t> brick_infos_;
  std::vector<LineInfo_t> line_infos_;
  GameInfo_t info_{};
};

/**
 * @brief Метрики шрифта поверх C-структуры FontMetrics_t
 *
 * При text_width == NULL ширина считается по char_width. Неположительные
 * размеры заменяются значениями CODEBREAK_DEFAULT_*.
 */
class CFontMetrics final : public FontMetrics {
 public:
  explicit CFontMetrics(const FontMetrics_t& metrics) noexcept;

  double advance(std::string_view text) const override;
  double height() const override { return height_; }
  double ascent() const override { return ascent_; }

 private:
  FontMetrics_t metrics_;
  MonospaceMetrics fallback_;
  double height_;
  double ascent_;
};

}  // namespace codebreak

#endif  // CODEBREAK_CODEBREAK_INTERNALS_HPP
