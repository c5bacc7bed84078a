#include "qt_view.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QFontDatabase>
#include <QFontMetrics>
#include <QKeyEvent>
#include <QMainWindow>
#include <QMouseEvent>
#include <QPainter>
#include <QToolTip>
#include <QWidget>
#include <QtGlobal>

#include <memory>
#include <queue>
#include <string>
#include <vector>

extern "C" {
#include "../../brick_game/common/cb_bgame_cmn.h"
}

// ---------- Виджет игры (скрыт за ViewHandle_t) ----------

class CodeBreakWidget : public QWidget {
 public:
  explicit CodeBreakWidget(QWidget *parent = nullptr)
      : QWidget(parent),
        font_(QFontDatabase::systemFont(QFontDatabase::FixedFont)) {
    font_.setPointSize(10);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(320, 240);
  }

  const QFont &codeFont() const { return font_; }

  // Глубокая копия снимка: строки модели живут только до следующего тика
  void setFrame(const GameInfo_t &info) {
    labels_.clear();
    sources_.clear();
    bricks_.assign(info.bricks, info.bricks + info.brick_count);
    lines_.assign(info.lines, info.lines + info.line_count);

    for (const BrickInfo_t &b : bricks_) {
      labels_.emplace_back(b.label ? b.label : "");
      sources_.emplace_back(b.source_text ? b.source_text : "");
    }
    for (std::size_t i = 0; i < bricks_.size(); ++i) {
      bricks_[i].label = labels_[i].c_str();
      bricks_[i].source_text = sources_[i].c_str();
    }

    frame_ = info;
    frame_.bricks = bricks_.empty() ? nullptr : bricks_.data();
    frame_.lines = lines_.empty() ? nullptr : lines_.data();
    has_frame_ = true;
  }

  void pushInput(const InputEvent_t &ev) { inputQueue_.push(ev); }

  // Очередь событий клавиатуры для poll_input()
  bool popInput(InputEvent_t &out) {
    if (inputQueue_.empty()) return false;
    out = inputQueue_.front();
    inputQueue_.pop();
    return true;
  }

 protected:
  void paintEvent(QPaintEvent *) override {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.fillRect(rect(), palette().base().color());
    if (!has_frame_) return;

    const QColor text_fg = palette().text().color();
    const int w = width();
    const int h = height();

    p.setPen(QPen(QColor(180, 180, 180), 1));
    p.setBrush(Qt::NoBrush);
    p.drawRect(QRectF(12, 52, qMax(100, w - 24), qMax(100, h - 92)));

    p.setFont(font_);
    p.setPen(text_fg);
    p.drawText(14, 24, QString("Score: %1   Lives: %2   Best: %3")
                           .arg(frame_.score)
                           .arg(frame_.lives)
                           .arg(frame_.high_score));

    p.setPen(QColor(130, 130, 130));
    for (const LineInfo_t &line : lines_) {
      p.drawText(QPointF(18, line.baseline_y),
                 QString("%1").arg(line.line_number, 4));
    }

    const int ascent = QFontMetrics(font_).ascent();
    p.setPen(text_fg);
    for (const BrickInfo_t &b : bricks_) {
      p.drawText(QPointF(b.rect.x, b.rect.y + ascent),
                 QString::fromUtf8(b.label));
    }

    p.setPen(Qt::NoPen);
    p.setBrush(QColor(255, 170, 60));
    p.drawRoundedRect(QRectF(frame_.paddle.x, frame_.paddle.y,
                             frame_.paddle.width, frame_.paddle.height),
                      5, 5);

    p.setBrush(QColor(220, 80, 80));
    p.drawEllipse(QPointF(frame_.ball_x, frame_.ball_y), frame_.ball_radius,
                  frame_.ball_radius);

    if (frame_.game_over) {
      QFont big = font_;
      big.setPointSize(20);
      big.setBold(true);
      p.setFont(big);
      p.setPen(QColor(255, 110, 110));
      p.drawText(rect(), Qt::AlignCenter, "GAME OVER\nPress R to restart");
    }
  }

  void keyPressEvent(QKeyEvent *event) override {
    if (!pushKey_(event, KEY_STATE_DOWN)) QWidget::keyPressEvent(event);
  }

  void keyReleaseEvent(QKeyEvent *event) override {
    if (!pushKey_(event, KEY_STATE_UP)) QWidget::keyReleaseEvent(event);
  }

  void mouseMoveEvent(QMouseEvent *event) override {
    const QPointF pos = event->position();
    const BrickInfo_t *brick =
        has_frame_ ? brickgame_find_brick_at(&frame_, pos.x(), pos.y())
                   : nullptr;
    const char *tooltip = brickgame_tooltip_text(brick);

    if (tooltip != nullptr) {
      const QString text = QString::fromUtf8(tooltip);
      if (text != hoverText_) {
        hoverText_ = text;
        QToolTip::showText(event->globalPosition().toPoint(), text, this);
      }
    } else if (!hoverText_.isEmpty()) {
      hoverText_.clear();
      QToolTip::hideText();
    }
    QWidget::mouseMoveEvent(event);
  }

  void leaveEvent(QEvent *event) override {
    if (!hoverText_.isEmpty()) {
      hoverText_.clear();
      QToolTip::hideText();
    }
    QWidget::leaveEvent(event);
  }

 private:
  bool pushKey_(QKeyEvent *event, int state) {
    if (event->isAutoRepeat()) return true;

    InputEvent_t ev{};
    ev.key_state = state;
    switch (event->key()) {
      case Qt::Key_Left:
      case Qt::Key_A:
        ev.key_code = 'a';
        break;
      case Qt::Key_Right:
      case Qt::Key_D:
        ev.key_code = 'd';
        break;
      case Qt::Key_Space:
        ev.key_code = ' ';
        break;
      case Qt::Key_R:
        ev.key_code = 'r';
        break;
      case Qt::Key_N:
        ev.key_code = 'n';
        break;
      case Qt::Key_Q:
        ev.key_code = 'q';
        break;
      case Qt::Key_Escape:
        ev.key_code = VIEW_KEY_ESCAPE;
        break;
      default:
        return false;
    }
    pushInput(ev);
    return true;
  }

  QFont font_;
  GameInfo_t frame_{};
  bool has_frame_ = false;
  std::vector<BrickInfo_t> bricks_;
  std::vector<LineInfo_t> lines_;
  std::vector<std::string> labels_;
  std::vector<std::string> sources_;
  QString hoverText_;
  std::queue<InputEvent_t> inputQueue_;
};

// Закрытие окна превращается в Esc для контроллера
class CodeBreakWindow : public QMainWindow {
 public:
  explicit CodeBreakWindow(CodeBreakWidget *widget) : widget_(widget) {
    setWindowTitle("Code Break");
    setCentralWidget(widget_);
  }

 protected:
  void closeEvent(QCloseEvent *event) override {
    InputEvent_t ev{};
    ev.key_code = VIEW_KEY_ESCAPE;
    ev.key_state = KEY_STATE_TAP;
    widget_->pushInput(ev);
    event->ignore();
  }

 private:
  CodeBreakWidget *widget_;
};

// Контекст Qt-View
struct QtViewContext {
  int fps = 0;
  CodeBreakWindow *window = nullptr;
  CodeBreakWidget *widget = nullptr;
  std::unique_ptr<QFontMetrics> metrics;
};

static int qt_text_width_(void *ctx, const char *text, size_t len) {
  const auto *fm = static_cast<const QFontMetrics *>(ctx);
  return fm->horizontalAdvance(
      QString::fromUtf8(text, static_cast<qsizetype>(len)));
}

// ---------- Реализация ViewInterface для Qt ----------

static ViewHandle_t qt_init(int width, int height, int fps) {
  if (width <= 0 || height <= 0 || fps < 1) return nullptr;

  if (!QApplication::instance()) {
    qWarning("qt_view: QApplication не создан");
    return nullptr;
  }

  auto *ctx = new QtViewContext{};
  ctx->fps = fps;
  ctx->widget = new CodeBreakWidget;
  ctx->window = new CodeBreakWindow(ctx->widget);
  ctx->metrics = std::make_unique<QFontMetrics>(ctx->widget->codeFont());

  ctx->window->resize(width, height);
  ctx->window->show();
  ctx->widget->setFocus();
  QApplication::processEvents();

  return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t qt_get_viewport(ViewHandle_t handle, int *width,
                                    int *height) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!width || !height) return VIEW_BAD_DATA;

  auto *ctx = static_cast<QtViewContext *>(handle);
  *width = ctx->widget->width();
  *height = ctx->widget->height();
  return VIEW_OK;
}

static ViewResult_t qt_get_font_metrics(ViewHandle_t handle,
                                        FontMetrics_t *out) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!out) return VIEW_BAD_DATA;

  auto *ctx = static_cast<QtViewContext *>(handle);
  out->ctx = ctx->metrics.get();
  out->text_width = qt_text_width_;
  out->char_width = ctx->metrics->averageCharWidth();
  out->height = ctx->metrics->height();
  out->ascent = ctx->metrics->ascent();
  return VIEW_OK;
}

static ViewResult_t qt_draw_frame(ViewHandle_t handle,
                                  const GameInfo_t *info) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!brickgame_is_valid_game_info(info)) {
    qWarning("qt_view: некорректный снимок игры");
    return VIEW_BAD_DATA;
  }

  auto *ctx = static_cast<QtViewContext *>(handle);
  ctx->widget->setFrame(*info);
  return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  auto *ctx = static_cast<QtViewContext *>(handle);
  ctx->widget->update();
  QApplication::processEvents();
  return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t *event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!event) return VIEW_BAD_DATA;

  auto *ctx = static_cast<QtViewContext *>(handle);
  InputEvent_t ev{};
  if (ctx->widget->popInput(ev)) {
    *event = ev;
    return VIEW_OK;
  }
  return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  auto *ctx = static_cast<QtViewContext *>(handle);
  if (ctx->window) {
    ctx->window->hide();
    delete ctx->window;  // удаляет и центральный виджет
  }
  delete ctx;
  return VIEW_OK;
}

// Экспортируемый экземпляр Qt-View
const ViewInterface qt_view = {
    VIEW_INTERFACE_VERSION,  // version
    qt_init,                 // init
    qt_get_viewport,         // get_viewport
    qt_get_font_metrics,     // get_font_metrics
    qt_draw_frame,           // draw_frame
    qt_render,               // render
    qt_poll_input,           // poll_input
    qt_shutdown              // shutdown
};
