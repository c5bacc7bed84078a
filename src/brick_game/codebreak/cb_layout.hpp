/**
 * @file cb_layout.hpp
 * @brief Разбиение строк кода на токены и раскладка кирпичей
 *
 * Раскладка превращает упорядоченные строки кода в набор прямоугольных
 * кирпичей, по одному на каждый токен без пробелов:
 * 1. последовательность строк поворачивается от якоря (строки курсора) и
 *    обрезается до max_lines;
 * 2. каждой строке выделяется текстовая строка экрана сверху вниз, пока
 *    хватает высоты;
 * 3. строка делится на наибольшие серии пробельных и непробельных
 *    символов, токены выкладываются слева направо, пока помещаются в ширину.
 *
 * Раскладка не зависит от графической библиотеки: ширину текста сообщает
 * реализация FontMetrics.
 *
 * @see cb_codebreak_internals.hpp, где результат раскладки становится набором
 *      кирпичей партии
 */

#ifndef CODEBREAK_LAYOUT_HPP
#define CODEBREAK_LAYOUT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "cb_config.h"

namespace codebreak {

/**
 * @brief Строка кода с исходным номером (номера начинаются с 1)
 */
struct DisplayLine {
  int line_number = 1;
  std::string text;
};

/**
 * @brief Прямоугольник, выровненный по осям
 */
struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  double right() const noexcept { return x + width; }
  double bottom() const noexcept { return y + height; }

  /// Строгое пересечение: касание границами пересечением не считается.
  bool intersects(const Rect& other) const noexcept {
    return x < other.right() && other.x < right() && y < other.bottom() &&
           other.y < bottom();
  }
};

/**
 * @brief Кирпич: один токен строки кода
 *
 * alive сбрасывается в false ровно один раз, при столкновении с мячом.
 * Вернуть кирпич можно только полной перестройкой раскладки.
 */
struct Brick {
  int id = 0;
  Rect rect;
  std::string label;
  std::string source_text;
  int line_number = 1;
  bool alive = true;
};

/**
 * @brief Номер строки и базовая линия текста для колонки номеров
 */
struct RenderLine {
  int line_number = 1;
  double baseline_y = 0.0;
};

struct LayoutResult {
  std::vector<Brick> bricks;
  std::vector<RenderLine> render_lines;
};

/**
 * @brief Метрики шрифта, которым рисуется код
 *
 * Реализации: MonospaceMetrics (фиксированная сетка), адаптер над
 * FontMetrics_t из C API, метрики Qt в настольном интерфейсе.
 */
class FontMetrics {
 public:
  virtual ~FontMetrics() = default;

  /// Ширина текста в пикселях.
  virtual double advance(std::string_view text) const = 0;
  /// Полная высота строки шрифта.
  virtual double height() const = 0;
  /// Расстояние от верха строки до базовой линии.
  virtual double ascent() const = 0;
};

/**
 * @brief Моноширинные метрики: каждый символ UTF-8 занимает одну ячейку
 */
class MonospaceMetrics final : public FontMetrics {
 public:
  MonospaceMetrics(double char_width, double height, double ascent) noexcept;

  double advance(std::string_view text) const override;
  double height() const override { return height_; }
  double ascent() const override { return ascent_; }

 private:
  double char_width_;
  double height_;
  double ascent_;
};

/**
 * @brief Геометрия области кода
 *
 * Значения по умолчанию берутся из cb_config.h.
 */
struct LayoutParams {
  int min_viewport_width = CODEBREAK_MIN_VIEWPORT_WIDTH;
  int min_viewport_height = CODEBREAK_MIN_VIEWPORT_HEIGHT;
  int code_left = CODEBREAK_CODE_LEFT;
  int code_right_margin = CODEBREAK_CODE_RIGHT_MARGIN;
  int code_top = CODEBREAK_CODE_TOP;
  int code_bottom_margin = CODEBREAK_CODE_BOTTOM_MARGIN;
  int min_line_height = CODEBREAK_MIN_LINE_HEIGHT;
  int line_spacing = CODEBREAK_LINE_SPACING;
};

/**
 * @brief Повернуть последовательность от якоря с переходом через конец
 *
 * Элемент i результата равен items[(anchor_index + i) % items.size()] для
 * i в [0, min(limit, items.size())).
 *
 * @param items        Исходная последовательность
 * @param anchor_index Индекс якоря; вне диапазона [0, size) заменяется на 0
 * @param limit        Максимальная длина результата
 * @return Повёрнутая копия; пустая для пустого items
 */
template <typename T>
std::vector<T> rotate_from_anchor(const std::vector<T>& items, int anchor_index,
                                  std::size_t limit) {
  std::vector<T> out;
  if (items.empty()) return out;

  const std::size_t n = items.size();
  std::size_t anchor = 0;
  if (anchor_index >= 0 && static_cast<std::size_t>(anchor_index) < n) {
    anchor = static_cast<std::size_t>(anchor_index);
  }

  const std::size_t count = limit < n ? limit : n;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(items[(anchor + i) % n]);
  }
  return out;
}

/**
 * @brief Разбить строку на чередующиеся токены `\S+` и `\s+`
 *
 * Пробельными считаются " \t\n\v\f\r". Строка просматривается один раз,
 * поэтому длина строки не ограничена. Конкатенация результата в точности
 * равна исходной строке.
 */
std::vector<std::string> split_tokens(const std::string& text);

/// true, если токен состоит только из пробельных символов.
bool is_whitespace_token(const std::string& token) noexcept;

/// Эффективная ширина области отрисовки (не меньше минимальной).
int effective_width(int viewport_width, const LayoutParams& params) noexcept;

/// Эффективная высота области отрисовки (не меньше минимальной).
int effective_height(int viewport_height, const LayoutParams& params) noexcept;

/// Высота одной строки кода: max(min_line_height, height + line_spacing).
double line_height(const FontMetrics& metrics, const LayoutParams& params);

/**
 * @brief Сколько строк кода помещается по высоте (не меньше 1)
 */
int visible_line_count(int viewport_height, const FontMetrics& metrics,
                       const LayoutParams& params);

/**
 * @brief Построить кирпичи для строк кода
 *
 * @param lines           Строки в порядке источника
 * @param anchor_index    Индекс строки курсора в lines
 * @param max_lines       Сколько строк брать после поворота
 * @param viewport_width  Ширина области (поднимается до минимальной)
 * @param viewport_height Высота области (поднимается до минимальной)
 * @param metrics         Метрики шрифта
 * @param params          Геометрия области кода
 * @return Кирпичи (id = порядковый номер) и строки колонки номеров
 *
 * @note Токен, не помещающийся до правой границы, обрывает строку: следующие
 *       токены этой строки не выкладываются, переноса нет.
 * @note Пробельные токены сдвигают курсор, но кирпичей не дают.
 */
LayoutResult layout(const std::vector<DisplayLine>& lines, int anchor_index,
                    std::size_t max_lines, int viewport_width,
                    int viewport_height, const FontMetrics& metrics,
                    const LayoutParams& params = LayoutParams{});

}  // namespace codebreak

#endif  // CODEBREAK_LAYOUT_HPP
