/**
 * @file cb_layout.cpp
 * @brief Реализация раскладки строк кода в кирпичи
 */

#include "cb_layout.hpp"

#include <algorithm>
#include <utility>

namespace codebreak {

namespace {

// Пробельные символы локали "C"
const char kWhitespace[] = " \t\n\v\f\r";

}  // namespace

MonospaceMetrics::MonospaceMetrics(double char_width, double height,
                                   double ascent) noexcept
    : char_width_(char_width), height_(height), ascent_(ascent) {}

double MonospaceMetrics::advance(std::string_view text) const {
  std::size_t glyphs = 0;
  for (unsigned char c : text) {
    // байты продолжения UTF-8 не начинают новый символ
    if ((c & 0xC0) != 0x80) ++glyphs;
  }
  return static_cast<double>(glyphs) * char_width_;
}

std::vector<std::string> split_tokens(const std::string& text) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const bool blank = text.find_first_of(kWhitespace, pos) == pos;
    std::size_t end = blank ? text.find_first_not_of(kWhitespace, pos)
                            : text.find_first_of(kWhitespace, pos);
    if (end == std::string::npos) end = text.size();
    tokens.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return tokens;
}

bool is_whitespace_token(const std::string& token) noexcept {
  return token.find_first_not_of(kWhitespace) == std::string::npos;
}

int effective_width(int viewport_width, const LayoutParams& params) noexcept {
  return std::max(params.min_viewport_width, viewport_width);
}

int effective_height(int viewport_height, const LayoutParams& params) noexcept {
  return std::max(params.min_viewport_height, viewport_height);
}

double line_height(const FontMetrics& metrics, const LayoutParams& params) {
  return std::max(static_cast<double>(params.min_line_height),
                  metrics.height() + params.line_spacing);
}

int visible_line_count(int viewport_height, const FontMetrics& metrics,
                       const LayoutParams& params) {
  const int h = effective_height(viewport_height, params);
  const double row = line_height(metrics, params);
  const double free_space = h - params.code_top - params.code_bottom_margin;
  if (row <= 0.0 || free_space <= 0.0) return 1;
  return std::max(1, static_cast<int>(free_space / row));
}

LayoutResult layout(const std::vector<DisplayLine>& lines, int anchor_index,
                    std::size_t max_lines, int viewport_width,
                    int viewport_height, const FontMetrics& metrics,
                    const LayoutParams& params) {
  LayoutResult result;

  const std::vector<DisplayLine> ordered =
      rotate_from_anchor(lines, anchor_index, max_lines);
  if (ordered.empty()) return result;

  const int w = effective_width(viewport_width, params);
  const double row_h = line_height(metrics, params);
  const double code_right = w - params.code_right_margin;
  const std::size_t rows = std::min(
      ordered.size(),
      static_cast<std::size_t>(
          visible_line_count(viewport_height, metrics, params)));

  for (std::size_t i = 0; i < rows; ++i) {
    const DisplayLine& line = ordered[i];
    const double top = params.code_top + static_cast<double>(i) * row_h;
    result.render_lines.push_back({line.line_number, top + metrics.ascent()});

    double x = params.code_left;
    for (const std::string& token : split_tokens(line.text)) {
      const double token_w = std::max(1.0, metrics.advance(token));
      if (x + token_w > code_right) break;

      if (!is_whitespace_token(token)) {
        Brick brick;
        brick.id = static_cast<int>(result.bricks.size());
        brick.rect = {x, top, token_w, row_h};
        brick.label = token;
        brick.source_text = line.text;
        brick.line_number = line.line_number;
        result.bricks.push_back(std::move(brick));
      }
      x += token_w;
    }
  }

  return result;
}

}  // namespace codebreak
