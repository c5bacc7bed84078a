/**
 * @file cb_line_source.hpp
 * @brief Источники строк кода для раскладки
 *
 * Источник возвращает упорядоченные строки с исходными номерами и индекс
 * якоря (строки под курсором). Игра опрашивает источник при старте, при
 * перезапуске, по команде обновления и после уничтожения всех кирпичей,
 * поэтому каждый вызов collect() должен отражать актуальное содержимое.
 */

#ifndef CODEBREAK_LINE_SOURCE_HPP
#define CODEBREAK_LINE_SOURCE_HPP

#include <string>
#include <vector>

#include "cb_layout.hpp"

namespace codebreak {

/**
 * @brief Строки и якорь, полученные от источника
 */
struct SourceLines {
  std::vector<DisplayLine> lines;
  int anchor_index = 0;
};

/**
 * @brief Абстрактный источник строк кода
 */
class LineSource {
 public:
  virtual ~LineSource() = default;

  /// Пустой результат означает, что строк нет (игра подставит заглушку).
  virtual SourceLines collect() = 0;
};

/**
 * @brief Источник с неизменным набором строк
 */
class StaticLineSource final : public LineSource {
 public:
  StaticLineSource(std::vector<DisplayLine> lines, int anchor_index);

  SourceLines collect() override;

 private:
  SourceLines data_;
};

/**
 * @brief Источник, читающий текстовый файл при каждом опросе
 *
 * Номер строки курсора задаётся с 1; 0 означает "неизвестно" (якорь на первой
 * непустой строке). Недоступный файл даёт пустой результат.
 */
class FileLineSource final : public LineSource {
 public:
  FileLineSource(std::string path, int cursor_line);

  SourceLines collect() override;

  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
  int cursor_line_;
};

/**
 * @brief Очистить сырые строки и найти якорь
 *
 * - пробелы по краям строки отбрасываются;
 * - пустые после очистки строки пропускаются;
 * - оставшиеся строки сохраняют исходный номер (raw_index + 1);
 * - якорь: индекс первой оставшейся строки с raw_index >= cursor_raw_index,
 *   либо 0, если такой нет.
 *
 * @param raw_lines        Строки в исходном порядке
 * @param cursor_raw_index Индекс строки курсора в raw_lines (с 0)
 */
SourceLines collect_lines(const std::vector<std::string>& raw_lines,
                          int cursor_raw_index);

/**
 * @brief Встроенные строки на случай отсутствия кода
 */
std::vector<DisplayLine> placeholder_lines();

}  // namespace codebreak

#endif  // CODEBREAK_LINE_SOURCE_HPP
