/**
 * @file cb_line_source.cpp
 * @brief Реализация источников строк кода
 */

#include "cb_line_source.hpp"

#include <fstream>
#include <utility>

namespace codebreak {

namespace {

std::string strip(const std::string& s) {
  const char* ws = " \t\r\n\v\f";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) return std::string();
  const auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

}  // namespace

StaticLineSource::StaticLineSource(std::vector<DisplayLine> lines,
                                   int anchor_index)
    : data_{std::move(lines), anchor_index} {}

SourceLines StaticLineSource::collect() { return data_; }

FileLineSource::FileLineSource(std::string path, int cursor_line)
    : path_(std::move(path)), cursor_line_(cursor_line) {}

SourceLines FileLineSource::collect() {
  std::ifstream file(path_);
  if (!file.is_open()) return {};

  std::vector<std::string> raw;
  std::string line;
  while (std::getline(file, line)) {
    raw.push_back(line);
  }

  const int cursor_raw = cursor_line_ > 0 ? cursor_line_ - 1 : 0;
  return collect_lines(raw, cursor_raw);
}

SourceLines collect_lines(const std::vector<std::string>& raw_lines,
                          int cursor_raw_index) {
  SourceLines out;
  std::vector<int> raw_indices;

  for (std::size_t i = 0; i < raw_lines.size(); ++i) {
    std::string text = strip(raw_lines[i]);
    if (text.empty()) continue;
    out.lines.push_back({static_cast<int>(i) + 1, std::move(text)});
    raw_indices.push_back(static_cast<int>(i));
  }

  for (std::size_t idx = 0; idx < raw_indices.size(); ++idx) {
    if (raw_indices[idx] >= cursor_raw_index) {
      out.anchor_index = static_cast<int>(idx);
      break;
    }
  }
  return out;
}

std::vector<DisplayLine> placeholder_lines() {
  return {
      {1, "mov eax, ebx"},
      {2, "cmp eax, 0"},
      {3, "jne loc_next"},
      {4, "call sub_handler"},
      {5, "ret"},
  };
}

}  // namespace codebreak
