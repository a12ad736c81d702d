#include "headless_terminal.hpp"
#include <cstddef>

void HeadlessTerminal::clear() {
  screen_.clear();
  cursor_ = Cursor{};
  clear_count_++;
  ops_.push_back("clear");
}

void HeadlessTerminal::draw_text(int row, int col, std::string_view text) {
  if (row < 0 || col < 0) return;
  if (static_cast<int>(screen_.size()) <= row) screen_.resize(static_cast<size_t>(row) + 1);
  std::string& line = screen_[static_cast<size_t>(row)];
  size_t end = static_cast<size_t>(col) + text.size();
  if (line.size() < end) line.resize(end, ' ');
  line.replace(static_cast<size_t>(col), text.size(), text);
  cursor_ = Cursor{row, static_cast<int>(end)};
  ops_.push_back("draw " + std::to_string(row) + " " + std::to_string(col) + " " + std::string(text));
}

void HeadlessTerminal::move_cursor(int row, int col) {
  cursor_ = Cursor{row, col};
  ops_.push_back("move " + std::to_string(row) + " " + std::to_string(col));
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= static_cast<int>(screen_.size())) return std::string();
  return screen_[static_cast<size_t>(row)];
}
