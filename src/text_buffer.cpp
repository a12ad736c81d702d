#include "text_buffer.hpp"
#include <algorithm>
#include <cstddef>

static const std::string kEmptyLine;

TextBuffer::TextBuffer() { ensure_not_empty(); }

int TextBuffer::line_length(int row) const { return static_cast<int>(line(row).size()); }

const std::string& TextBuffer::line(int r) const {
  if (r < 0 || r >= line_count()) return kEmptyLine;
  return lines_[static_cast<size_t>(r)];
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(const std::vector<std::string>& lines) {
  lines_ = lines;
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, std::string_view s) {
  size_t pos = std::min(static_cast<size_t>(std::max(row, 0)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::string(s));
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::insert_byte(int row, int col, unsigned char b) {
  if (row < 0 || row >= line_count()) return;
  std::string& s = lines_[static_cast<size_t>(row)];
  char c = static_cast<char>(b);
  if (col >= static_cast<int>(s.size())) s.push_back(c);
  else s.insert(s.begin() + std::max(col, 0), c);
}

void TextBuffer::erase_byte(int row, int col) {
  if (row < 0 || row >= line_count()) return;
  std::string& s = lines_[static_cast<size_t>(row)];
  if (col < 0 || col >= static_cast<int>(s.size())) return;
  s.erase(s.begin() + col);
}

void TextBuffer::append_to_line(int row, std::string_view s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)].append(s);
}

std::string TextBuffer::take_tail(int row, int col) {
  if (row < 0 || row >= line_count()) return std::string();
  std::string& s = lines_[static_cast<size_t>(row)];
  if (col < 0) col = 0;
  if (col >= static_cast<int>(s.size())) return std::string();
  std::string tail = s.substr(static_cast<size_t>(col));
  s.erase(static_cast<size_t>(col));
  return tail;
}
