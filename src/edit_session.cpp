#include "edit_session.hpp"
#include <algorithm>

void EditSession::move_up() { if (cur_.row > 0) { cur_.row--; cur_.col = 0; } }
void EditSession::move_down() { if (cur_.row + 1 < buf_.line_count()) { cur_.row++; cur_.col = 0; } }
void EditSession::move_left() { if (cur_.col > 0) cur_.col--; }
void EditSession::move_right() { if (cur_.col < cur_len()) cur_.col++; }

void EditSession::insert_byte(unsigned char b) {
  buf_.insert_byte(cur_.row, cur_.col, b);
  cur_.col++;
}

void EditSession::backspace() {
  if (cur_.col > 0) {
    buf_.erase_byte(cur_.row, cur_.col - 1);
    cur_.col--;
  } else if (cur_.row > 0) {
    // join current line onto the end of the previous one
    int prev = cur_.row - 1;
    int join_col = buf_.line_length(prev);
    std::string moved = buf_.line(cur_.row);
    buf_.append_to_line(prev, moved);
    buf_.erase_line(cur_.row);
    cur_.row = prev;
    cur_.col = join_col;
  }
}

void EditSession::insert_line_break() {
  std::string right = buf_.take_tail(cur_.row, cur_.col);
  buf_.insert_line(cur_.row + 1, right);
  cur_.row++;
  cur_.col = 0;
}

void EditSession::load(const std::vector<std::string>& lines, Cursor at) {
  buf_.init_from_lines(lines);
  cur_.row = std::clamp(at.row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(at.col, 0, cur_len());
}
