#pragma once
/*
 * EditSession
 *
 * Purpose: owns the buffer and the logical cursor; every keystroke mutates it
 *          through the movement/edit methods below.
 * Invariant: 0 <= cur.row < line_count, 0 <= cur.col <= line_length(cur.row).
 * Note: vertical moves reset col to 0 (no remembered column).
 */
#include "text_buffer.hpp"
#include "types.hpp"

class EditSession {
public:
  const TextBuffer& buffer() const { return buf_; }
  const Cursor& cursor() const { return cur_; }

  void move_up();
  void move_down();
  void move_left();
  void move_right();
  void jump_to_top() { cur_ = Cursor{}; }

  void insert_byte(unsigned char b);
  void backspace();
  void insert_line_break();

  /*seed content for tests; clamps cursor to the new buffer*/
  void load(const std::vector<std::string>& lines, Cursor at = Cursor{});

private:
  int cur_len() const { return buf_.line_length(cur_.row); }

  TextBuffer buf_;
  Cursor cur_;
};
