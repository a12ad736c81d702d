#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based byte buffer supporting line/byte ops.
 * Invariant: never empty; an erase that would drop the last line leaves one empty line.
 * Note: lines are raw bytes (std::string as container), no encoding awareness.
 */
#include <string>
#include <string_view>
#include <vector>

class TextBuffer {
public:
  TextBuffer();

  int line_count() const { return static_cast<int>(lines_.size()); }
  int line_length(int row) const;
  const std::string& line(int r) const;

  void init_from_lines(const std::vector<std::string>& lines);

  void insert_line(int row, std::string_view s);
  void erase_line(int row);

  /*byte level*/
  void insert_byte(int row, int col, unsigned char b);
  void erase_byte(int row, int col);
  void append_to_line(int row, std::string_view s);
  std::string take_tail(int row, int col);

private:
  void ensure_not_empty();

  std::vector<std::string> lines_;
};
