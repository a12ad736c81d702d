#include "text_buffer.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  TextBuffer b;
  assert(b.line_count() == 1);
  assert(b.line(0).empty());

  b.init_from_lines({"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));

  // never empty
  b.init_from_lines({});
  assert(b.line_count() == 1);
  b.erase_line(0);
  assert(b.line_count() == 1);
  assert(b.line(0).empty());

  b.init_from_lines({"ac"});
  b.insert_byte(0, 1, 'b');
  b.insert_byte(0, 3, 'd');
  assert(b.line(0) == "abcd");
  b.erase_byte(0, 0);
  assert(b.line(0) == "bcd");
  b.erase_byte(0, 3); // past end: ignored
  assert(b.line(0) == "bcd");
  assert(b.take_tail(0, 1) == "cd");
  assert(b.line(0) == "b");
  assert(b.take_tail(0, 1).empty());
  b.append_to_line(0, "yz");
  assert(b.line(0) == "byz");
  assert(b.line_length(0) == 3);

  // bytes are stored verbatim, including NUL and high bytes
  b.insert_byte(0, 0, 0x00);
  b.insert_byte(0, 0, 0xff);
  assert(b.line_length(0) == 5);
  assert(static_cast<unsigned char>(b.line(0)[0]) == 0xff);
  assert(b.line(0)[1] == '\0');

  assert(b.line(7).empty());
  return 0;
}
