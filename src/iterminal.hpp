#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract render surface (clear, draw, cursor, refresh).
 * Goal: decouple Renderer from the real device (terminfo/headless), enable testing.
 * Coordinates: 0-based here; implementations translate to the device protocol.
 */
#include <string_view>

class ITerminal {
public:
  virtual ~ITerminal() = default;
  // clear the whole screen and home the cursor
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, std::string_view text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
};
