#pragma once
/*
 * Terminal
 *
 * Purpose: RAII owner of the input device's raw mode.
 * Usage: construct in main (enters raw mode, throws TerminalError if the
 *        device is not a terminal); restore() once on the normal exit path.
 *        The destructor restores if restore() was never called.
 * Note: manages terminal modes (icanon/echo/vmin/vtime), not rendering.
 */
#include <termios.h>

class Terminal {
public:
  explicit Terminal(int fd);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  // reinstate the saved mode; second and later calls do nothing
  void restore();
  bool restored() const { return restored_; }

private:
  int fd_;
  termios saved_{};
  bool restored_ = false;
};
