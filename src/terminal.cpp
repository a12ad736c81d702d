#include "terminal.hpp"
#include <iostream>
#include "errors.hpp"

Terminal::Terminal(int fd) : fd_(fd) {
  if (tcgetattr(fd_, &saved_) != 0) throw TerminalError(errno_message("tcgetattr"));
  termios raw = saved_;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSANOW, &raw) != 0) throw TerminalError(errno_message("tcsetattr"));
}

Terminal::~Terminal() {
  if (!restored_) {
    restored_ = true;
    // destructors must not throw; report and carry on exiting
    if (tcsetattr(fd_, TCSANOW, &saved_) != 0)
      std::cerr << "rawpad: " << errno_message("tcsetattr") << '\n';
  }
}

void Terminal::restore() {
  if (restored_) return;
  restored_ = true;
  if (tcsetattr(fd_, TCSANOW, &saved_) != 0) throw TerminalError(errno_message("tcsetattr"));
}
