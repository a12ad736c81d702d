#pragma once
/*
 * TerminfoTerminal
 *
 * Purpose: ITerminal implementation writing straight to a file descriptor,
 *          with control sequences taken from the ncurses terminfo database.
 * Note: no curses screen management (initscr); raw mode is owned by Terminal.
 * Errors: TerminalError on a missing terminfo entry/capability,
 *         OutputWriteError when a write fails. Every call writes through.
 */
#include <string>
#include <string_view>
#include "iterminal.hpp"

class TerminfoTerminal : public ITerminal {
public:
  // term_name == nullptr uses $TERM
  explicit TerminfoTerminal(int fd, const char* term_name = nullptr);
  TerminfoTerminal(const TerminfoTerminal&) = delete;
  TerminfoTerminal& operator=(const TerminfoTerminal&) = delete;

  void clear() override;
  void draw_text(int row, int col, std::string_view text) override;
  void move_cursor(int row, int col) override;
  void refresh() override;

private:
  void write_all(std::string_view bytes);

  int fd_;
  std::string clear_seq_;
  std::string cup_cap_;
};
