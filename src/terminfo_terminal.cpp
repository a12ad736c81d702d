#define NCURSES_NOMACROS
#include "terminfo_terminal.hpp"
#include <cerrno>
#include <curses.h>
#include <term.h>
#include <unistd.h>
#include "errors.hpp"

// tputs only takes a plain int(*)(int); collect its output here
static std::string* g_tputs_sink = nullptr;

static int sink_byte(int c) {
  if (g_tputs_sink) g_tputs_sink->push_back(static_cast<char>(c));
  return c;
}

static bool cap_present(const char* cap) {
  return cap != nullptr && cap != reinterpret_cast<const char*>(-1);
}

// expand padding/delays of a terminfo string into plain bytes
static std::string expand(const char* cap) {
  std::string out;
  g_tputs_sink = &out;
  tputs(cap, 1, sink_byte);
  g_tputs_sink = nullptr;
  return out;
}

TerminfoTerminal::TerminfoTerminal(int fd, const char* term_name) : fd_(fd) {
  int err = 0;
  if (setupterm(term_name, fd, &err) != OK) {
    std::string name = term_name ? term_name : "$TERM";
    if (err == 0) throw TerminalError("setupterm: no terminfo entry for " + name);
    throw TerminalError("setupterm: terminfo database not found");
  }
  if (!cap_present(clear_screen) || !cap_present(cursor_address))
    throw TerminalError("terminfo: terminal lacks clear_screen/cursor_address");
  clear_seq_ = expand(clear_screen);
  cup_cap_ = cursor_address;
}

void TerminfoTerminal::clear() { write_all(clear_seq_); }

void TerminfoTerminal::draw_text(int row, int col, std::string_view text) {
  std::string out = expand(tiparm(cup_cap_.c_str(), row, col));
  out.append(text);
  write_all(out);
}

void TerminfoTerminal::move_cursor(int row, int col) {
  write_all(expand(tiparm(cup_cap_.c_str(), row, col)));
}

// writes go straight to the descriptor, nothing is held back
void TerminfoTerminal::refresh() {}

void TerminfoTerminal::write_all(std::string_view bytes) {
  size_t done = 0;
  while (done < bytes.size()) {
    ssize_t n = ::write(fd_, bytes.data() + done, bytes.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw OutputWriteError(errno_message("write"));
    }
    if (n == 0) throw OutputWriteError("write: device accepted no bytes");
    done += static_cast<size_t>(n);
  }
}
