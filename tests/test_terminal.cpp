#include "terminal.hpp"
#include "byte_source.hpp"
#include "errors.hpp"
#include <cassert>
#include <cstdio>
#include <pty.h>
#include <string>
#include <unistd.h>

// ctest SKIP_RETURN_CODE
static constexpr int kSkipped = 77;

static void test_raw_mode_rejects_pipe() {
  int fds[2];
  assert(pipe(fds) == 0);
  bool threw = false;
  try {
    Terminal term(fds[0]);
  } catch (const TerminalError& e) {
    threw = true;
    assert(std::string(e.what()).find("tcgetattr") == 0);
  }
  assert(threw);
  close(fds[0]);
  close(fds[1]);
}

static void test_fd_byte_source() {
  int fds[2];
  assert(pipe(fds) == 0);
  assert(write(fds[1], "ok", 2) == 2);
  close(fds[1]);
  FdByteSource src(fds[0]);
  unsigned char b = 0;
  assert(src.read_byte(b) == ReadStatus::Byte && b == 'o');
  assert(src.read_byte(b) == ReadStatus::Byte && b == 'k');
  assert(src.read_byte(b) == ReadStatus::None); // end of stream
  close(fds[0]);
  FdByteSource closed(fds[0]);
  assert(closed.read_byte(b) == ReadStatus::Error);
  assert(!closed.last_error().empty());
}

static termios attrs(int fd) {
  termios t{};
  assert(tcgetattr(fd, &t) == 0);
  return t;
}

static bool same_mode(const termios& a, const termios& b) {
  return a.c_lflag == b.c_lflag && a.c_cc[VMIN] == b.c_cc[VMIN] && a.c_cc[VTIME] == b.c_cc[VTIME];
}

static void test_enter_and_restore(int tty) {
  termios before = attrs(tty);
  assert((before.c_lflag & ICANON) && (before.c_lflag & ECHO));
  termios changed = before;
  changed.c_lflag &= static_cast<tcflag_t>(~ECHO);
  {
    Terminal term(tty);
    termios raw = attrs(tty);
    assert(!(raw.c_lflag & ICANON));
    assert(!(raw.c_lflag & ECHO));
    assert(raw.c_cc[VMIN] == 1);
    assert(raw.c_cc[VTIME] == 0);
    assert(!term.restored());

    term.restore();
    assert(term.restored());
    assert(same_mode(attrs(tty), before));

    // later restores (and the destructor) leave the device alone
    assert(tcsetattr(tty, TCSANOW, &changed) == 0);
    term.restore();
    assert(same_mode(attrs(tty), changed));
  }
  assert(same_mode(attrs(tty), changed));
  assert(tcsetattr(tty, TCSANOW, &before) == 0);
}

static void test_destructor_restores(int tty) {
  termios before = attrs(tty);
  {
    Terminal term(tty);
    assert(!(attrs(tty).c_lflag & ICANON));
  }
  assert(same_mode(attrs(tty), before));
}

static void test_destructor_reports_failure(int tty) {
  int err_pipe[2];
  assert(pipe(err_pipe) == 0);
  int saved_err = dup(STDERR_FILENO);
  int spare = dup(tty);
  {
    Terminal term(spare);
    close(spare); // restore can no longer reach the device
    assert(dup2(err_pipe[1], STDERR_FILENO) >= 0);
  }
  assert(dup2(saved_err, STDERR_FILENO) >= 0);
  close(saved_err);
  close(err_pipe[1]);
  std::string out;
  char buf[256];
  ssize_t n;
  while ((n = read(err_pipe[0], buf, sizeof buf)) > 0) out.append(buf, static_cast<size_t>(n));
  close(err_pipe[0]);
  assert(out.find("rawpad: tcsetattr") == 0);
  // leave the shared pty in cooked mode for the next check
  termios t = attrs(tty);
  t.c_lflag |= ICANON | ECHO;
  assert(tcsetattr(tty, TCSANOW, &t) == 0);
}

int main() {
  test_raw_mode_rejects_pipe();
  test_fd_byte_source();

  int master = -1, tty = -1;
  if (openpty(&master, &tty, nullptr, nullptr, nullptr) != 0) {
    std::perror("openpty");
    return kSkipped;
  }
  test_enter_and_restore(tty);
  test_destructor_restores(tty);
  test_destructor_reports_failure(tty);
  close(tty);
  close(master);
  return 0;
}
