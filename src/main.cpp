#include <exception>
#include <iostream>
#include <memory>
#include <unistd.h>
#include "byte_source.hpp"
#include "editor.hpp"
#include "errors.hpp"
#include "terminal.hpp"
#include "terminfo_terminal.hpp"

int main() {
  std::unique_ptr<TerminfoTerminal> screen;
  std::unique_ptr<Terminal> term;
  try {
    screen = std::make_unique<TerminfoTerminal>(STDOUT_FILENO);
    screen->clear();
    term = std::make_unique<Terminal>(STDIN_FILENO);
    screen->clear();

    FdByteSource keys(STDIN_FILENO);
    Editor ed(*screen, keys);
    ed.run();
    ed.shutdown(*term);
    if (ed.exit_reason() == ExitReason::ReadError)
      std::cerr << "rawpad: " << keys.last_error() << '\n';
  } catch (const std::exception& e) {
    // best effort: get the terminal back before reporting
    if (term && screen && !term->restored()) {
      try {
        release_terminal(*term, *screen);
      } catch (const std::exception& again) {
        std::cerr << "rawpad: " << again.what() << '\n';
      }
    }
    std::cerr << "rawpad: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
