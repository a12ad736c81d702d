#include "editor.hpp"

Editor::Editor(ITerminal& term, IByteSource& input) : term_(term), input_(input) {}

ExitReason Editor::run() {
  while (exit_reason_ == ExitReason::Running) {
    unsigned char ch = 0;
    switch (input_.read_byte(ch)) {
      case ReadStatus::None:
        continue;
      case ReadStatus::Error:
        exit_reason_ = ExitReason::ReadError;
        break;
      case ReadStatus::Byte:
        if (handle_input(ch)) render();
        break;
    }
  }
  return exit_reason_;
}

void Editor::park_cursor() { renderer_.jump_to_top(term_, session_); }

void Editor::shutdown(Terminal& mode) {
  park_cursor();
  release_terminal(mode, term_);
}

void release_terminal(Terminal& mode, ITerminal& screen) {
  mode.restore();
  screen.clear();
  screen.refresh();
}

void Editor::render() { renderer_.render(term_, session_); }

// true when an event was applied and the screen needs a repaint
bool Editor::handle_input(unsigned char ch) {
  std::optional<KeyEvent> ev = decoder_.consume(ch);
  if (!ev) return false;
  if (ev->type == KeyType::Terminate) {
    exit_reason_ = ExitReason::EndOfSession;
    return false;
  }
  apply(*ev);
  return true;
}

void Editor::apply(const KeyEvent& ev) {
  switch (ev.type) {
    case KeyType::Printable: session_.insert_byte(ev.byte); break;
    case KeyType::Enter: session_.insert_line_break(); break;
    case KeyType::Backspace: session_.backspace(); break;
    case KeyType::ArrowUp: session_.move_up(); break;
    case KeyType::ArrowDown: session_.move_down(); break;
    case KeyType::ArrowLeft: session_.move_left(); break;
    case KeyType::ArrowRight: session_.move_right(); break;
    case KeyType::Terminate: break;
  }
}
