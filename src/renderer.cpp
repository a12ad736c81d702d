#include "renderer.hpp"

void Renderer::render(ITerminal& term, const EditSession& session) {
  const TextBuffer& buf = session.buffer();
  term.clear();
  for (int r = 0; r < buf.line_count(); ++r) term.draw_text(r, 0, buf.line(r));
  const Cursor& cur = session.cursor();
  term.move_cursor(cur.row, cur.col);
  term.refresh();
  frames_++;
}

void Renderer::jump_to_top(ITerminal& term, EditSession& session) {
  session.jump_to_top();
  render(term, session);
}
