#pragma once
/*
 * Renderer
 *
 * Purpose: full repaint of the session onto an ITerminal.
 * Order: clear+home, every line at its row (column 0), then the cursor.
 * Constraint: stateless; no diffing, no viewport (lines past the screen are
 *             still emitted and left to the terminal).
 */
#include "edit_session.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  void render(ITerminal& term, const EditSession& session);
  // home the logical cursor and repaint; used once on shutdown
  void jump_to_top(ITerminal& term, EditSession& session);
  int frames() const { return frames_; }

private:
  int frames_ = 0;
};
