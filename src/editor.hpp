#pragma once
/*
 * Editor
 *
 * Purpose: the read -> decode -> apply -> render loop.
 * Ownership: owns the session, decoder and renderer; borrows the render
 *            surface and the byte source from main (or a test).
 */
#include "byte_source.hpp"
#include "edit_session.hpp"
#include "iterminal.hpp"
#include "key_decoder.hpp"
#include "renderer.hpp"
#include "terminal.hpp"
#include "types.hpp"

// restore the input mode, then clear the screen; safe on any exit path
void release_terminal(Terminal& mode, ITerminal& screen);

enum class ExitReason { Running, EndOfSession, ReadError };

class Editor {
public:
  Editor(ITerminal& term, IByteSource& input);
  // returns once the end-of-session byte arrives or the input fails
  ExitReason run();
  // jump-to-top repaint, first step of shutdown
  void park_cursor();
  // park_cursor, then release_terminal on our own surface
  void shutdown(Terminal& mode);

  const EditSession& session() const { return session_; }
  const Renderer& renderer() const { return renderer_; }
  ExitReason exit_reason() const { return exit_reason_; }

private:
  void render();
  bool handle_input(unsigned char ch);
  void apply(const KeyEvent& ev);

  ITerminal& term_;
  IByteSource& input_;
  EditSession session_;
  KeyDecoder decoder_;
  Renderer renderer_;
  ExitReason exit_reason_ = ExitReason::Running;
};
