#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include "config.hpp"
#include "types.hpp"
/*
 * KeyDecoder
 *
 * Purpose: turn raw input bytes into KeyEvents with minimal state.
 * States: idle (no pending bytes) / escape pending (ESC seen, buffering).
 * Limitation: escape sequences are matched at a fixed window of
 *             RAWPAD_ESCAPE_WINDOW bytes; unknown ones are dropped silently.
 */

class KeyDecoder {
public:
  std::optional<KeyEvent> consume(unsigned char b);
  bool pending() const { return pending_len_ > 0; }
  size_t pending_size() const { return pending_len_; }
  void reset();

  static KeyEvent classify(unsigned char b);

private:
  std::optional<KeyEvent> finish_escape();

  std::array<unsigned char, RAWPAD_ESCAPE_CAPACITY> pending_{};
  size_t pending_len_ = 0;
};
