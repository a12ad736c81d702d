#include "key_decoder.hpp"

static constexpr unsigned char ESC = RAWPAD_KEY_ESCAPE;
static constexpr unsigned char CSI = '[';

std::optional<KeyEvent> KeyDecoder::consume(unsigned char b) {
  if (pending_len_ == 0 && b != ESC) return classify(b);
  pending_[pending_len_++] = b;
  if (pending_len_ < RAWPAD_ESCAPE_WINDOW) return std::nullopt;
  return finish_escape();
}

KeyEvent KeyDecoder::classify(unsigned char b) {
  switch (b) {
    case RAWPAD_KEY_QUIT: return {KeyType::Terminate, b};
    case RAWPAD_KEY_ENTER: return {KeyType::Enter, b};
    case RAWPAD_KEY_BACKSPACE: return {KeyType::Backspace, b};
    default: return {KeyType::Printable, b};
  }
}

std::optional<KeyEvent> KeyDecoder::finish_escape() {
  unsigned char first = pending_[1];
  unsigned char second = pending_[2];
  reset();
  if (first != CSI) return std::nullopt;
  switch (second) {
    case 'A': return KeyEvent{KeyType::ArrowUp, second};
    case 'B': return KeyEvent{KeyType::ArrowDown, second};
    case 'C': return KeyEvent{KeyType::ArrowRight, second};
    case 'D': return KeyEvent{KeyType::ArrowLeft, second};
    default: return std::nullopt;
  }
}

void KeyDecoder::reset() {
  pending_.fill(0);
  pending_len_ = 0;
}
