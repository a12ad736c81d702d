#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Cursor/KeyEvent).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

struct Cursor { int row = 0; int col = 0; };

inline bool operator==(const Cursor& a, const Cursor& b) { return a.row == b.row && a.col == b.col; }

enum class KeyType { Printable, Enter, Backspace, Terminate, ArrowUp, ArrowDown, ArrowLeft, ArrowRight };

struct KeyEvent {
  KeyType type = KeyType::Printable;
  unsigned char byte = 0; // valid when Printable
};
