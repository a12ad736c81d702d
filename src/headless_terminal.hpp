#pragma once
/*
 * HeadlessTerminal
 *
 * 作用：无头终端实现（ITerminal），用于自动化测试与渲染验证。
 * 记录：屏幕内容、光标位置、操作日志与刷新次数，供断言使用。
 */
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"

class HeadlessTerminal : public ITerminal {
public:
  void clear() override;
  void draw_text(int row, int col, std::string_view text) override;
  void move_cursor(int row, int col) override;
  void refresh() override { refresh_count_++; }

  const std::vector<std::string>& screen() const { return screen_; }
  std::string row_text(int row) const;
  Cursor cursor() const { return cursor_; }
  const std::vector<std::string>& ops() const { return ops_; }
  int clear_count() const { return clear_count_; }
  int refresh_count() const { return refresh_count_; }

private:
  std::vector<std::string> screen_;
  Cursor cursor_;
  std::vector<std::string> ops_;
  int clear_count_ = 0;
  int refresh_count_ = 0;
};
