#pragma once

#include <optional>
#include <ostream>

#include <termios.h>

namespace tus::recorder {

// Puts stdin in single-key mode (no line buffering, no echo, Ctrl+C delivered
// as a byte) for its lifetime. Does nothing when stdin is not a terminal.
class TerminalGuard {
 public:
  TerminalGuard();
  ~TerminalGuard();

  TerminalGuard(const TerminalGuard&) = delete;
  TerminalGuard& operator=(const TerminalGuard&) = delete;

  bool active() const { return active_; }

 private:
  termios saved_{};
  bool active_{false};
};

// Blocks for one byte on stdin. Returns std::nullopt on EOF or read error.
std::optional<char> read_key();

void clear_line(std::ostream& out);
void cursor_up(std::ostream& out, int lines);

}  // namespace tus::recorder
