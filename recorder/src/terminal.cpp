#include "recorder/terminal.hpp"

#include <cerrno>

#include <unistd.h>

namespace tus::recorder {

TerminalGuard::TerminalGuard() {
  if (!::isatty(STDIN_FILENO)) return;
  if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
  termios raw = saved_;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(STDIN_FILENO, TCSADRAIN, &raw) == 0) active_ = true;
}

TerminalGuard::~TerminalGuard() {
  if (active_) ::tcsetattr(STDIN_FILENO, TCSADRAIN, &saved_);
}

std::optional<char> read_key() {
  char c = 0;
  while (true) {
    ssize_t n = ::read(STDIN_FILENO, &c, 1);
    if (n == 1) return c;
    if (n < 0 && errno == EINTR) continue;
    return std::nullopt;
  }
}

void clear_line(std::ostream& out) {
  out << "\x1b[2K\r";
}

void cursor_up(std::ostream& out, int lines) {
  if (lines <= 0) return;
  out << "\x1b[" << lines << "A";
}

}  // namespace tus::recorder
