#ifndef __DX_RAW_CONSOLE_HPP__
#define __DX_RAW_CONSOLE_HPP__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Puts the controlling terminal into raw mode for the interactive host.
 */
class RawConsole {
 public:
  RawConsole() : active(false) {}

  ~RawConsole() { teardown(); }

  /** @brief Saves the current termios state and switches stdin to raw. */
  void setup() {
    if (active || !isatty(STDIN_FILENO)) {
      return;
    }
    termios terminal_local;
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
    active = true;
  }

  /** @brief Restores the state saved by setup(). */
  void teardown() {
    if (!active) {
      return;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
    active = false;
  }

  /** @brief Window size as (cols, rows), or 80x24 when stdout is no tty. */
  pair<int, int> getWindowSize() const {
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_col == 0 ||
        win.ws_row == 0) {
      return make_pair(80, 24);
    }
    return make_pair(int(win.ws_col), int(win.ws_row));
  }

  /** @brief Writes all of @p data to stdout, retrying short writes. */
  static void writeOut(const string& data) {
    size_t pos = 0;
    while (pos < data.length()) {
      ssize_t written =
          ::write(STDOUT_FILENO, data.data() + pos, data.length() - pos);
      if (written < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        STFATAL << "Error writing to stdout: " << strerror(GetErrno());
      }
      pos += written;
    }
  }

 protected:
  bool active;
  termios terminal_backup;
};
}  // namespace dx

#endif  // __DX_RAW_CONSOLE_HPP__
