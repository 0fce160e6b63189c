#include "terminal.hpp"

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#  include <cstdio>
#else
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    if (!GetConsoleMode(h, &old_mode_)) return;
    DWORD new_mode = old_mode_ & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT);
    active_ = SetConsoleMode(h, new_mode) != 0;
}

NoEchoGuard::~NoEchoGuard() {
    if (active_) SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    struct termios saved;
    if (tcgetattr(STDIN_FILENO, &saved) != 0) return;  // not a tty

    impl_ = new Impl{saved};
    struct termios raw = saved;
    // Canonical off, echo off. Signals stay on so Ctrl-C still works.
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

#endif

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    return WaitForSingleObject(h, static_cast<DWORD>(timeout_ms)) == WAIT_OBJECT_0;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
#endif
}

bool read_stdin_byte(char& c) {
#ifdef _WIN32
    return _read(_fileno(stdin), &c, 1) == 1;
#else
    return read(STDIN_FILENO, &c, 1) == 1;
#endif
}

} // namespace platform
