#pragma once

namespace platform {

// RAII guard that turns off terminal echo on stdin.
// Constructor saves the current mode, destructor restores it.
// A no-op when stdin is not a terminal.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
    bool active_ = false;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read one byte from stdin. Returns false on EOF or error.
bool read_stdin_byte(char& c);

} // namespace platform
