#include "cmdtree/prompt.hpp"

#include <cstdio>
#include <iostream>
#include <string>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace cmdtree {

namespace {

// Turns terminal echo off for its lifetime.
class EchoGuard {
public:
    EchoGuard() {
#if defined(_WIN32)
        handle_ = GetStdHandle(STD_INPUT_HANDLE);
        if (handle_ == INVALID_HANDLE_VALUE || !GetConsoleMode(handle_, &saved_)) return;
        active_ = SetConsoleMode(handle_, saved_ & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
#else
        if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
        termios silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
#endif
    }

    ~EchoGuard() {
        if (!active_) return;
#if defined(_WIN32)
        SetConsoleMode(handle_, saved_);
#else
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    [[nodiscard]] bool active() const { return active_; }

private:
#if defined(_WIN32)
    HANDLE handle_{nullptr};
    DWORD saved_{0};
#else
    termios saved_{};
#endif
    bool active_{false};
};

} // namespace

bool isInteractive() {
#if defined(_WIN32)
    return _isatty(_fileno(stdin)) != 0;
#else
    return ::isatty(fileno(stdin)) != 0;
#endif
}

TerminalPrompter::TerminalPrompter() : TerminalPrompter(std::cin, std::cerr) {}

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out) : in_(&in), out_(&out) {}

std::optional<std::string> TerminalPrompter::ask(const std::string& text, bool secure) {
    *out_ << text;
    if (!text.empty() && text.back() != ' ') *out_ << ": ";
    out_->flush();

    std::string line;
    if (secure && in_ == &std::cin && isInteractive()) {
        EchoGuard guard;
        const bool ok = static_cast<bool>(std::getline(*in_, line));
        if (guard.active()) *out_ << "\n";
        if (!ok) return std::nullopt;
        return line;
    }

    if (!std::getline(*in_, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace cmdtree
