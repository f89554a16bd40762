#pragma once
#include <array>
#include <cmath>
#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>

static const double PASSWORD_MIN_ENTROPY_BITS = 80.0;

// Turns terminal echo off for its lifetime. A no-op when fd is not a tty.
class EchoOff {
public:
    explicit EchoOff(int fd) : fd_(fd) {
        active_ = tcgetattr(fd_, &saved_) == 0;
        if (!active_) return;
        struct termios quiet = saved_;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(fd_, TCSANOW, &quiet) == 0;
    }
    ~EchoOff() {
        if (active_) tcsetattr(fd_, TCSANOW, &saved_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    int fd_;
    bool active_ = false;
    struct termios saved_{};
};

// One line from stdin, trailing CR stripped (for --pass-stdin).
inline std::string read_password_line() {
    std::string password;
    std::getline(std::cin, password);
    if (!password.empty() && password.back() == '\r')
        password.pop_back();
    return password;
}

// Prompt on stderr, read one line from stdin with echo off.
inline std::string read_hidden(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string password;
    {
        EchoOff quiet(STDIN_FILENO);
        password = read_password_line();
    }
    std::cerr << "\n";
    return password;
}

// Length times Shannon entropy of the byte distribution.
inline double password_entropy_bits(const std::string& pw) {
    std::array<size_t, 256> counts{};
    for (unsigned char c : pw) counts[c]++;

    const double n = static_cast<double>(pw.size());
    double bits = 0.0;
    for (size_t count : counts) {
        if (count == 0) continue;
        bits -= count * std::log2(count / n);
    }
    return bits;
}
