#include "keyboard.hpp"
#include <thread>

#ifdef _WIN32
#include <windows.h>
#include <conio.h>
#else
#include <sys/select.h>
#include <unistd.h>
#endif

namespace asciicam {

namespace {

constexpr unsigned char kEsc = 27;

}

int KeyDecoder::feed(unsigned char byte) {
    switch (state_) {
        case State::Ground:
            if (byte == kEsc) {
                state_ = State::Escape;
                return -1;
            }
            return byte;
        case State::Escape:
            if (byte == '[' || byte == 'O') {
                state_ = State::Sequence;
                return -1;
            }
            if (byte == kEsc) return -1;
            // Alt+key arrives as ESC key; neither half is a binding.
            state_ = State::Ground;
            return -1;
        case State::Sequence:
            // Parameter and intermediate bytes continue, 0x40..0x7E ends it.
            if (byte >= 0x20 && byte <= 0x3F) return -1;
            state_ = State::Ground;
            return -1;
    }
    return -1;
}

int KeyDecoder::flush() {
    const bool lone_escape = state_ == State::Escape;
    state_ = State::Ground;
    return lone_escape ? kEsc : -1;
}

#ifdef _WIN32

Keyboard::Keyboard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    if (h == INVALID_HANDLE_VALUE) return;
    DWORD mode = 0;
    if (!GetConsoleMode(h, &mode)) return;
    SetConsoleMode(h, mode & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT));
    h_stdin_ = h;
    original_mode_ = mode;
    modified_ = true;
}

Keyboard::~Keyboard() {
    if (modified_) {
        SetConsoleMode(static_cast<HANDLE>(h_stdin_), static_cast<DWORD>(original_mode_));
    }
}

int Keyboard::read_key(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    do {
        if (_kbhit()) {
            const int c = _getch();
            // Arrow and function keys come as a 0 or 0xE0 prefix plus a scan code.
            if (c == 0 || c == 0xE0) {
                _getch();
                return -1;
            }
            return c;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    } while (std::chrono::steady_clock::now() < deadline);
    return -1;
}

#else

Keyboard::Keyboard() {
    if (!isatty(STDIN_FILENO)) return;
    if (tcgetattr(STDIN_FILENO, &original_) != 0) return;
    termios raw = original_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0) {
        modified_ = true;
    }
}

Keyboard::~Keyboard() {
    if (modified_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original_);
    }
}

namespace {

enum : int { kNoByte = -1, kEndOfInput = -2 };

// Terminals send a whole sequence in one write; this only covers slow links.
constexpr std::chrono::milliseconds kSequenceWait{25};

int read_byte(std::chrono::milliseconds timeout) {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    timeval tv;
    tv.tv_sec = static_cast<long>(us / 1000000);
    tv.tv_usec = static_cast<long>(us % 1000000);
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);

    if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) <= 0) return kNoByte;
    unsigned char c;
    if (read(STDIN_FILENO, &c, 1) == 1) return c;
    return kEndOfInput;
}

}

int Keyboard::read_key(std::chrono::milliseconds timeout) {
    while (true) {
        const int byte = read_byte(decoder_.pending() ? kSequenceWait : timeout);
        if (byte == kEndOfInput) {
            // EOF on a closed or redirected stdin stays readable forever.
            std::this_thread::sleep_for(timeout);
            return decoder_.flush();
        }
        if (byte == kNoByte) return decoder_.flush();

        const int key = decoder_.feed(static_cast<unsigned char>(byte));
        if (key >= 0 || !decoder_.pending()) return key;
    }
}

#endif

}
