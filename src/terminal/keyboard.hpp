#pragma once

#include <chrono>

#ifndef _WIN32
#include <termios.h>
#endif

namespace asciicam {

// Splits a raw byte stream into keys. Escape sequences sent by arrow,
// function and navigation keys (ESC [ ... final, ESC O final) are swallowed
// whole; a lone ESC only becomes a key once the input goes quiet.
class KeyDecoder {
public:
    // Returns the completed key, or -1 while a sequence is open or was dropped.
    int feed(unsigned char byte);
    // Called when no further byte arrived in time.
    int flush();
    bool pending() const { return state_ != State::Ground; }

private:
    enum class State { Ground, Escape, Sequence };
    State state_ = State::Ground;
};

// Puts stdin into unbuffered, non-echoing mode for its lifetime.
class Keyboard {
public:
    Keyboard();
    ~Keyboard();

    Keyboard(const Keyboard&) = delete;
    Keyboard& operator=(const Keyboard&) = delete;

    // Returns the next key, or -1 if none arrived within `timeout`.
    int read_key(std::chrono::milliseconds timeout);

    bool raw() const { return modified_; }

private:
    bool modified_ = false;
    KeyDecoder decoder_;
#ifndef _WIN32
    termios original_{};
#else
    unsigned long original_mode_ = 0;
    void* h_stdin_ = nullptr;
#endif
};

}
