#pragma once

#include "core/event.hpp"
#include <map>
#include <optional>
#include <string>

namespace asciicam {

constexpr int kKeyEscape = 27;

// Raw key byte to command lookup.
class KeyMap {
public:
    // space toggle camera, c color, s/a next/previous set, +/= and - scale,
    // f force stop, r reset, q or Esc quit.
    static KeyMap defaults();

    std::optional<ControlCommand> lookup(int key) const;

    void bind(int key, ControlCommand cmd);
    // Drops every key bound to `cmd`.
    void unbind(ControlCommand cmd);

    // Applies overrides of the form command name -> one-character key. A bad
    // entry leaves the map untouched and is described in `error`.
    bool apply_overrides(const std::map<std::string, std::string>& overrides, std::string& error);

    const std::map<int, ControlCommand>& bindings() const { return bindings_; }

private:
    std::map<int, ControlCommand> bindings_;
};

std::string describe_key(int key);

// "Press space to start camera, q to quit" for the current bindings; empty
// when nothing toggles the camera.
std::string start_hint(const KeyMap& keys);

}
