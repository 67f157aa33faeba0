#include "input/key_map.hpp"

namespace asciicam {

KeyMap KeyMap::defaults() {
    KeyMap map;
    map.bind(' ', ControlCommand::ToggleCamera);
    map.bind('c', ControlCommand::ToggleColor);
    map.bind('s', ControlCommand::NextCharacterSet);
    map.bind('a', ControlCommand::PreviousCharacterSet);
    map.bind('+', ControlCommand::IncreaseScale);
    map.bind('=', ControlCommand::IncreaseScale);
    map.bind('-', ControlCommand::DecreaseScale);
    map.bind('f', ControlCommand::ForceStopCamera);
    map.bind('r', ControlCommand::ResetCamera);
    map.bind('q', ControlCommand::Quit);
    map.bind(kKeyEscape, ControlCommand::Quit);
    return map;
}

std::optional<ControlCommand> KeyMap::lookup(int key) const {
    auto it = bindings_.find(key);
    if (it == bindings_.end()) return std::nullopt;
    return it->second;
}

void KeyMap::bind(int key, ControlCommand cmd) {
    bindings_[key] = cmd;
}

void KeyMap::unbind(ControlCommand cmd) {
    for (auto it = bindings_.begin(); it != bindings_.end();) {
        if (it->second == cmd) {
            it = bindings_.erase(it);
        } else {
            ++it;
        }
    }
}

bool KeyMap::apply_overrides(const std::map<std::string, std::string>& overrides, std::string& error) {
    KeyMap updated = *this;
    for (const auto& [name, key] : overrides) {
        auto cmd = parse_command_name(name);
        if (!cmd) {
            error = "unknown command '" + name + "' in [keys]";
            return false;
        }
        if (key.size() != 1) {
            error = "key for '" + name + "' must be a single character";
            return false;
        }
        updated.unbind(*cmd);
        updated.bind(static_cast<unsigned char>(key[0]), *cmd);
    }
    *this = updated;
    return true;
}

std::string describe_key(int key) {
    if (key == ' ') return "space";
    if (key == kKeyEscape) return "esc";
    if (key > 32 && key < 127) return std::string(1, static_cast<char>(key));
    return "key " + std::to_string(key);
}

namespace {

// First key bound to `cmd`, preferring printable keys over Esc.
std::optional<int> key_for(const KeyMap& keys, ControlCommand cmd) {
    std::optional<int> found;
    for (const auto& [key, bound] : keys.bindings()) {
        if (bound != cmd) continue;
        if (key != kKeyEscape) return key;
        found = key;
    }
    return found;
}

}

std::string start_hint(const KeyMap& keys) {
    const auto toggle = key_for(keys, ControlCommand::ToggleCamera);
    if (!toggle) return {};
    std::string hint = "Press " + describe_key(*toggle) + " to start camera";
    if (const auto quit = key_for(keys, ControlCommand::Quit)) {
        hint += ", " + describe_key(*quit) + " to quit";
    }
    return hint;
}

}
