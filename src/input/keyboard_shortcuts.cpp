// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_shortcuts.h"

#include <spdlog/spdlog.h>

namespace vnav::input {

const char* key_name(Key key) {
    switch (key) {
    case Key::Up:
        return "Up";
    case Key::Down:
        return "Down";
    case Key::Left:
        return "Left";
    case Key::Right:
        return "Right";
    case Key::Enter:
        return "Enter";
    case Key::Return:
        return "Return";
    case Key::Escape:
        return "Escape";
    case Key::O:
        return "O";
    }
    return "?";
}

void KeyboardShortcuts::register_key(Key key, Action action) {
    m_bindings.push_back({key, 0, std::move(action)});
}

void KeyboardShortcuts::register_combo(int modifiers, Key key, Action action) {
    m_bindings.push_back({key, modifiers, std::move(action)});
}

bool KeyboardShortcuts::modifiers_match(const Binding& binding, int current_modifiers) {
    if (binding.modifiers != 0) {
        // Any matching modifier bit must be set
        return (current_modifiers & binding.modifiers) != 0;
    }
    // Plain keys yield to Ctrl combos on the same key
    return (current_modifiers & MOD_CTRL) == 0;
}

bool KeyboardShortcuts::dispatch(Key key, int current_modifiers) {
    bool fired = false;
    for (auto& binding : m_bindings) {
        if (binding.key != key || !modifiers_match(binding, current_modifiers)) {
            continue;
        }
        binding.action();
        fired = true;
    }
    if (!fired) {
        spdlog::trace("[KeyboardShortcuts] Unbound key {} (mods={:#x})", key_name(key),
                      current_modifiers);
    }
    return fired;
}

} // namespace vnav::input
