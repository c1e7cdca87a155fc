// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file keyboard_shortcuts.h
 * @brief Keyboard shortcut registration and processing
 *
 * Provides a declarative API for keyboard shortcuts.
 * Decouples shortcut logic from the host UI toolkit for testability: the
 * host translates its own key events to Key values and forwards each press
 * to dispatch().
 */

#pragma once

#include <functional>
#include <vector>

namespace vnav::input {

/**
 * @brief Keys the navigation dialog reacts to
 */
enum class Key { Up, Down, Left, Right, Enter, Return, Escape, O };

/**
 * @brief Modifier mask bits
 */
enum Modifier : int {
    MOD_NONE = 0,
    MOD_CTRL = 1 << 0,
    MOD_SHIFT = 1 << 1,
    MOD_ALT = 1 << 2,
};

const char* key_name(Key key);

/**
 * @brief Keyboard shortcut registry
 *
 * Plain bindings only fire while Ctrl is up, so Up and Ctrl+Up can be bound
 * to different actions.
 *
 * Usage:
 * 1. Register shortcuts when the dialog opens
 * 2. Forward key presses to dispatch()
 */
class KeyboardShortcuts {
  public:
    using Action = std::function<void()>;

    /**
     * @brief Register a simple key binding
     *
     * @param key Key (e.g., Key::Up)
     * @param action Function to call on key press
     */
    void register_key(Key key, Action action);

    /**
     * @brief Register a modifier+key combo
     *
     * @param modifiers Required modifier mask (e.g., MOD_CTRL)
     * @param key Key
     * @param action Function to call on combo press
     */
    void register_combo(int modifiers, Key key, Action action);

    /**
     * @brief Handle one key press event
     *
     * @param key Pressed key
     * @param current_modifiers Modifier mask at press time
     * @return true if at least one action fired
     */
    bool dispatch(Key key, int current_modifiers);

    size_t size() const {
        return m_bindings.size();
    }

  private:
    struct Binding {
        Key key;
        int modifiers; // 0 for a plain key
        Action action;
    };

    static bool modifiers_match(const Binding& binding, int current_modifiers);

    std::vector<Binding> m_bindings;
};

} // namespace vnav::input
