#pragma once

#include "di/reflect/enumerator.h"
#include "di/reflect/reflect.h"

namespace vtmux {
enum class Key {
    None,
    Character, ///< A text key, whose code point is stored in the event

    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,

    Tab,
    BackTab,
    Enter,
    Escape,
    Backspace,

    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,

    // Keys sent in application keypad mode (SS3 sequences).
    Keypad0,
    Keypad1,
    Keypad2,
    Keypad3,
    Keypad4,
    Keypad5,
    Keypad6,
    Keypad7,
    Keypad8,
    Keypad9,
    KeypadEnter,
    KeypadPlus,
    KeypadMinus,
    KeypadMultiply,
    KeypadDivide,
    KeypadDecimal,
    KeypadComma,
    KeypadBegin,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Key>) {
    using enum Key;
    return di::make_enumerators<"Key">(
        di::enumerator<"None", None>, di::enumerator<"Character", Character>, di::enumerator<"Up", Up>,
        di::enumerator<"Down", Down>, di::enumerator<"Left", Left>, di::enumerator<"Right", Right>,
        di::enumerator<"Home", Home>, di::enumerator<"End", End>, di::enumerator<"PageUp", PageUp>,
        di::enumerator<"PageDown", PageDown>, di::enumerator<"Insert", Insert>, di::enumerator<"Delete", Delete>,
        di::enumerator<"Tab", Tab>, di::enumerator<"BackTab", BackTab>, di::enumerator<"Enter", Enter>,
        di::enumerator<"Escape", Escape>, di::enumerator<"Backspace", Backspace>, di::enumerator<"F1", F1>,
        di::enumerator<"F2", F2>, di::enumerator<"F3", F3>, di::enumerator<"F4", F4>, di::enumerator<"F5", F5>,
        di::enumerator<"F6", F6>, di::enumerator<"F7", F7>, di::enumerator<"F8", F8>, di::enumerator<"F9", F9>,
        di::enumerator<"F10", F10>, di::enumerator<"F11", F11>, di::enumerator<"F12", F12>,
        di::enumerator<"Keypad0", Keypad0>, di::enumerator<"Keypad1", Keypad1>, di::enumerator<"Keypad2", Keypad2>,
        di::enumerator<"Keypad3", Keypad3>, di::enumerator<"Keypad4", Keypad4>, di::enumerator<"Keypad5", Keypad5>,
        di::enumerator<"Keypad6", Keypad6>, di::enumerator<"Keypad7", Keypad7>, di::enumerator<"Keypad8", Keypad8>,
        di::enumerator<"Keypad9", Keypad9>, di::enumerator<"KeypadEnter", KeypadEnter>,
        di::enumerator<"KeypadPlus", KeypadPlus>, di::enumerator<"KeypadMinus", KeypadMinus>,
        di::enumerator<"KeypadMultiply", KeypadMultiply>, di::enumerator<"KeypadDivide", KeypadDivide>,
        di::enumerator<"KeypadDecimal", KeypadDecimal>, di::enumerator<"KeypadComma", KeypadComma>,
        di::enumerator<"KeypadBegin", KeypadBegin>);
}
}
