#include "vtmux/key_event_io.h"

#include "di/format/prelude.h"
#include "di/vocab/array/to_array.h"
#include "vtmux/key.h"
#include "vtmux/key_event.h"
#include "vtmux/params.h"

namespace vtmux {
struct CodePointMapping {
    c32 code_point { 0 };
    Key key { Key::None };
};

// CSI 1 ; modifiers X - final byte is the key.
constexpr auto letter_key_mappings = di::to_array<CodePointMapping>({
    { 'A', Key::Up },
    { 'B', Key::Down },
    { 'C', Key::Right },
    { 'D', Key::Left },
    { 'E', Key::KeypadBegin },
    { 'H', Key::Home },
    { 'F', Key::End },
    { 'P', Key::F1 },
    { 'Q', Key::F2 },
    { 'R', Key::F3 },
    { 'S', Key::F4 },
});

// SS3 X - sent for F1-F4, for cursor keys in application cursor mode, and
// for the keypad in application keypad mode.
constexpr auto ss3_mappings = di::to_array<CodePointMapping>({
    { 'A', Key::Up },
    { 'B', Key::Down },
    { 'C', Key::Right },
    { 'D', Key::Left },
    { 'E', Key::KeypadBegin },
    { 'H', Key::Home },
    { 'F', Key::End },
    { 'P', Key::F1 },
    { 'Q', Key::F2 },
    { 'R', Key::F3 },
    { 'S', Key::F4 },
    { 'M', Key::KeypadEnter },
    { 'j', Key::KeypadMultiply },
    { 'k', Key::KeypadPlus },
    { 'l', Key::KeypadComma },
    { 'm', Key::KeypadMinus },
    { 'n', Key::KeypadDecimal },
    { 'o', Key::KeypadDivide },
    { 'p', Key::Keypad0 },
    { 'q', Key::Keypad1 },
    { 'r', Key::Keypad2 },
    { 's', Key::Keypad3 },
    { 't', Key::Keypad4 },
    { 'u', Key::Keypad5 },
    { 'v', Key::Keypad6 },
    { 'w', Key::Keypad7 },
    { 'x', Key::Keypad8 },
    { 'y', Key::Keypad9 },
});

// CSI number ; modifiers ~
//   The first entry for each key is the one used when serializing.
constexpr auto legacy_functional_key_mappings = di::to_array<CodePointMapping>({
    { 2, Key::Insert },  { 3, Key::Delete },    { 5, Key::PageUp }, { 6, Key::PageDown }, { 1, Key::Home },
    { 7, Key::Home },    { 4, Key::End },       { 8, Key::End },    { 11, Key::F1 },      { 12, Key::F2 },
    { 13, Key::F3 },     { 14, Key::F4 },       { 15, Key::F5 },    { 17, Key::F6 },      { 18, Key::F7 },
    { 19, Key::F8 },     { 20, Key::F9 },       { 21, Key::F10 },   { 23, Key::F11 },     { 24, Key::F12 },
});

template<usize N>
static auto lookup_key(di::Array<CodePointMapping, N> const& mappings, c32 code_point) -> di::Optional<Key> {
    for (auto const& mapping : mappings) {
        if (mapping.code_point == code_point) {
            return mapping.key;
        }
    }
    return {};
}

template<usize N>
static auto lookup_code_point(di::Array<CodePointMapping, N> const& mappings, Key key) -> di::Optional<c32> {
    for (auto const& mapping : mappings) {
        if (mapping.key == key) {
            return mapping.code_point;
        }
    }
    return {};
}

// The modifier parameter is 1 + the modifier bits.
static auto modifiers_from_param(u32 param) -> Modifiers {
    if (param <= 1) {
        return Modifiers::None;
    }
    return Modifiers(param - 1) & Modifiers::All;
}

static auto modifiers_to_param(Modifiers modifiers) -> u32 {
    return u32(modifiers & Modifiers::All) + 1;
}

auto serialize_key_event(KeyEvent const& event) -> di::Optional<di::String> {
    auto key = event.key();
    auto modifiers = event.modifiers();

    // BackTab has no parameters, so it can't carry modifiers.
    if (key == Key::BackTab) {
        if (modifiers != Modifiers::None) {
            return {};
        }
        return "\033[Z"_s;
    }

    // Unmodified F1-F4 and the keypad use SS3.
    auto is_keypad = key >= Key::Keypad0 && key <= Key::KeypadBegin;
    if (modifiers == Modifiers::None && ((key >= Key::F1 && key <= Key::F4) || is_keypad)) {
        if (auto code_point = lookup_code_point(ss3_mappings, key)) {
            return *di::present("\033O{}"_sv, code_point.value());
        }
    }

    // SS3 has no modifier slot. KeypadBegin falls through to its CSI 1;mE form below.
    if (is_keypad && key != Key::KeypadBegin) {
        return {};
    }

    if (auto code_point = lookup_code_point(letter_key_mappings, key)) {
        if (modifiers == Modifiers::None) {
            return *di::present("\033[{}"_sv, code_point.value());
        }
        return *di::present("\033[1;{}{}"_sv, modifiers_to_param(modifiers), code_point.value());
    }

    if (auto number = lookup_code_point(legacy_functional_key_mappings, key)) {
        if (modifiers == Modifiers::None) {
            return *di::present("\033[{}~"_sv, u32(number.value()));
        }
        return *di::present("\033[{};{}~"_sv, u32(number.value()), modifiers_to_param(modifiers));
    }

    return {};
}

auto serialize_legacy_key_event(KeyEvent const& event) -> di::Optional<di::String> {
    if (auto result = serialize_key_event(event)) {
        return result;
    }

    // Applications receive keypad keys and BackTab without their modifiers.
    auto key = event.key();
    if ((key >= Key::Keypad0 && key <= Key::KeypadBegin) || key == Key::BackTab) {
        return serialize_key_event(KeyEvent::key_down(key));
    }

    auto modifiers = event.modifiers();
    auto result = di::String {};
    if (!!(modifiers & Modifiers::Alt)) {
        result.push_back(U'\033');
    }

    switch (event.key()) {
        case Key::Tab:
            result.push_back(U'\t');
            return result;
        case Key::Enter:
            result.push_back(U'\r');
            return result;
        case Key::Escape:
            result.push_back(U'\033');
            return result;
        case Key::Backspace:
            result.push_back(U'\x7f');
            return result;
        case Key::Character:
            break;
        default:
            return {};
    }

    auto code_point = event.code_point();
    if (!!(modifiers & Modifiers::Control)) {
        // Control maps letters and @[\]^_ onto C0, and space onto NUL.
        if (code_point == U' ' || code_point == U'@') {
            code_point = 0;
        } else if (code_point >= U'a' && code_point <= U'z') {
            code_point = code_point - U'a' + 1;
        } else if (code_point >= U'A' && code_point <= U'_') {
            code_point = code_point - U'A' + 1;
        } else if (code_point == U'?') {
            code_point = 0x7f;
        }
    }
    result.push_back(code_point);
    return result;
}

auto key_event_from_csi(CSI const& csi) -> di::Optional<KeyEvent> {
    if (!csi.intermediate.empty()) {
        return {};
    }

    if (csi.terminator == 'Z' && csi.params.empty()) {
        return KeyEvent::key_down(Key::BackTab);
    }

    if (csi.terminator == '~') {
        if (csi.params.empty() || csi.params.size() > 2) {
            return {};
        }
        auto key = lookup_key(legacy_functional_key_mappings, csi.params.get(0));
        if (!key) {
            return {};
        }
        return KeyEvent::key_down(key.value(), modifiers_from_param(csi.params.get(1, 1)));
    }

    auto key = lookup_key(letter_key_mappings, csi.terminator);
    if (!key) {
        return {};
    }
    if (csi.params.size() > 2 || (!csi.params.empty() && csi.params.get(0, 1) != 1)) {
        return {};
    }
    return KeyEvent::key_down(key.value(), modifiers_from_param(csi.params.get(1, 1)));
}

auto key_event_from_ss3(c32 code_point) -> di::Optional<KeyEvent> {
    return lookup_key(ss3_mappings, code_point).transform([](Key key) {
        return KeyEvent::key_down(key);
    });
}

auto key_event_from_legacy_code_point(c32 code_point, Modifiers modifiers) -> KeyEvent {
    switch (code_point) {
        case 0x00:
            return KeyEvent::character(U' ', modifiers | Modifiers::Control);
        case '\t':
            return KeyEvent::key_down(Key::Tab, modifiers);
        case '\n':
        case '\r':
            return KeyEvent::key_down(Key::Enter, modifiers);
        case 0x1b:
            return KeyEvent::key_down(Key::Escape, modifiers);
        case 0x7f:
            return KeyEvent::key_down(Key::Backspace, modifiers);
        default:
            break;
    }

    if (code_point >= 0x01 && code_point <= 0x1a) {
        return KeyEvent::character(code_point - 1 + U'a', modifiers | Modifiers::Control);
    }
    if (code_point >= 0x1c && code_point <= 0x1f) {
        return KeyEvent::character(code_point - 0x1c + U'\\', modifiers | Modifiers::Control);
    }
    return KeyEvent::character(code_point, modifiers);
}
}
