#pragma once

#include "di/reflect/field.h"
#include "di/reflect/prelude.h"
#include "vtmux/key.h"
#include "vtmux/modifiers.h"

namespace vtmux {
class KeyEvent {
public:
    constexpr static auto key_down(Key key, Modifiers modifiers = Modifiers::None) -> KeyEvent {
        return { key, 0, modifiers };
    }

    constexpr static auto character(c32 code_point, Modifiers modifiers = Modifiers::None) -> KeyEvent {
        return { Key::Character, code_point, modifiers };
    }

    constexpr KeyEvent(Key key, c32 code_point = 0, Modifiers modifiers = Modifiers::None)
        : m_modifiers(modifiers), m_key(key), m_code_point(code_point) {}

    constexpr auto modifiers() const -> Modifiers { return m_modifiers; }
    constexpr auto key() const -> Key { return m_key; }

    /// The typed character, which is only meaningful for Key::Character.
    constexpr auto code_point() const -> c32 { return m_code_point; }

    auto operator==(KeyEvent const&) const -> bool = default;

private:
    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<KeyEvent>) {
        return di::make_fields<"KeyEvent">(di::field<"modifiers", &KeyEvent::m_modifiers>,
                                           di::field<"key", &KeyEvent::m_key>,
                                           di::field<"code_point", &KeyEvent::m_code_point>);
    }

    Modifiers m_modifiers { Modifiers::None };
    Key m_key { Key::None };
    c32 m_code_point { 0 };
};
}
