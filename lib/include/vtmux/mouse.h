#pragma once

#include "di/reflect/enumerator.h"
#include "di/reflect/field.h"
#include "di/reflect/reflect.h"
#include "di/types/prelude.h"

// Mouse reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Mouse-Tracking
namespace vtmux {
enum class MouseButton {
    None,
    Left,
    Middle,
    Right,
    ScrollUp,
    ScrollDown,
    ScrollLeft,
    ScrollRight,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MouseButton>) {
    using enum MouseButton;
    return di::make_enumerators<"MouseButton">(
        di::enumerator<"None", None>, di::enumerator<"Left", Left>, di::enumerator<"Middle", Middle>,
        di::enumerator<"Right", Right>, di::enumerator<"ScrollUp", ScrollUp>, di::enumerator<"ScrollDown", ScrollDown>,
        di::enumerator<"ScrollLeft", ScrollLeft>, di::enumerator<"ScrollRight", ScrollRight>);
}

/// @brief A 0-based cell position.
class MousePosition {
public:
    MousePosition() = default;
    constexpr MousePosition(u32 x, u32 y) : m_x(x), m_y(y) {}

    constexpr auto x() const -> u32 { return m_x; }
    constexpr auto y() const -> u32 { return m_y; }

    auto operator==(MousePosition const&) const -> bool = default;

private:
    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MousePosition>) {
        return di::make_fields<"MousePosition">(di::field<"x", &MousePosition::m_x>,
                                                di::field<"y", &MousePosition::m_y>);
    }

    u32 m_x { 0 };
    u32 m_y { 0 };
};
}
