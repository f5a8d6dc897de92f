#include "vtmux/mouse_event_io.h"

#include "di/format/prelude.h"
#include "di/vocab/array/to_array.h"
#include "vtmux/modifiers.h"
#include "vtmux/mouse.h"
#include "vtmux/mouse_event.h"

namespace vtmux {
struct ButtonMapping {
    u32 number { 0 };
    MouseButton button { MouseButton::None };
};

constexpr auto button_mappings = di::to_array<ButtonMapping>({
    { 0, MouseButton::Left },
    { 1, MouseButton::Middle },
    { 2, MouseButton::Right },
    { 3, MouseButton::None },
    { 64, MouseButton::ScrollUp },
    { 65, MouseButton::ScrollDown },
    { 66, MouseButton::ScrollLeft },
    { 67, MouseButton::ScrollRight },
});

constexpr auto shift_flag = u32(4);
constexpr auto alt_flag = u32(8);
constexpr auto control_flag = u32(16);
constexpr auto move_flag = u32(32);

static auto mouse_button_to_number(MouseButton target) -> u32 {
    for (auto [number, button] : button_mappings) {
        if (target == button) {
            return number;
        }
    }
    return 3;
}

static auto modifiers_to_number(Modifiers modifiers) -> u32 {
    auto result = 0_u32;
    if (!!(modifiers & Modifiers::Shift)) {
        result += shift_flag;
    }
    if (!!(modifiers & Modifiers::Alt)) {
        result += alt_flag;
    }
    if (!!(modifiers & Modifiers::Control)) {
        result += control_flag;
    }
    return result;
}

// Split a button code into its event type, button and modifiers. The type
// passed in is the one implied by the encoding (press or release).
static auto decode_button_code(u32 button_code, MouseEventType type, MousePosition const& position)
    -> di::Optional<MouseEvent> {
    auto modifiers = Modifiers::None;
    if (button_code & shift_flag) {
        modifiers |= Modifiers::Shift;
    }
    if (button_code & alt_flag) {
        modifiers |= Modifiers::Alt;
    }
    if (button_code & control_flag) {
        modifiers |= Modifiers::Control;
    }
    if (!!(button_code & move_flag) && type == MouseEventType::Press) {
        type = MouseEventType::Move;
    }
    button_code &= ~(shift_flag | alt_flag | control_flag | move_flag);

    for (auto const& [code, button] : button_mappings) {
        if (code == button_code) {
            return MouseEvent(type, button, position, modifiers);
        }
    }
    return {};
}

// Coordinates on the wire are 1-based. Guard against a terminal mistakenly sending 0.
static auto to_zero_based(u32 coordinate) -> u32 {
    return coordinate == 0 ? 0 : coordinate - 1;
}

auto serialize_mouse_event(MouseEvent const& event) -> di::String {
    auto number = mouse_button_to_number(event.button()) + modifiers_to_number(event.modifiers());
    if (event.type() == MouseEventType::Move) {
        number += move_flag;
    }

    // Return CSI < Cb;Cx;Cy [Mm]
    auto final_char = event.type() == MouseEventType::Release ? U'm' : U'M';
    return *di::present("\033[<{};{};{}{}"_sv, number, event.position().x() + 1, event.position().y() + 1,
                        final_char);
}

auto mouse_event_from_csi(CSI const& csi) -> di::Optional<MouseEvent> {
    auto const& params = csi.params;
    if (params.size() != 3) {
        return {};
    }

    // SGR: CSI < Pb;Px;Py [Mm]
    if (csi.intermediate == "<"_sv && (csi.terminator == U'M' || csi.terminator == U'm')) {
        auto type = csi.terminator == U'M' ? MouseEventType::Press : MouseEventType::Release;
        auto position = MousePosition(to_zero_based(params.get(1, 1)), to_zero_based(params.get(2, 1)));
        return decode_button_code(params.get(0), type, position);
    }

    // URXVT: CSI Pb;Px;Py M, where the button is offset by 32 and releases use button 3.
    if (csi.intermediate.empty() && csi.terminator == U'M') {
        auto code = params.get(0);
        if (code < 32) {
            return {};
        }
        code -= 32;
        auto position = MousePosition(to_zero_based(params.get(1, 1)), to_zero_based(params.get(2, 1)));
        auto type = (code & 3) == 3 && !(code & move_flag) ? MouseEventType::Release : MouseEventType::Press;
        return decode_button_code(code, type, position);
    }

    return {};
}

auto mouse_event_from_x10(u8 button_byte, u8 x_byte, u8 y_byte) -> di::Optional<MouseEvent> {
    if (button_byte < 32 || x_byte < 33 || y_byte < 33) {
        return {};
    }
    auto code = u32(button_byte - 32);
    auto position = MousePosition(x_byte - 33, y_byte - 33);
    auto type = (code & 3) == 3 && !(code & move_flag) ? MouseEventType::Release : MouseEventType::Press;
    return decode_button_code(code, type, position);
}
}
