#pragma once

#include "di/reflect/enumerator.h"
#include "di/reflect/reflect.h"
#include "di/util/bitwise_enum.h"

namespace vtmux {
/// @brief Keyboard modifiers
///
/// The bit values match the xterm encoding, where the transmitted parameter
/// is 1 + the bitwise or of the active modifiers.
enum class Modifiers {
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Control = 1 << 2,
    All = Shift | Alt | Control,
};

DI_DEFINE_ENUM_BITWISE_OPERATIONS(Modifiers)

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Modifiers>) {
    using enum Modifiers;
    return di::make_enumerators<"Modifiers">(di::enumerator<"None", None>, di::enumerator<"Shift", Shift>,
                                             di::enumerator<"Alt", Alt>, di::enumerator<"Control", Control>);
}
}
