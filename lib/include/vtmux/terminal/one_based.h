#pragma once

#include "di/math/numeric_limits.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/optional/prelude.h"

namespace vtmux::terminal {
/// @brief A 1-based protocol coordinate
///
/// Escape sequences encode rows and columns starting at 1, while the screen
/// indexes them from 0. Conversions between the two only happen through this
/// type, which can never hold zero.
class OneBased {
public:
    // A parameter of 0 or an omitted parameter means 1.
    constexpr static auto from_param(u32 value) -> OneBased { return OneBased(value == 0 ? 1 : value); }

    // Fails only for the largest u32, which has no 1-based counterpart.
    constexpr static auto from_zero_based(u32 value) -> di::Optional<OneBased> {
        if (value == di::NumericLimits<u32>::max) {
            return {};
        }
        return OneBased(value + 1);
    }

    constexpr auto value() const -> u32 { return m_value; }
    constexpr auto to_zero_based() const -> u32 { return m_value - 1; }

    auto operator==(OneBased const&) const -> bool = default;
    auto operator<=>(OneBased const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OneBased>) {
        return di::make_fields<"OneBased">(di::field<"value", &OneBased::m_value>);
    }

private:
    constexpr explicit OneBased(u32 value) : m_value(value) {}

    u32 m_value { 1 };
};
}
