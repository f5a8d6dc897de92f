#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace vtmux::terminal {
/// @brief Represents the scrolling region for a terminal.
///
/// The scroll region is set via DECSTBM, and by default it is the entire
/// screen. Scrolling induced by auto-wrapping, line feed and reverse index
/// only moves rows inside the region, and relative cursor motion which starts
/// inside the region stays inside it.
struct ScrollRegion {
    u32 start_row { 0 }; ///< Represents the first row in the scroll region.
    u32 end_row { 0 };   ///< Represents the last row in the scroll region (exclusive!).

    // Delete the default constructor because the default scroll region depends on the
    // terminal size.
    ScrollRegion() = delete;

    constexpr ScrollRegion(u32 start_row, u32 end_row) : start_row(start_row), end_row(end_row) {}

    constexpr auto top() const -> u32 { return start_row; }
    constexpr auto bottom() const -> u32 { return end_row - 1; }
    constexpr auto contains(u32 row) const -> bool { return row >= start_row && row < end_row; }

    auto operator==(ScrollRegion const&) const -> bool = default;
    auto operator<=>(ScrollRegion const&) const = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ScrollRegion>) {
        return di::make_fields<"ScrollRegion">(di::field<"start_row", &ScrollRegion::start_row>,
                                               di::field<"end_row", &ScrollRegion::end_row>);
    }
};
}
