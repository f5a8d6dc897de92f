#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "vtmux/graphics_rendition.h"

namespace vtmux::terminal {
/// @brief Represents a on-screen terminal cell
///
/// A wide character is stored in the cell where it starts, and the column to
/// its right holds a spacer cell which carries no text of its own.
struct Cell {
    c32 code_point { U' ' };                 ///< Displayed character (space when blank)
    GraphicsRendition graphics_rendition {}; ///< Style the character was written with
    bool is_spacer { false };                ///< Continuation column of a wide character

    auto is_blank() const -> bool { return code_point == U' ' && !is_spacer && graphics_rendition.is_default(); }

    auto operator==(Cell const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Cell>) {
        return di::make_fields<"Cell">(di::field<"code_point", &Cell::code_point>,
                                       di::field<"graphics_rendition", &Cell::graphics_rendition>,
                                       di::field<"is_spacer", &Cell::is_spacer>);
    }
};
}
