#pragma once

#include "di/reflect/prelude.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/size.h"

namespace vtmux::terminal {
/// @brief Text area size report
///
/// This is the reply to CSI 18 t, as specified
/// [here](https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h4-Functions-using-CSI-_-ordered-by-the-final-character-lparen-s-rparen:CSI-Ps;Ps;Ps-t.1EB0).
/// The same encoding (CSI 8 ; rows ; cols t) is used on the input side to
/// notify the multiplexer of a resize of the outer terminal.
struct TextAreaSizeReport {
    u32 cols { 0 };
    u32 rows { 0 };

    static auto from_csi(CSI const& csi) -> di::Optional<TextAreaSizeReport>;
    auto serialize() const -> di::String;

    auto size() const -> Size { return { rows, cols }; }

    auto operator==(TextAreaSizeReport const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TextAreaSizeReport>) {
        return di::make_fields<"TextAreaSizeReport">(di::field<"cols", &TextAreaSizeReport::cols>,
                                                     di::field<"rows", &TextAreaSizeReport::rows>);
    }
};
}
