#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace vtmux::terminal {
/// @brief The character set designated into G0
///
/// Selected with ESC ( B (ASCII) and ESC ( 0 (DEC special graphics).
enum class Charset {
    Ascii,
    DecLineDrawing,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Charset>) {
    using enum Charset;
    return di::make_enumerators<"Charset">(di::enumerator<"Ascii", Ascii>,
                                           di::enumerator<"DecLineDrawing", DecLineDrawing>);
}

// DEC Special Graphics - https://vt100.net/docs/vt220-rm/table2-4.html
auto translate_dec_line_drawing(c32 code_point) -> c32;
}
