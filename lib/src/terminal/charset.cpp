#include "vtmux/terminal/charset.h"

#include "di/vocab/array/to_array.h"

namespace vtmux::terminal {
// Indexed from 0x5F ('_') through 0x7E ('~').
constexpr auto dec_special_graphics = di::to_array<c32>({
    U' ',      U'◆', U'▒', U'␉', U'␌', U'␍', U'␊', U'°',
    U'±', U'␤', U'␋', U'┘', U'┐', U'┌', U'└', U'┼',
    U'⎺', U'⎻', U'─', U'⎼', U'⎽', U'├', U'┤', U'┴',
    U'┬', U'│', U'≤', U'≥', U'π', U'≠', U'£', U'·',
});

auto translate_dec_line_drawing(c32 code_point) -> c32 {
    if (code_point < U'_' || code_point > U'~') {
        return code_point;
    }
    return dec_special_graphics[code_point - U'_'];
}
}
