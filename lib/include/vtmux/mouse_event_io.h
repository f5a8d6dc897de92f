#pragma once

#include "di/container/string/string.h"
#include "di/vocab/optional/prelude.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/mouse_event.h"

// Mouse reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-Mouse-Tracking
namespace vtmux {
// Serialize using the SGR encoding (CSI < Cb ; Cx ; Cy [Mm]).
auto serialize_mouse_event(MouseEvent const& event) -> di::String;

// Accepts the SGR encoding, and the URXVT encoding (CSI Cb ; Cx ; Cy M).
auto mouse_event_from_csi(CSI const& csi) -> di::Optional<MouseEvent>;

// Decode the X10 encoding (CSI M Cb Cx Cy), given the 3 bytes after CSI M.
auto mouse_event_from_x10(u8 button_byte, u8 x_byte, u8 y_byte) -> di::Optional<MouseEvent>;
}
