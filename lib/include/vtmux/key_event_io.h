#pragma once

#include "di/container/string/string.h"
#include "di/vocab/optional/prelude.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/key_event.h"

// Key reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h2-PC-Style-Function-Keys
namespace vtmux {
// Serialize keys which have an escape sequence encoding: cursor, navigation,
// function and keypad keys. Keys which are sent as plain bytes (text, Tab,
// Enter, Backspace, Escape) have no escape sequence and produce none.
auto serialize_key_event(KeyEvent const& event) -> di::Optional<di::String>;

// Serialize any key the way a legacy terminal sends it to an application.
// Keys with an escape sequence use it, while everything else becomes the raw
// control byte or text, prefixed with ESC when Alt is held.
auto serialize_legacy_key_event(KeyEvent const& event) -> di::Optional<di::String>;

auto key_event_from_csi(CSI const& csi) -> di::Optional<KeyEvent>;
auto key_event_from_ss3(c32 code_point) -> di::Optional<KeyEvent>;
auto key_event_from_legacy_code_point(c32 code_point, Modifiers modifiers = Modifiers::None) -> KeyEvent;
}
