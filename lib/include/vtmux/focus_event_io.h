#pragma once

#include "di/container/string/string.h"
#include "di/vocab/optional/prelude.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/focus_event.h"

// Focus event reference: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h3-FocusIn_FocusOut
namespace vtmux {
auto serialize_focus_event(FocusEvent const& focus_event) -> di::String;
auto focus_event_from_csi(CSI const& csi) -> di::Optional<FocusEvent>;
}
