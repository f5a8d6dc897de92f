#pragma once

#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/paste_event.h"

// Bracketed paste reference: https://invisible-island.net/xterm/xterm-paste64.html
namespace vtmux {
constexpr auto bracketed_paste_begin = "\033[200~"_sv;
constexpr auto bracketed_paste_end = "\033[201~"_sv;

auto serialize_paste_event(PasteEvent const& event) -> di::String;

auto is_bracketed_paste_begin(CSI const& csi) -> bool;
}
