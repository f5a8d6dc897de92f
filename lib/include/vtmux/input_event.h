#pragma once

#include "di/vocab/variant/prelude.h"
#include "vtmux/focus_event.h"
#include "vtmux/key_event.h"
#include "vtmux/mouse_event.h"
#include "vtmux/paste_event.h"
#include "vtmux/terminal/escapes/size_report.h"

namespace vtmux {
/// @brief The outer terminal was resized. Encoded as CSI 8 ; rows ; cols t.
using ResizeEvent = terminal::TextAreaSizeReport;

/// @brief A decoded event read from the real terminal.
using InputEvent = di::Variant<KeyEvent, MouseEvent, ResizeEvent, FocusEvent, PasteEvent>;
}
