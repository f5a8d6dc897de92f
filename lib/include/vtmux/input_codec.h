#pragma once

#include "di/container/string/string.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "vtmux/input_event.h"

namespace vtmux {
/// @brief A decoded input event, and the number of bytes it was decoded from.
struct ParsedInputEvent {
    InputEvent event;
    usize consumed { 0 };
};

/// @brief Decode the first input event at the front of bytes
///
/// Returns none when bytes is empty, or when it starts with a sequence which
/// is incomplete but could still become valid once more bytes arrive. A lone
/// ESC is ambiguous: when more_data_likely is set it is treated as the start
/// of a sequence, otherwise it is decoded as the Escape key.
///
/// Input which is not a recognized sequence decodes as a single key, so the
/// caller always makes progress once the bytes are complete.
auto parse_input_event(di::Span<byte const> bytes, bool more_data_likely) -> di::Optional<ParsedInputEvent>;

/// @brief Encode an event as a terminal would send it
///
/// Keys which a terminal sends as raw bytes (text, Tab, Enter, Backspace and
/// Escape) have no escape sequence, so none is returned for them. Everything
/// which is encoded decodes back to an equal event with parse_input_event().
auto generate_input_event(InputEvent const& event) -> di::Optional<di::String>;

/// @brief Copy an input event. Paste events own their text, so events are move only.
auto clone_input_event(InputEvent const& event) -> InputEvent;
}
