#include "vtmux/focus_event_io.h"

namespace vtmux {
auto serialize_focus_event(FocusEvent const& focus_event) -> di::String {
    if (focus_event.is_focus_in()) {
        return "\033[I"_s;
    }
    return "\033[O"_s;
}

auto focus_event_from_csi(CSI const& csi) -> di::Optional<FocusEvent> {
    if (!csi.intermediate.empty() || !csi.params.empty()) {
        return {};
    }
    if (csi.terminator == U'I') {
        return FocusEvent::focus_in();
    }
    if (csi.terminator == U'O') {
        return FocusEvent::focus_out();
    }
    return {};
}
}
