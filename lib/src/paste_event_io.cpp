#include "vtmux/paste_event_io.h"

#include "di/format/prelude.h"

namespace vtmux {
auto serialize_paste_event(PasteEvent const& event) -> di::String {
    return *di::present("{}{}{}"_sv, bracketed_paste_begin, event.text(), bracketed_paste_end);
}

auto is_bracketed_paste_begin(CSI const& csi) -> bool {
    return csi.intermediate.empty() && csi.terminator == U'~' && csi.params.size() == 1 && csi.params.get(0) == 200;
}
}
