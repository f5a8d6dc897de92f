#include "vtmux/terminal/escapes/size_report.h"

#include "di/format/prelude.h"

namespace vtmux::terminal {
auto TextAreaSizeReport::from_csi(CSI const& csi) -> di::Optional<TextAreaSizeReport> {
    if (!csi.intermediate.empty() || csi.terminator != 't' || csi.params.size() != 3 || csi.params.get(0) != 8) {
        return {};
    }

    // Omitted or zero dimensions can't size a screen.
    auto rows = csi.params.get(1);
    auto cols = csi.params.get(2);
    if (rows == 0 || cols == 0) {
        return {};
    }
    return TextAreaSizeReport { .cols = cols, .rows = rows };
}

auto TextAreaSizeReport::serialize() const -> di::String {
    return *di::present("\033[8;{};{}t"_sv, rows, cols);
}
}
