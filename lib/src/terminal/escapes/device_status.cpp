#include "vtmux/terminal/escapes/device_status.h"

#include "di/format/prelude.h"
#include "vtmux/terminal/one_based.h"

namespace vtmux::terminal {
auto parse_device_status_request(CSI const& csi) -> di::Optional<DeviceStatusRequest> {
    if (!csi.intermediate.empty() || csi.terminator != 'n') {
        return {};
    }
    if (csi.params.size() != 1) {
        return {};
    }

    switch (csi.params.get(0)) {
        case 5:
            return DeviceStatusRequest::OperatingStatus;
        case 6:
            return DeviceStatusRequest::CursorPosition;
        default:
            return {};
    }
}

auto OperatingStatusReport::from_csi(CSI const& csi) -> di::Optional<OperatingStatusReport> {
    if (!csi.intermediate.empty() || csi.terminator != 'n') {
        return {};
    }
    if (csi.params.size() != 1) {
        return {};
    }

    auto val = csi.params.get(0);
    if (val != 0 && val != 3) {
        return {};
    }

    return OperatingStatusReport { .malfunction = val == 3 };
}

auto OperatingStatusReport::serialize() const -> di::String {
    return *di::present("\033[{}n"_sv, malfunction ? 3 : 0);
}

auto CursorPositionReport::from_csi(CSI const& csi) -> di::Optional<CursorPositionReport> {
    if (!csi.intermediate.empty() || csi.terminator != 'R') {
        return {};
    }
    if (csi.params.size() != 2) {
        return {};
    }

    auto row = csi.params.get(0);
    auto col = csi.params.get(1);
    if (row == 0 || col == 0) {
        return {};
    }

    return CursorPositionReport { OneBased::from_param(row).to_zero_based(),
                                  OneBased::from_param(col).to_zero_based() };
}

auto CursorPositionReport::serialize() const -> di::String {
    // Screen coordinates are far below the u32 limit, so saturate rather than fail.
    auto row_1 = OneBased::from_zero_based(row).value_or(OneBased::from_param(row));
    auto col_1 = OneBased::from_zero_based(col).value_or(OneBased::from_param(col));
    return *di::present("\033[{};{}R"_sv, row_1.value(), col_1.value());
}
}
