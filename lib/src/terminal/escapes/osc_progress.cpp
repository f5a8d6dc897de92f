#include "vtmux/terminal/escapes/osc_progress.h"

#include "di/container/algorithm/prelude.h"
#include "di/format/prelude.h"
#include "di/parser/prelude.h"

namespace vtmux::terminal {
// Parse a decimal number like "42", "-5" or "42.5". The fraction is truncated
// and the result is clamped to [0, 100].
static auto parse_percentage(di::StringView text) -> di::Optional<u8> {
    auto negative = false;
    auto in_fraction = false;
    auto whole = 0_u32;
    auto digits = 0_usize;
    auto index = 0_usize;
    for (auto code_point : text) {
        if (index++ == 0 && (code_point == U'-' || code_point == U'+')) {
            negative = code_point == U'-';
            continue;
        }
        if (code_point == U'.' && !in_fraction) {
            in_fraction = true;
            continue;
        }
        if (code_point < U'0' || code_point > U'9') {
            return {};
        }
        digits++;
        if (!in_fraction) {
            // Saturate well above the maximum so long inputs can't overflow.
            whole = di::min(whole * 10 + u32(code_point - U'0'), 1000_u32);
        }
    }
    if (digits == 0) {
        return {};
    }
    if (negative) {
        return 0;
    }
    return u8(di::min(whole, u32(OSCProgress::max_progress)));
}

auto OSCProgress::parse(di::StringView data) -> di::Optional<OSCProgress> {
    auto parts = data | di::split(U';') | di::to<di::Vector>();
    if (parts.size() != 3 || parts[0] != "4"_sv) {
        return {};
    }

    auto state = di::parse<u8>(parts[1]);
    auto progress = parse_percentage(parts[2]);
    if (!state || !progress) {
        return {};
    }

    auto result = OSCProgress {};
    switch (state.value()) {
        case 0:
            result.state = ProgressState::Cleared;
            break;
        case 1:
            result.state = ProgressState::Update;
            result.progress = progress.value();
            break;
        case 2:
            result.state = ProgressState::Error;
            break;
        case 3:
            result.state = ProgressState::Indeterminate;
            break;
        default:
            return {};
    }
    return result;
}

auto OSCProgress::serialize() const -> di::String {
    return *di::present("\033]9;4;{};{}\033\\"_sv, u32(state), u32(progress));
}
}
