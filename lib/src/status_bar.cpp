#include "vtmux/status_bar.h"

#include "di/format/prelude.h"
#include "dius/unicode/width.h"

namespace vtmux {
auto status_bar_text(di::Span<StatusBarEntry const> entries, usize active_index, u32 width) -> di::String {
    auto text = di::String {};
    for (auto i = 0_usize; i < entries.size(); i++) {
        auto const& entry = entries[i];
        auto marker = entry.running ? ""_sv : "*"_sv;
        auto tab = i == active_index ? *di::present(" [{}:{}{}] "_sv, i + 1, entry.name, marker)
                                     : *di::present(" {}:{}{} "_sv, i + 1, entry.name, marker);
        for (auto code_point : tab) {
            text.push_back(code_point);
        }
    }
    for (auto code_point : *di::present("  F1-F{}: Switch | Ctrl+Q: Quit"_sv, entries.size())) {
        text.push_back(code_point);
    }

    // Truncate by display width.
    auto result = di::String {};
    auto used = 0_u32;
    for (auto code_point : text) {
        auto code_point_width = u32(dius::unicode::code_point_width(code_point).value_or(0));
        if (used + code_point_width > width) {
            break;
        }
        used += code_point_width;
        result.push_back(code_point);
    }
    return result;
}
}
