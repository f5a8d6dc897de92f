#include "vtmux/terminal/row.h"

namespace vtmux::terminal {
auto Row::text() const -> di::String {
    auto result = di::String {};
    for (auto const& cell : cells) {
        if (!cell.is_spacer) {
            result.push_back(cell.code_point);
        }
    }
    return result;
}
}
