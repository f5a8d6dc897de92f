#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "vtmux/terminal/cell.h"

namespace vtmux::terminal {
/// @brief Represents a row of terminal cells
///
/// Every row of a screen holds exactly as many cells as the screen is wide.
struct Row {
    di::Vector<Cell> cells;

    // The row's characters, with spacer cells skipped.
    auto text() const -> di::String;

    auto operator==(Row const&) const -> bool = default;
};
}
