#pragma once

#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/vocab/span/prelude.h"

namespace vtmux {
constexpr auto status_bar_height = 1_u32;

/// @brief What the status bar shows for one session.
struct StatusBarEntry {
    di::StringView name;
    bool running { false };
};

// Render the status bar line: one tab per session, the active one in brackets
// and stopped ones marked with `*`, followed by the key binding help. The
// result is truncated to width columns.
auto status_bar_text(di::Span<StatusBarEntry const> entries, usize active_index, u32 width) -> di::String;
}
