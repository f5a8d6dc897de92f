#include "vtmux/renderer.h"

#include "di/io/vector_writer.h"
#include "di/io/writer_print.h"
#include "dius/print.h"
#include "vtmux/graphics_rendition.h"
#include "vtmux/params.h"
#include "vtmux/status_bar.h"

namespace vtmux {
auto Renderer::setup() -> di::Result<> {
    m_cleanup = {};

    auto buffer = di::VectorWriter<> {};

    // Setup - alternate screen buffer.
    di::writer_print<di::String::Encoding>(buffer, "\033[?1049h"_sv);
    m_cleanup.push_back("\033[?1049l\033[?25h"_s);

    // Setup - disable autowrap.
    di::writer_print<di::String::Encoding>(buffer, "\033[?7l"_sv);
    m_cleanup.push_back("\033[?7h"_s);

    // Setup - capture all mouse events and use SGR mouse reporting.
    di::writer_print<di::String::Encoding>(buffer, "\033[?1003h\033[?1006h"_sv);
    m_cleanup.push_back("\033[?1006l\033[?1003l"_s);

    // Setup - enable focus events.
    di::writer_print<di::String::Encoding>(buffer, "\033[?1004h"_sv);
    m_cleanup.push_back("\033[?1004l"_s);

    // Setup - bracketed paste.
    di::writer_print<di::String::Encoding>(buffer, "\033[?2004h"_sv);
    m_cleanup.push_back("\033[?2004l"_s);

    invalidate();

    auto text = di::move(buffer).vector();
    return m_output.write_exactly(di::as_bytes(text.span()));
}

auto Renderer::cleanup() -> di::Result<> {
    auto buffer = di::VectorWriter<> {};
    while (!m_cleanup.empty()) {
        auto string = *m_cleanup.pop_back();
        di::writer_print<di::String::Encoding>(buffer, "{}"_sv, string);
    }

    auto text = di::move(buffer).vector();
    return m_output.write_exactly(di::as_bytes(text.span()));
}

void Renderer::render_active_session(SessionMultiplexer const& multiplexer) {
    auto const& screen = multiplexer.active_session().screen();
    if (m_painted_session != multiplexer.active_index() || m_painted_rows.size() != screen.max_height() ||
        (!m_painted_rows.empty() && m_painted_rows[0].cells.size() != screen.max_width())) {
        m_painted_session = multiplexer.active_index();
        m_painted_rows.clear();
        m_painted_rows.resize(screen.max_height());
    }

    auto buffer = di::VectorWriter<> {};

    // Start sequence: begin synchronized updates and hide the cursor.
    di::writer_print<di::String::Encoding>(buffer, "\033[?2026h\033[?25l"_sv);
    if (di::exchange(m_clear_pending, false)) {
        di::writer_print<di::String::Encoding>(buffer, "\033[m\033[H\033[2J"_sv);
    }

    for (auto row_index = 0_u32; row_index < screen.max_height(); row_index++) {
        auto const& row = screen.row(row_index);
        if (m_painted_rows[row_index].cells == row.cells) {
            continue;
        }

        di::writer_print<di::String::Encoding>(buffer, "\033[{};1H\033[m"_sv, row_index + 1);
        auto current = GraphicsRendition {};
        for (auto const& cell : row.cells) {
            if (cell.is_spacer) {
                continue;
            }
            if (cell.graphics_rendition != current) {
                current = cell.graphics_rendition;
                di::writer_print<di::String::Encoding>(buffer, "\033[{}m"_sv, current.as_csi_params().to_string());
            }
            di::writer_print<di::String::Encoding>(buffer, "{}"_sv, cell.code_point);
        }
        m_painted_rows[row_index].cells = row.cells.clone();
    }

    // End sequence: restore the application's cursor.
    auto cursor = screen.cursor();
    di::writer_print<di::String::Encoding>(buffer, "\033[m\033[{};{}H"_sv, cursor.row + 1, cursor.col + 1);
    if (!screen.cursor_hidden()) {
        di::writer_print<di::String::Encoding>(buffer, "\033[?25h"_sv);
    }
    di::writer_print<di::String::Encoding>(buffer, "\033[?2026l"_sv);

    auto text = di::move(buffer).vector();
    if (auto result = m_output.write_exactly(di::as_bytes(text.span())); !result) {
        dius::eprintln("Failed to render: {}"_sv, result.error().message());
    }
}

void Renderer::render_status_bar(SessionMultiplexer const& multiplexer) {
    auto status = multiplexer.status_line();
    auto const& terminal_size = multiplexer.terminal_size();
    if (terminal_size.rows < status_bar_height) {
        return;
    }

    auto buffer = di::VectorWriter<> {};
    auto cursor = multiplexer.active_session().screen().cursor();

    // Reverse video across the whole bottom row, then put the cursor back.
    di::writer_print<di::String::Encoding>(buffer, "\033[?2026h\0337\033[{};1H\033[7m\033[2K{}\033[m\0338"_sv,
                                           terminal_size.rows, status);
    di::writer_print<di::String::Encoding>(buffer, "\033[{};{}H\033[?2026l"_sv, cursor.row + 1, cursor.col + 1);

    auto text = di::move(buffer).vector();
    if (auto result = m_output.write_exactly(di::as_bytes(text.span())); !result) {
        dius::eprintln("Failed to render status bar: {}"_sv, result.error().message());
    }
}
}
