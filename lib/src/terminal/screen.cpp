#include "vtmux/terminal/screen.h"

#include "di/container/algorithm/prelude.h"
#include "di/container/algorithm/rotate.h"
#include "di/util/clamp.h"
#include "dius/unicode/width.h"
#include "vtmux/terminal/charset.h"

namespace vtmux::terminal {
namespace {
constexpr auto tab_width = 8_u32;

// A screen always has at least one cell, so the cursor is always valid.
auto normalized(Size size) -> Size {
    if (size.rows == 0) {
        size.rows = 1;
    }
    if (size.cols == 0) {
        size.cols = 1;
    }
    return size;
}

auto is_wide(Cell const& cell) -> bool {
    return !cell.is_spacer && dius::unicode::code_point_width(cell.code_point).value_or(1) == 2;
}
}

Screen::Screen(Size const& size) : m_size(normalized(size)), m_scroll_region(0, m_size.rows) {
    for (u32 i = 0; i < m_size.rows; i++) {
        m_rows.push_back(blank_row());
    }
}

void Screen::resize(Size const& size) {
    auto new_size = normalized(size);
    if (new_size.rows == m_size.rows && new_size.cols == m_size.cols) {
        m_size = new_size;
        return;
    }

    // Rows are removed from or added to the bottom.
    while (m_rows.size() > new_size.rows) {
        m_rows.pop_back();
    }
    while (m_rows.size() < new_size.rows) {
        auto row = Row {};
        row.cells.resize(m_size.cols);
        m_rows.push_back(di::move(row));
    }

    for (auto& row : m_rows) {
        // Never leave half of a wide character at the new right edge.
        if (new_size.cols < row.cells.size() && row.cells[new_size.cols].is_spacer) {
            row.cells[new_size.cols - 1] = Cell {};
        }
        row.cells.resize(new_size.cols);
    }

    m_size = new_size;
    m_scroll_region = ScrollRegion(0, m_size.rows);

    m_cursor.row = di::min(m_cursor.row, max_row_inclusive());
    m_cursor.col = di::min(m_cursor.col, max_col_inclusive());
    m_cursor.overflow_pending = false;

    if (m_saved_cursor) {
        m_saved_cursor->row = di::min(m_saved_cursor->row, max_row_inclusive());
        m_saved_cursor->col = di::min(m_saved_cursor->col, max_col_inclusive());
    }
}

// Set Top and Bottom Margins - https://vt100.net/docs/vt510-rm/DECSTBM.html
void Screen::set_scroll_region(u32 top, u32 bottom) {
    if (top >= bottom || bottom > max_row_inclusive()) {
        return;
    }
    m_scroll_region = ScrollRegion(top, bottom + 1);
    set_cursor(0, 0);
}

void Screen::reset_scroll_region() {
    m_scroll_region = ScrollRegion(0, max_height());
}

// Save Cursor - https://vt100.net/docs/vt510-rm/DECSC.html
void Screen::save_cursor() {
    m_saved_cursor = SavedCursor {
        .row = m_cursor.row,
        .col = m_cursor.col,
        .overflow_pending = m_cursor.overflow_pending,
        .graphics_rendition = m_graphics_rendition,
        .charset = m_charset,
    };
}

// Restore Cursor - https://vt100.net/docs/vt510-rm/DECRC.html
void Screen::restore_cursor() {
    if (!m_saved_cursor) {
        // Without a prior save, the cursor is homed and the attributes are reset.
        set_cursor(0, 0);
        m_graphics_rendition = {};
        m_charset = Charset::Ascii;
        return;
    }

    auto const& saved = m_saved_cursor.value();
    set_cursor(saved.row, saved.col);
    m_cursor.overflow_pending = saved.overflow_pending && m_cursor.col == max_col_inclusive();
    m_graphics_rendition = saved.graphics_rendition;
    m_charset = saved.charset;
}

void Screen::set_cursor(u32 row, u32 col) {
    // Setting the cursor always clears the overflow pending flag.
    m_cursor.overflow_pending = false;
    m_cursor.row = di::clamp(row, 0_u32, max_row_inclusive());
    m_cursor.col = di::clamp(col, 0_u32, max_col_inclusive());
}

void Screen::set_cursor_row(u32 row) {
    set_cursor(row, m_cursor.col);
}

void Screen::set_cursor_col(u32 col) {
    set_cursor(m_cursor.row, col);
}

void Screen::move_cursor_up(u32 count) {
    auto min_row = cursor_in_scroll_region() ? m_scroll_region.top() : 0_u32;
    auto row = m_cursor.row >= min_row + count ? m_cursor.row - count : min_row;
    set_cursor(row, m_cursor.col);
}

void Screen::move_cursor_down(u32 count) {
    auto max_row = cursor_in_scroll_region() ? m_scroll_region.bottom() : max_row_inclusive();
    auto row = max_row - m_cursor.row >= count ? m_cursor.row + count : max_row;
    set_cursor(row, m_cursor.col);
}

void Screen::move_cursor_forward(u32 count) {
    auto col = max_col_inclusive() - m_cursor.col >= count ? m_cursor.col + count : max_col_inclusive();
    set_cursor(m_cursor.row, col);
}

void Screen::move_cursor_backward(u32 count) {
    auto col = m_cursor.col >= count ? m_cursor.col - count : 0_u32;
    set_cursor(m_cursor.row, col);
}

void Screen::carriage_return() {
    set_cursor(m_cursor.row, 0);
}

void Screen::backspace() {
    if (m_cursor.col > 0) {
        set_cursor(m_cursor.row, m_cursor.col - 1);
    } else {
        m_cursor.overflow_pending = false;
    }
}

void Screen::tab() {
    auto next_stop = (m_cursor.col / tab_width + 1) * tab_width;
    set_cursor(m_cursor.row, di::min(next_stop, max_col_inclusive()));
}

// Index - https://vt100.net/docs/vt510-rm/IND.html
void Screen::line_feed() {
    m_cursor.overflow_pending = false;
    if (m_cursor.row == m_scroll_region.bottom()) {
        scroll_rows_up(m_scroll_region.start_row, m_scroll_region.end_row, 1);
    } else if (m_cursor.row < max_row_inclusive()) {
        m_cursor.row++;
    }
}

// Reverse Index - https://vt100.net/docs/vt510-rm/RI.html
void Screen::reverse_index() {
    m_cursor.overflow_pending = false;
    if (m_cursor.row == m_scroll_region.top()) {
        scroll_rows_down(m_scroll_region.start_row, m_scroll_region.end_row, 1);
    } else if (m_cursor.row > 0) {
        m_cursor.row--;
    }
}

// Next Line - https://vt100.net/docs/vt510-rm/NEL.html
void Screen::next_line() {
    carriage_return();
    line_feed();
}

void Screen::scroll_up(u32 count) {
    scroll_rows_up(m_scroll_region.start_row, m_scroll_region.end_row, count);
}

void Screen::scroll_down(u32 count) {
    scroll_rows_down(m_scroll_region.start_row, m_scroll_region.end_row, count);
}

void Screen::erase_in_display(EraseMode mode) {
    switch (mode) {
        case EraseMode::ToEnd:
            erase_in_line(EraseMode::ToEnd);
            for (auto row = m_cursor.row + 1; row < max_height(); row++) {
                fill_cells(row, 0, max_width());
            }
            return;
        case EraseMode::ToStart:
            for (auto row = 0_u32; row < m_cursor.row; row++) {
                fill_cells(row, 0, max_width());
            }
            erase_in_line(EraseMode::ToStart);
            return;
        case EraseMode::All:
            for (auto row = 0_u32; row < max_height(); row++) {
                fill_cells(row, 0, max_width());
            }
            return;
    }
}

void Screen::erase_in_line(EraseMode mode) {
    switch (mode) {
        case EraseMode::ToEnd:
            fill_cells(m_cursor.row, m_cursor.col, max_width());
            return;
        case EraseMode::ToStart:
            fill_cells(m_cursor.row, 0, m_cursor.col + 1);
            return;
        case EraseMode::All:
            fill_cells(m_cursor.row, 0, max_width());
            return;
    }
}

// Erase Character - https://vt100.net/docs/vt510-rm/ECH.html
void Screen::erase_characters(u32 count) {
    auto end = max_width() - m_cursor.col >= count ? m_cursor.col + count : max_width();
    fill_cells(m_cursor.row, m_cursor.col, end);
    m_cursor.overflow_pending = false;
}

// Insert Character - https://vt100.net/docs/vt510-rm/ICH.html
void Screen::insert_blank_characters(u32 count) {
    auto& cells = m_rows[m_cursor.row].cells;
    count = di::min(count, max_width() - m_cursor.col);
    di::rotate(cells.begin() + m_cursor.col, cells.end() - count, cells.end());
    fill_cells(m_cursor.row, m_cursor.col, m_cursor.col + count);
    m_cursor.overflow_pending = false;
}

// Delete Character - https://vt100.net/docs/vt510-rm/DCH.html
void Screen::delete_characters(u32 count) {
    auto& cells = m_rows[m_cursor.row].cells;
    count = di::min(count, max_width() - m_cursor.col);
    if (cells[m_cursor.col].is_spacer && m_cursor.col > 0) {
        cells[m_cursor.col - 1] = blank_cell();
    }
    di::rotate(cells.begin() + m_cursor.col, cells.begin() + m_cursor.col + count, cells.end());
    if (cells[m_cursor.col].is_spacer) {
        cells[m_cursor.col] = blank_cell();
    }
    fill_cells(m_cursor.row, max_width() - count, max_width());
    m_cursor.overflow_pending = false;
}

// Insert Line - https://vt100.net/docs/vt510-rm/IL.html
void Screen::insert_blank_lines(u32 count) {
    if (!cursor_in_scroll_region()) {
        return;
    }
    scroll_rows_down(m_cursor.row, m_scroll_region.end_row, count);
    carriage_return();
}

// Delete Line - https://vt100.net/docs/vt510-rm/DL.html
void Screen::delete_lines(u32 count) {
    if (!cursor_in_scroll_region()) {
        return;
    }
    scroll_rows_up(m_cursor.row, m_scroll_region.end_row, count);
    carriage_return();
}

void Screen::put_code_point(c32 code_point) {
    if (m_charset == Charset::DecLineDrawing) {
        code_point = translate_dec_line_drawing(code_point);
    }

    // Zero width code points are not stored.
    auto width = dius::unicode::code_point_width(code_point).value_or(0);
    if (width == 0) {
        return;
    }
    if (width == 2 && max_width() < 2) {
        return;
    }

    if (m_cursor.overflow_pending) {
        next_line();
    }

    // A wide character which does not fit in the remaining columns wraps early.
    if (width == 2 && m_cursor.col == max_col_inclusive()) {
        fill_cells(m_cursor.row, m_cursor.col, max_width());
        next_line();
    }

    auto& cells = m_rows[m_cursor.row].cells;
    auto col = m_cursor.col;
    auto last_col = col + width - 1;

    // Overwriting half of a wide character erases the other half.
    if (cells[col].is_spacer && col > 0) {
        cells[col - 1] = blank_cell();
    }
    if (last_col + 1 < max_width() && cells[last_col + 1].is_spacer) {
        cells[last_col + 1] = blank_cell();
    }

    cells[col] = Cell { code_point, m_graphics_rendition, false };
    if (width == 2) {
        cells[col + 1] = Cell { U' ', m_graphics_rendition, true };
    }

    if (last_col == max_col_inclusive()) {
        m_cursor.col = max_col_inclusive();
        m_cursor.overflow_pending = true;
    } else {
        m_cursor.col = last_col + 1;
    }
}

// Reset to Initial State - https://vt100.net/docs/vt510-rm/RIS.html
void Screen::reset() {
    m_graphics_rendition = {};
    m_charset = Charset::Ascii;
    m_saved_cursor = {};
    m_cursor = {};
    m_cursor_hidden = false;
    reset_scroll_region();
    for (auto& row : m_rows) {
        row = blank_row();
    }
}

// Erased cells keep the current background color (xterm's bce behavior).
auto Screen::blank_cell() const -> Cell {
    auto cell = Cell {};
    cell.graphics_rendition.bg = m_graphics_rendition.bg;
    return cell;
}

auto Screen::blank_row() const -> Row {
    auto row = Row {};
    for (u32 i = 0; i < m_size.cols; i++) {
        row.cells.push_back(blank_cell());
    }
    return row;
}

void Screen::scroll_rows_up(u32 start_row, u32 end_row, u32 count) {
    if (start_row >= end_row) {
        return;
    }
    count = di::min(count, end_row - start_row);
    di::rotate(m_rows.begin() + start_row, m_rows.begin() + start_row + count, m_rows.begin() + end_row);
    for (auto row = end_row - count; row < end_row; row++) {
        m_rows[row] = blank_row();
    }
}

void Screen::scroll_rows_down(u32 start_row, u32 end_row, u32 count) {
    if (start_row >= end_row) {
        return;
    }
    count = di::min(count, end_row - start_row);
    di::rotate(m_rows.begin() + start_row, m_rows.begin() + end_row - count, m_rows.begin() + end_row);
    for (auto row = start_row; row < start_row + count; row++) {
        m_rows[row] = blank_row();
    }
}

void Screen::fill_cells(u32 row, u32 col_start, u32 col_end) {
    auto& cells = m_rows[row].cells;
    col_end = di::min(col_end, max_width());
    if (col_start >= col_end) {
        return;
    }

    // Erasing either half of a wide character erases the whole character.
    if (cells[col_start].is_spacer && col_start > 0) {
        cells[col_start - 1] = blank_cell();
    }
    if (col_end < max_width() && cells[col_end].is_spacer) {
        cells[col_end] = blank_cell();
    }
    for (auto col = col_start; col < col_end; col++) {
        cells[col] = blank_cell();
    }

    // Rotating cells can strand the first half of a wide character at the edge.
    if (is_wide(cells[max_col_inclusive()])) {
        cells[max_col_inclusive()] = blank_cell();
    }
}
}
