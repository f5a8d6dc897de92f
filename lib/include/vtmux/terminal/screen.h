#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "vtmux/graphics_rendition.h"
#include "vtmux/size.h"
#include "vtmux/terminal/cell.h"
#include "vtmux/terminal/charset.h"
#include "vtmux/terminal/cursor.h"
#include "vtmux/terminal/row.h"
#include "vtmux/terminal/scroll_region.h"

namespace vtmux::terminal {
/// @brief Which part of a row or of the screen is erased by ED and EL.
enum class EraseMode {
    ToEnd,   ///< From the cursor to the end (inclusive)
    ToStart, ///< From the beginning to the cursor (inclusive)
    All,     ///< Everything
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<EraseMode>) {
    using enum EraseMode;
    return di::make_enumerators<"EraseMode">(di::enumerator<"ToEnd", ToEnd>, di::enumerator<"ToStart", ToStart>,
                                             di::enumerator<"All", All>);
}

/// @brief Represents the visible contents of a virtual terminal
///
/// The screen owns a grid of rows which always matches its size, the cursor,
/// the scroll region, the current graphics rendition and the active character
/// set. All coordinates are 0-based. Every mutator clamps its arguments, so
/// out of range values produced by a misbehaving application never fault.
///
/// Cursor positioning follows these rules:
/// - Absolute positioning (set_cursor and friends) clamps to the full screen.
/// - Relative vertical motion (move_cursor_up/down) which starts inside the
///   scroll region is clamped to the scroll region.
/// - Columns are always clamped to [0, cols - 1].
class Screen {
public:
    explicit Screen(Size const& size);

    // Resize in place. Rows are added or removed at the bottom, and each row is
    // padded or truncated on the right. The scroll region resets to the full screen.
    void resize(Size const& size);

    auto size() const -> Size const& { return m_size; }
    auto max_height() const -> u32 { return m_size.rows; }
    auto max_width() const -> u32 { return m_size.cols; }

    auto scroll_region() const -> ScrollRegion const& { return m_scroll_region; }

    // Set the inclusive region [top, bottom]. Invalid regions (top >= bottom,
    // or bottom off screen) are ignored. Also homes the cursor, as DECSTBM does.
    void set_scroll_region(u32 top, u32 bottom);
    void reset_scroll_region();

    auto current_graphics_rendition() const -> GraphicsRendition const& { return m_graphics_rendition; }
    void set_current_graphics_rendition(GraphicsRendition const& rendition) { m_graphics_rendition = rendition; }
    void reset_graphics_rendition() { m_graphics_rendition = {}; }

    auto charset() const -> Charset { return m_charset; }
    void set_charset(Charset charset) { m_charset = charset; }

    auto cursor() const -> Cursor { return m_cursor; }
    auto cursor_hidden() const -> bool { return m_cursor_hidden; }
    void set_cursor_hidden(bool hidden) { m_cursor_hidden = hidden; }

    auto saved_cursor() const -> di::Optional<SavedCursor> const& { return m_saved_cursor; }
    void save_cursor();
    void restore_cursor();

    void set_cursor(u32 row, u32 col);
    void set_cursor_row(u32 row);
    void set_cursor_col(u32 col);

    void move_cursor_up(u32 count);
    void move_cursor_down(u32 count);
    void move_cursor_forward(u32 count);
    void move_cursor_backward(u32 count);

    void carriage_return();
    void backspace();
    void tab();

    // Move down one row, scrolling the region when the cursor is on its last row.
    void line_feed();
    // Move up one row, scrolling the region down when the cursor is on its first row.
    void reverse_index();
    void next_line();

    // Scroll the contents of the scroll region up (SU) or down (SD).
    void scroll_up(u32 count);
    void scroll_down(u32 count);

    void erase_in_display(EraseMode mode);
    void erase_in_line(EraseMode mode);
    void erase_characters(u32 count);

    void insert_blank_characters(u32 count);
    void delete_characters(u32 count);
    void insert_blank_lines(u32 count);
    void delete_lines(u32 count);

    // Write a single code point at the cursor using the current rendition and
    // character set. Text which reaches the right edge wraps on the next write.
    void put_code_point(c32 code_point);

    // Full reset (RIS): clear the grid, home the cursor, forget the saved
    // cursor and restore the default rendition and character set.
    void reset();

    auto rows() const -> di::Vector<Row> const& { return m_rows; }
    auto row(u32 row) const -> Row const& { return m_rows[row]; }
    auto cell(u32 row, u32 col) const -> Cell const& { return m_rows[row].cells[col]; }
    auto row_text(u32 row) const -> di::String { return m_rows[row].text(); }

private:
    auto blank_cell() const -> Cell;
    auto blank_row() const -> Row;

    // Scroll rows in [start_row, end_row) up or down by count, filling with blank rows.
    void scroll_rows_up(u32 start_row, u32 end_row, u32 count);
    void scroll_rows_down(u32 start_row, u32 end_row, u32 count);

    void fill_cells(u32 row, u32 col_start, u32 col_end);

    auto max_row_inclusive() const -> u32 { return max_height() - 1; }
    auto max_col_inclusive() const -> u32 { return max_width() - 1; }
    auto cursor_in_scroll_region() const -> bool { return m_scroll_region.contains(m_cursor.row); }

    di::Vector<Row> m_rows;
    Cursor m_cursor;
    di::Optional<SavedCursor> m_saved_cursor;
    GraphicsRendition m_graphics_rendition;
    Charset m_charset { Charset::Ascii };
    bool m_cursor_hidden { false };
    Size m_size {};
    ScrollRegion m_scroll_region;
};
}
