#include "di/math/numeric_limits.h"
#include "di/test/prelude.h"
#include "vtmux/graphics_rendition.h"
#include "vtmux/size.h"
#include "vtmux/terminal/screen.h"

namespace screen {
using namespace vtmux::terminal;

static void put_text(Screen& screen, di::StringView text) {
    for (auto code_point : text) {
        if (code_point == '\n') {
            screen.next_line();
        } else {
            screen.put_code_point(code_point);
        }
    }
}

// Expected text has one line per row. Spacer cells are not part of a row's text.
static void validate_text(Screen& screen, di::StringView text) {
    auto lines = text | di::split(U'\n') | di::to<di::Vector>();
    ASSERT_EQ(lines.size(), screen.max_height());
    for (auto i = 0_u32; i < screen.max_height(); i++) {
        ASSERT_EQ(screen.row_text(i), lines[i]);
    }
}

static void auto_wrap() {
    auto screen = Screen(vtmux::Size { 3, 10 });

    put_text(screen, "0123456789"_sv);
    ASSERT_EQ(screen.cursor().row, 0);
    ASSERT_EQ(screen.cursor().col, 9);
    ASSERT(screen.cursor().overflow_pending);

    put_text(screen, "a"_sv);
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cursor().col, 1);
    ASSERT_EQ(screen.cell(1, 0).code_point, U'a');

    validate_text(screen, "0123456789\n"
                          "a         \n"
                          "          "_sv);
}

static void scroll_at_bottom() {
    auto screen = Screen(vtmux::Size { 3, 4 });

    put_text(screen, "aaaa\nbbbb\ncccc\ndd"_sv);
    validate_text(screen, "bbbb\n"
                          "cccc\n"
                          "dd  "_sv);
    ASSERT_EQ(screen.cursor().row, 2);
    ASSERT_EQ(screen.cursor().col, 2);
}

static void cursor_clamping() {
    auto screen = Screen(vtmux::Size { 5, 10 });

    screen.set_cursor(100, 100);
    ASSERT_EQ(screen.cursor().row, 4);
    ASSERT_EQ(screen.cursor().col, 9);

    screen.move_cursor_up(100);
    ASSERT_EQ(screen.cursor().row, 0);
    screen.move_cursor_backward(100);
    ASSERT_EQ(screen.cursor().col, 0);
    screen.move_cursor_forward(3);
    ASSERT_EQ(screen.cursor().col, 3);
    screen.move_cursor_forward(di::NumericLimits<u32>::max);
    ASSERT_EQ(screen.cursor().col, 9);
    screen.move_cursor_down(di::NumericLimits<u32>::max);
    ASSERT_EQ(screen.cursor().row, 4);
}

static void scroll_region() {
    auto screen = Screen(vtmux::Size { 5, 3 });
    put_text(screen, "aaa\nbbb\nccc\nddd\neee"_sv);

    // Rows 1 through 3 inclusive. Setting the region homes the cursor.
    screen.set_scroll_region(1, 3);
    ASSERT_EQ(screen.cursor().row, 0);
    ASSERT_EQ(screen.cursor().col, 0);

    // Relative motion starting inside the region stays in it.
    screen.set_cursor(2, 0);
    screen.move_cursor_down(10);
    ASSERT_EQ(screen.cursor().row, 3);
    screen.move_cursor_up(10);
    ASSERT_EQ(screen.cursor().row, 1);

    // Relative motion starting outside the region uses the full screen.
    screen.set_cursor(4, 0);
    screen.move_cursor_up(10);
    ASSERT_EQ(screen.cursor().row, 0);

    // Line feed at the bottom of the region only scrolls the region.
    screen.set_cursor(3, 0);
    screen.line_feed();
    ASSERT_EQ(screen.cursor().row, 3);
    validate_text(screen, "aaa\n"
                          "ccc\n"
                          "ddd\n"
                          "   \n"
                          "eee"_sv);

    screen.set_cursor(1, 0);
    screen.reverse_index();
    validate_text(screen, "aaa\n"
                          "   \n"
                          "ccc\n"
                          "ddd\n"
                          "eee"_sv);

    // Invalid regions are ignored.
    screen.set_scroll_region(3, 3);
    screen.set_scroll_region(2, 7);
    ASSERT_EQ(screen.scroll_region(), ScrollRegion(1, 4));
}

static void erase() {
    auto screen = Screen(vtmux::Size { 3, 4 });
    put_text(screen, "abcd\nefgh\nijkl"_sv);

    screen.set_cursor(1, 1);
    screen.erase_in_line(EraseMode::ToEnd);
    validate_text(screen, "abcd\ne   \nijkl"_sv);

    screen.set_cursor(0, 2);
    screen.erase_in_line(EraseMode::ToStart);
    validate_text(screen, "   d\ne   \nijkl"_sv);

    screen.set_cursor(2, 1);
    screen.erase_characters(2);
    validate_text(screen, "   d\ne   \ni  l"_sv);

    // Erased cells take the current background color.
    auto rendition = vtmux::GraphicsRendition {};
    rendition.bg = vtmux::Color(vtmux::Color::Palette::Blue);
    rendition.italic = true;
    screen.set_current_graphics_rendition(rendition);
    screen.erase_in_display(EraseMode::All);
    validate_text(screen, "    \n    \n    "_sv);
    ASSERT_EQ(screen.cell(0, 0).graphics_rendition.bg, vtmux::Color(vtmux::Color::Palette::Blue));
    ASSERT(!screen.cell(0, 0).graphics_rendition.italic);

    // Erasing doesn't move the cursor.
    ASSERT_EQ(screen.cursor().row, 2);
    ASSERT_EQ(screen.cursor().col, 1);
}

static void wide_characters() {
    auto screen = Screen(vtmux::Size { 2, 5 });

    put_text(screen, "a界b"_sv);
    ASSERT_EQ(screen.cell(0, 1).code_point, U'界');
    ASSERT(screen.cell(0, 2).is_spacer);
    ASSERT_EQ(screen.cell(0, 3).code_point, U'b');
    ASSERT_EQ(screen.cursor().col, 4);

    // A wide character doesn't fit in the last column, so it wraps early.
    put_text(screen, "界"_sv);
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cell(1, 0).code_point, U'界');
    ASSERT(screen.cell(1, 1).is_spacer);
    ASSERT_EQ(screen.cell(0, 4).code_point, U' ');

    // Overwriting the spacer erases the whole character.
    screen.set_cursor(0, 2);
    put_text(screen, "x"_sv);
    validate_text(screen, "a xb \n界   "_sv);
}

static void zero_width_ignored() {
    auto screen = Screen(vtmux::Size { 1, 4 });

    // U+0301 COMBINING ACUTE ACCENT.
    put_text(screen, "e\u0301x"_sv);
    validate_text(screen, "ex  "_sv);
    ASSERT_EQ(screen.cursor().col, 2);
}

static void insert_and_delete_characters() {
    auto screen = Screen(vtmux::Size { 1, 6 });
    put_text(screen, "abcdef"_sv);

    screen.set_cursor(0, 1);
    screen.insert_blank_characters(2);
    validate_text(screen, "a  bcd"_sv);

    screen.delete_characters(3);
    validate_text(screen, "acd   "_sv);

    screen.delete_characters(100);
    validate_text(screen, "a     "_sv);
}

static void insert_and_delete_lines() {
    auto screen = Screen(vtmux::Size { 4, 2 });
    put_text(screen, "aa\nbb\ncc\ndd"_sv);

    screen.set_cursor(1, 1);
    screen.insert_blank_lines(1);
    validate_text(screen, "aa\n  \nbb\ncc"_sv);
    ASSERT_EQ(screen.cursor().col, 0);

    screen.delete_lines(2);
    validate_text(screen, "aa\ncc\n  \n  "_sv);
}

static void scroll_commands() {
    auto screen = Screen(vtmux::Size { 3, 2 });
    put_text(screen, "aa\nbb\ncc"_sv);

    screen.scroll_up(1);
    validate_text(screen, "bb\ncc\n  "_sv);

    screen.scroll_down(2);
    validate_text(screen, "  \n  \nbb"_sv);
}

static void tabs_and_backspace() {
    auto screen = Screen(vtmux::Size { 1, 20 });

    screen.tab();
    ASSERT_EQ(screen.cursor().col, 8);
    screen.tab();
    ASSERT_EQ(screen.cursor().col, 16);
    screen.tab();
    ASSERT_EQ(screen.cursor().col, 19);

    screen.backspace();
    ASSERT_EQ(screen.cursor().col, 18);
    screen.set_cursor(0, 0);
    screen.backspace();
    ASSERT_EQ(screen.cursor().col, 0);
}

static void save_restore_cursor() {
    auto screen = Screen(vtmux::Size { 5, 5 });

    auto rendition = vtmux::GraphicsRendition {};
    rendition.font_weight = vtmux::FontWeight::Bold;
    screen.set_current_graphics_rendition(rendition);
    screen.set_cursor(2, 3);
    screen.save_cursor();

    screen.set_cursor(0, 0);
    screen.reset_graphics_rendition();
    screen.restore_cursor();
    ASSERT_EQ(screen.cursor().row, 2);
    ASSERT_EQ(screen.cursor().col, 3);
    ASSERT_EQ(screen.current_graphics_rendition(), rendition);

    // A saved position outside a shrunk screen is clamped.
    screen.resize(vtmux::Size { 2, 2 });
    screen.restore_cursor();
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cursor().col, 1);
}

static void line_drawing() {
    auto screen = Screen(vtmux::Size { 1, 4 });

    screen.set_charset(Charset::DecLineDrawing);
    put_text(screen, "lqx"_sv);
    screen.set_charset(Charset::Ascii);
    put_text(screen, "q"_sv);
    validate_text(screen, "┌─│q"_sv);
}

static void resize() {
    auto screen = Screen(vtmux::Size { 3, 4 });
    put_text(screen, "abcd\nefgh\nijkl"_sv);

    screen.resize(vtmux::Size { 2, 2 });
    validate_text(screen, "ab\nef"_sv);
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cursor().col, 1);
    ASSERT_EQ(screen.scroll_region(), ScrollRegion(0, 2));

    screen.resize(vtmux::Size { 3, 3 });
    validate_text(screen, "ab \nef \n   "_sv);

    // A screen always has at least one cell.
    screen.resize(vtmux::Size { 0, 0 });
    ASSERT_EQ(screen.max_height(), 1);
    ASSERT_EQ(screen.max_width(), 1);
    ASSERT_EQ(screen.cursor().row, 0);
    ASSERT_EQ(screen.cursor().col, 0);
}

static void reset() {
    auto screen = Screen(vtmux::Size { 2, 2 });
    put_text(screen, "ab\nc"_sv);
    screen.set_cursor_hidden(true);
    screen.set_charset(Charset::DecLineDrawing);

    screen.reset();
    validate_text(screen, "  \n  "_sv);
    ASSERT_EQ(screen.cursor(), Cursor {});
    ASSERT(!screen.cursor_hidden());
    ASSERT_EQ(screen.charset(), Charset::Ascii);
}

TEST(screen, auto_wrap)
TEST(screen, scroll_at_bottom)
TEST(screen, cursor_clamping)
TEST(screen, scroll_region)
TEST(screen, erase)
TEST(screen, wide_characters)
TEST(screen, zero_width_ignored)
TEST(screen, insert_and_delete_characters)
TEST(screen, insert_and_delete_lines)
TEST(screen, scroll_commands)
TEST(screen, tabs_and_backspace)
TEST(screen, save_restore_cursor)
TEST(screen, line_drawing)
TEST(screen, resize)
TEST(screen, reset)
}
