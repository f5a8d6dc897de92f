#include "di/container/view/range.h"
#include "di/vocab/span/as_bytes.h"
#include "dius/test/prelude.h"
#include "vtmux/output_decoder.h"
#include "vtmux/size.h"
#include "vtmux/terminal/escapes/osc_progress.h"
#include "vtmux/terminal/screen.h"

namespace output_decoder {
using namespace vtmux::terminal;

static auto as_text(di::Vector<byte> const& bytes) -> di::String {
    auto result = di::String {};
    for (auto b : bytes) {
        result.push_back(c32(di::to_integer<u8>(b)));
    }
    return result;
}

static void sgr_applies_to_following_text() {
    auto screen = Screen(vtmux::Size { 2, 10 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[1mRED\x1b[0mNORM"_sv);

    auto bold = vtmux::GraphicsRendition {};
    bold.font_weight = vtmux::FontWeight::Bold;
    for (auto col : di::range(0u, 3u)) {
        ASSERT_EQ(screen.cell(0, col).graphics_rendition, bold);
        ASSERT(screen.cell(0, col).graphics_rendition.fg.is_default());
    }
    for (auto col : di::range(3u, 7u)) {
        ASSERT(screen.cell(0, col).graphics_rendition.is_default());
    }
    ASSERT_EQ(screen.row_text(0), "REDNORM   "_sv);
}

static void progress_is_clamped() {
    auto screen = Screen(vtmux::Size { 2, 10 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b]9;4;1;150\x1b\\"_sv);

    auto events = decoder.take_events();
    ASSERT_EQ(events.size(), 1);
    auto progress = di::get_if<OSCProgress>(events[0]);
    ASSERT(progress);
    ASSERT_EQ(progress->state, ProgressState::Update);
    ASSERT_EQ(progress->progress, 100);
    ASSERT(decoder.progress() == OSCProgress(ProgressState::Update, 100));

    // Events are only reported once.
    ASSERT(decoder.take_events().empty());

    // Nothing was printed.
    ASSERT_EQ(screen.row_text(0), "          "_sv);
}

static void title() {
    auto screen = Screen(vtmux::Size { 1, 4 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b]2;hello\a\x1b]0;world\x1b\\"_sv);
    ASSERT_EQ(decoder.title(), "world"_sv);

    auto events = decoder.take_events();
    ASSERT_EQ(events.size(), 2);
    ASSERT_EQ(events[0], vtmux::OutputEvent(vtmux::TitleChange("hello"_s)));
    ASSERT_EQ(events[1], vtmux::OutputEvent(vtmux::TitleChange("world"_s)));
}

static void device_status_replies() {
    auto screen = Screen(vtmux::Size { 5, 10 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[3;4H\x1b[6n\x1b[5n"_sv);
    ASSERT_EQ(as_text(decoder.take_replies()), "\x1b[3;4R\x1b[0n"_sv);
    ASSERT(decoder.take_replies().empty());

    // The position is reported relative to the screen, even inside a scroll region.
    decoder.feed("\x1b[2;4r\x1b[2B\x1b[6n"_sv);
    ASSERT_EQ(as_text(decoder.take_replies()), "\x1b[3;1R"_sv);

    // Other requests are not answered.
    decoder.feed("\x1b[15n\x1b[?6n"_sv);
    ASSERT(decoder.take_replies().empty());
}

static void split_input() {
    constexpr auto input = "a\x1b[31mb\xe2\x82\xac\x1b]2;t\x1b\\\x1b[2;3Hc\r\n\x1b[1;4r\x1b[?25ld"_sv;
    auto bytes = di::as_bytes(input.span());

    auto expected_screen = Screen(vtmux::Size { 4, 6 });
    auto expected = vtmux::OutputDecoder(expected_screen);
    expected.feed(bytes);

    // Feeding one byte at a time gives the same screen as feeding everything at once.
    auto screen = Screen(vtmux::Size { 4, 6 });
    auto decoder = vtmux::OutputDecoder(screen);
    for (auto i : di::range(bytes.size())) {
        decoder.feed(*bytes.subspan(i, 1));
    }

    ASSERT(screen.rows() == expected_screen.rows());
    ASSERT_EQ(screen.cursor(), expected_screen.cursor());
    ASSERT_EQ(screen.cursor_hidden(), expected_screen.cursor_hidden());
    ASSERT_EQ(decoder.title(), expected.title());

    // Setting the scroll region homed the cursor, so the last character replaced the first.
    ASSERT_EQ(screen.row_text(0), "db€   "_sv);
    ASSERT_EQ(screen.row_text(1), "  c   "_sv);
    ASSERT(screen.cursor_hidden());
    ASSERT_EQ(decoder.title(), "t"_sv);
}

static void cursor_movement() {
    auto screen = Screen(vtmux::Size { 5, 10 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[100;100H"_sv);
    ASSERT_EQ(screen.cursor().row, 4);
    ASSERT_EQ(screen.cursor().col, 9);

    decoder.feed("\x1b[2A\x1b[3D"_sv);
    ASSERT_EQ(screen.cursor().row, 2);
    ASSERT_EQ(screen.cursor().col, 6);

    // 0 and missing parameters count as 1.
    decoder.feed("\x1b[0A\x1b[C"_sv);
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cursor().col, 7);

    decoder.feed("\x1b[4G\x1b[2d"_sv);
    ASSERT_EQ(screen.cursor().row, 1);
    ASSERT_EQ(screen.cursor().col, 3);

    decoder.feed("\x1b[H"_sv);
    ASSERT_EQ(screen.cursor().row, 0);
    ASSERT_EQ(screen.cursor().col, 0);

    decoder.feed("\x1b[3E"_sv);
    ASSERT_EQ(screen.cursor().row, 3);
    ASSERT_EQ(screen.cursor().col, 0);
}

static void erase_and_edit() {
    auto screen = Screen(vtmux::Size { 3, 5 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("abcde\r\nfghij\r\nklmno"_sv);
    decoder.feed("\x1b[2;3H\x1b[K"_sv);
    ASSERT_EQ(screen.row_text(1), "fg   "_sv);

    decoder.feed("\x1b[1;2H\x1b[2P"_sv);
    ASSERT_EQ(screen.row_text(0), "ade  "_sv);

    decoder.feed("\x1b[2@"_sv);
    ASSERT_EQ(screen.row_text(0), "a  de"_sv);

    decoder.feed("\x1b[3;1H\x1b[2X"_sv);
    ASSERT_EQ(screen.row_text(2), "  mno"_sv);

    decoder.feed("\x1b[2J"_sv);
    for (auto row : di::range(3u)) {
        ASSERT_EQ(screen.row_text(row), "     "_sv);
    }
}

static void save_restore_and_reset() {
    auto screen = Screen(vtmux::Size { 3, 5 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[2;3H\x1b" "7\x1b[H\x1b" "8x"_sv);
    ASSERT_EQ(screen.row_text(1), "  x  "_sv);

    decoder.feed("\x1b[3;1H\x1b[s\x1b[H\x1b[uy"_sv);
    ASSERT_EQ(screen.row_text(2), "y    "_sv);

    decoder.feed("\x1b" "c"_sv);
    ASSERT_EQ(screen.row_text(1), "     "_sv);
    ASSERT_EQ(screen.cursor(), Cursor {});
}

static void line_drawing_charset() {
    auto screen = Screen(vtmux::Size { 1, 4 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b(0qx\x1b(Bqx"_sv);
    ASSERT_EQ(screen.row_text(0), "─│qx"_sv);
}

static void unknown_sequences_ignored() {
    auto screen = Screen(vtmux::Size { 1, 6 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[>4;1m\x1b[?1049h\x1bP+q544e\x1b\\\x1b]52;c;YQ==\aok"_sv);
    ASSERT_EQ(screen.row_text(0), "ok    "_sv);
    ASSERT(decoder.take_replies().empty());
    ASSERT(decoder.take_events().empty());
}

static void sgr_22_clears_weight_only() {
    auto screen = Screen(vtmux::Size { 1, 4 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[1;3;4;31;42m\x1b[22mx\x1b[2m\x1b[22my"_sv);

    // Bold and dim go, but everything else stays.
    auto expected = vtmux::GraphicsRendition {};
    expected.italic = true;
    expected.underline_mode = vtmux::UnderlineMode::Normal;
    expected.fg = vtmux::Color(vtmux::Color::Red);
    expected.bg = vtmux::Color(vtmux::Color::Green);
    ASSERT_EQ(screen.cell(0, 0).graphics_rendition, expected);
    ASSERT_EQ(screen.cell(0, 1).graphics_rendition, expected);
    ASSERT_EQ(screen.current_graphics_rendition(), expected);
}

static void reset_is_idempotent() {
    auto screen = Screen(vtmux::Size { 2, 4 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[1;4;38:5:200mab\x1b[0m"_sv);
    ASSERT(screen.current_graphics_rendition().is_default());
    decoder.feed("\x1b[0m"_sv);
    ASSERT(screen.current_graphics_rendition().is_default());
    ASSERT_EQ(screen.row_text(0), "ab  "_sv);

    decoder.feed("\x1b[2;2H\x1b[31mcd\x1b" "7\x1b" "c"_sv);
    auto cursor = screen.cursor();
    auto rendition = screen.current_graphics_rendition();
    auto first_row = screen.row_text(0);
    auto second_row = screen.row_text(1);

    decoder.feed("\x1b" "c"_sv);
    ASSERT_EQ(screen.cursor(), cursor);
    ASSERT_EQ(screen.current_graphics_rendition(), rendition);
    ASSERT_EQ(screen.row_text(0), first_row);
    ASSERT_EQ(screen.row_text(1), second_row);
    ASSERT_EQ(screen.cursor(), Cursor {});
    ASSERT(rendition.is_default());
}

static void colon_extended_colors() {
    auto screen = Screen(vtmux::Size { 1, 4 });
    auto decoder = vtmux::OutputDecoder(screen);

    decoder.feed("\x1b[38:2::10:20:30ma\x1b[38:5:200;48:2:1:2:3mb\x1b[48:5:7mc"_sv);

    ASSERT_EQ(screen.cell(0, 0).graphics_rendition.fg, vtmux::Color(10, 20, 30));
    ASSERT(screen.cell(0, 0).graphics_rendition.bg.is_default());

    ASSERT_EQ(screen.cell(0, 1).graphics_rendition.fg, vtmux::Color::indexed(200));
    ASSERT_EQ(screen.cell(0, 1).graphics_rendition.bg, vtmux::Color(1, 2, 3));

    ASSERT_EQ(screen.cell(0, 2).graphics_rendition.fg, vtmux::Color::indexed(200));
    ASSERT_EQ(screen.cell(0, 2).graphics_rendition.bg, vtmux::Color::indexed(7));
    ASSERT_EQ(screen.row_text(0), "abc "_sv);
}

TEST(output_decoder, sgr_applies_to_following_text)
TEST(output_decoder, progress_is_clamped)
TEST(output_decoder, title)
TEST(output_decoder, device_status_replies)
TEST(output_decoder, split_input)
TEST(output_decoder, cursor_movement)
TEST(output_decoder, erase_and_edit)
TEST(output_decoder, save_restore_and_reset)
TEST(output_decoder, line_drawing_charset)
TEST(output_decoder, unknown_sequences_ignored)
TEST(output_decoder, sgr_22_clears_weight_only)
TEST(output_decoder, reset_is_idempotent)
TEST(output_decoder, colon_extended_colors)
}
