#include "vtmux/input_codec.h"

#include "di/container/string/string_view.h"
#include "di/function/overload.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/focus_event_io.h"
#include "vtmux/key_event_io.h"
#include "vtmux/mouse_event_io.h"
#include "vtmux/params.h"
#include "vtmux/paste_event_io.h"
#include "vtmux/terminal/escapes/size_report.h"
#include "vtmux/utf8_stream_decoder.h"

namespace vtmux {
constexpr auto escape = byte(0x1b);

static auto key_result(KeyEvent const& event, usize consumed) -> ParsedInputEvent {
    return { event, consumed };
}

static auto escape_key(usize consumed = 1) -> ParsedInputEvent {
    return key_result(KeyEvent::key_down(Key::Escape), consumed);
}

// Number of bytes in a UTF-8 sequence, given its lead byte. Returns 0 for
// bytes which cannot start a sequence.
static auto utf8_sequence_length(byte lead) -> usize {
    auto value = u8(lead);
    if (value < 0x80) {
        return 1;
    }
    if (value >= 0xc2 && value <= 0xdf) {
        return 2;
    }
    if (value >= 0xe0 && value <= 0xef) {
        return 3;
    }
    if (value >= 0xf0 && value <= 0xf4) {
        return 4;
    }
    return 0;
}

static auto bytes_starting_with(di::Span<byte const> bytes, di::StringView prefix, usize offset) -> bool {
    auto prefix_bytes = di::as_bytes(prefix.span());
    if (bytes.size() < offset + prefix_bytes.size()) {
        return false;
    }
    for (auto i = 0_usize; i < prefix_bytes.size(); i++) {
        if (bytes[offset + i] != prefix_bytes[i]) {
            return false;
        }
    }
    return true;
}

// Decode a key which doesn't begin with ESC: a control byte or UTF-8 text.
static auto parse_plain_key(di::Span<byte const> bytes, Modifiers modifiers) -> di::Optional<ParsedInputEvent> {
    auto lead = u8(bytes[0]);
    if (lead < 0x20 || lead == 0x7f) {
        return key_result(key_event_from_legacy_code_point(lead, modifiers), 1);
    }

    auto length = utf8_sequence_length(bytes[0]);
    if (length == 0) {
        return key_result(KeyEvent::character(Utf8StreamDecoder::replacement_character, modifiers), 1);
    }
    if (bytes.size() < length) {
        return {};
    }

    auto decoder = Utf8StreamDecoder {};
    auto text = decoder.decode(di::Span<byte const>(bytes.data(), length));
    auto code_points = 0_usize;
    auto code_point = Utf8StreamDecoder::replacement_character;
    for (auto c : text) {
        code_point = c;
        code_points++;
    }
    if (code_points != 1 || decoder.has_pending()) {
        return key_result(KeyEvent::character(Utf8StreamDecoder::replacement_character, modifiers), 1);
    }
    return key_result(KeyEvent::character(code_point, modifiers), length);
}

static auto parse_bracketed_paste(di::Span<byte const> bytes, usize header_length) -> di::Optional<ParsedInputEvent> {
    for (auto end = header_length; end < bytes.size(); end++) {
        if (bytes_starting_with(bytes, bracketed_paste_end, end)) {
            auto decoder = Utf8StreamDecoder {};
            auto text = decoder.decode(di::Span<byte const>(bytes.data() + header_length, end - header_length));
            for (auto code_point : decoder.flush()) {
                text.push_back(code_point);
            }
            return ParsedInputEvent { PasteEvent(di::move(text)), end + bracketed_paste_end.size_bytes() };
        }
    }

    // Wait for the rest of the paste.
    return {};
}

// Decode a sequence starting with ESC [.
static auto parse_csi(di::Span<byte const> bytes, bool more_data_likely) -> di::Optional<ParsedInputEvent> {
    // X10 mouse reporting: CSI M Cb Cx Cy, where the last 3 bytes are raw.
    if (bytes.size() >= 3 && bytes[2] == byte('M')) {
        if (bytes.size() < 6) {
            return {};
        }
        if (auto event = mouse_event_from_x10(u8(bytes[3]), u8(bytes[4]), u8(bytes[5]))) {
            return ParsedInputEvent { *event, 6 };
        }
        return escape_key();
    }

    auto intermediate = di::String {};
    auto params = di::String {};
    auto index = 2_usize;

    // Private markers come first, and are reported as intermediate bytes.
    while (index < bytes.size() && u8(bytes[index]) >= 0x3c && u8(bytes[index]) <= 0x3f) {
        intermediate.push_back(c32(bytes[index++]));
    }
    while (index < bytes.size() && u8(bytes[index]) >= 0x30 && u8(bytes[index]) <= 0x3b) {
        params.push_back(c32(bytes[index++]));
    }
    while (index < bytes.size() && u8(bytes[index]) >= 0x20 && u8(bytes[index]) <= 0x2f) {
        intermediate.push_back(c32(bytes[index++]));
    }

    if (index == bytes.size()) {
        // A bare ESC [ with nothing following is Alt+[.
        if (bytes.size() == 2 && !more_data_likely) {
            return key_result(KeyEvent::character(U'[', Modifiers::Alt), 2);
        }
        return {};
    }

    auto terminator = u8(bytes[index]);
    if (terminator < 0x40 || terminator > 0x7e) {
        return escape_key();
    }
    auto consumed = index + 1;
    auto csi = CSI(di::move(intermediate), Params::from_string(params), c32(terminator));

    if (is_bracketed_paste_begin(csi)) {
        return parse_bracketed_paste(bytes, consumed);
    }
    if (auto event = key_event_from_csi(csi)) {
        return key_result(*event, consumed);
    }
    if (auto event = mouse_event_from_csi(csi)) {
        return ParsedInputEvent { *event, consumed };
    }
    if (auto event = focus_event_from_csi(csi)) {
        return ParsedInputEvent { *event, consumed };
    }
    if (auto event = terminal::TextAreaSizeReport::from_csi(csi)) {
        return ParsedInputEvent { *event, consumed };
    }
    return escape_key();
}

auto parse_input_event(di::Span<byte const> bytes, bool more_data_likely) -> di::Optional<ParsedInputEvent> {
    if (bytes.empty()) {
        return {};
    }

    if (bytes[0] != escape) {
        return parse_plain_key(bytes, Modifiers::None);
    }

    if (bytes.size() == 1) {
        if (more_data_likely) {
            return {};
        }
        return escape_key();
    }

    auto next = bytes[1];
    if (next == byte('[')) {
        return parse_csi(bytes, more_data_likely);
    }

    if (next == byte('O')) {
        if (bytes.size() == 2) {
            if (more_data_likely) {
                return {};
            }
            return key_result(KeyEvent::character(U'O', Modifiers::Alt), 2);
        }
        if (auto event = key_event_from_ss3(c32(bytes[2]))) {
            return key_result(*event, 3);
        }
        return escape_key();
    }

    if (next == escape) {
        return key_result(KeyEvent::key_down(Key::Escape, Modifiers::Alt), 2);
    }

    // ESC followed by a key is that key with Alt held.
    auto result = parse_plain_key(di::Span<byte const>(bytes.data() + 1, bytes.size() - 1), Modifiers::Alt);
    if (!result) {
        return {};
    }
    result->consumed++;
    return result;
}

auto generate_input_event(InputEvent const& event) -> di::Optional<di::String> {
    return di::visit(di::overload(
                         [](KeyEvent const& key_event) -> di::Optional<di::String> {
                             return serialize_key_event(key_event);
                         },
                         [](MouseEvent const& mouse_event) -> di::Optional<di::String> {
                             return serialize_mouse_event(mouse_event);
                         },
                         [](ResizeEvent const& resize_event) -> di::Optional<di::String> {
                             // Empty sizes are rejected when parsing.
                             if (resize_event.rows == 0 || resize_event.cols == 0) {
                                 return {};
                             }
                             return resize_event.serialize();
                         },
                         [](FocusEvent const& focus_event) -> di::Optional<di::String> {
                             return serialize_focus_event(focus_event);
                         },
                         [](PasteEvent const& paste_event) -> di::Optional<di::String> {
                             return serialize_paste_event(paste_event);
                         }),
                     event);
}

auto clone_input_event(InputEvent const& event) -> InputEvent {
    return di::visit(di::overload(
                         [](PasteEvent const& paste_event) -> InputEvent {
                             return paste_event.clone();
                         },
                         [](auto const& other) -> InputEvent {
                             return other;
                         }),
                     event);
}
}
