#pragma once

#include "di/container/string/string.h"
#include "di/types/prelude.h"
#include "di/vocab/span/prelude.h"

namespace vtmux {
// Incremental UTF-8 decoder for byte streams read from a pseudo terminal or
// the real terminal. A code point split across two reads is buffered until
// its remaining code units arrive.
class Utf8StreamDecoder {
public:
    constexpr static auto replacement_character = U'\uFFFD';

    // Decode as much of the input as possible. Malformed sequences produce a
    // single replacement character each.
    auto decode(di::Span<byte const> input) -> di::String;

    // Decode a single byte, appending any completed code point to output.
    void feed(di::String& output, byte input);

    // Emit a replacement character for a truncated trailing sequence, if any.
    auto flush() -> di::String;

    // True if a multi-byte sequence has been started but not completed.
    auto has_pending() const -> bool { return m_remaining != 0; }

private:
    constexpr static auto default_lower_bound = u8(0x80);
    constexpr static auto default_upper_bound = u8(0xBF);

    void start_sequence(di::String& output, byte input);
    void emit(di::String& output, c32 code_point);

    u8 m_remaining { 0 };
    u32 m_code_point { 0 };
    u8 m_lower_bound { default_lower_bound };
    u8 m_upper_bound { default_upper_bound };
};
}
