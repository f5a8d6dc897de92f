#include "vtmux/utf8_stream_decoder.h"

#include "di/function/between_inclusive.h"
#include "di/parser/integral.h"
#include "di/types/byte.h"

namespace vtmux {
auto Utf8StreamDecoder::decode(di::Span<byte const> input) -> di::String {
    auto result = ""_s;
    for (auto byte : input) {
        feed(result, byte);
    }
    return result;
}

auto Utf8StreamDecoder::flush() -> di::String {
    auto result = ""_s;
    if (has_pending()) {
        emit(result, replacement_character);
    }
    return result;
}

void Utf8StreamDecoder::feed(di::String& output, byte input) {
    if (!has_pending()) {
        start_sequence(output, input);
        return;
    }

    // A byte which cannot continue the current sequence terminates it. The
    // byte itself is then reconsidered as the start of a new sequence.
    auto value = di::to_integer<u8>(input);
    if (!di::between_inclusive(value, m_lower_bound, m_upper_bound)) {
        emit(output, replacement_character);
        start_sequence(output, input);
        return;
    }

    m_lower_bound = default_lower_bound;
    m_upper_bound = default_upper_bound;
    m_code_point = (m_code_point << 6) | di::to_integer<u32>(input & 0b0011'1111_b);
    if (--m_remaining == 0) {
        emit(output, m_code_point);
    }
}

void Utf8StreamDecoder::start_sequence(di::String& output, byte input) {
    // Well-formed byte sequences, see table 3-7 of the Unicode core specification:
    //   https://www.unicode.org/versions/Unicode16.0.0/core-spec/chapter-3/#G27506
    auto value = di::to_integer<u8>(input);
    if (value <= 0x7F) {
        emit(output, value);
        return;
    }
    if (di::between_inclusive(value, 0xC2, 0xDF)) {
        m_remaining = 1;
        m_code_point = value & 0x1F;
        return;
    }
    if (di::between_inclusive(value, 0xE0, 0xEF)) {
        m_remaining = 2;
        m_code_point = value & 0x0F;
        if (value == 0xE0) {
            m_lower_bound = 0xA0; // Overlong encodings.
        } else if (value == 0xED) {
            m_upper_bound = 0x9F; // Surrogates.
        }
        return;
    }
    if (di::between_inclusive(value, 0xF0, 0xF4)) {
        m_remaining = 3;
        m_code_point = value & 0x07;
        if (value == 0xF0) {
            m_lower_bound = 0x90;
        } else if (value == 0xF4) {
            m_upper_bound = 0x8F; // Beyond U+10FFFF.
        }
        return;
    }
    emit(output, replacement_character);
}

void Utf8StreamDecoder::emit(di::String& output, c32 code_point) {
    output.push_back(code_point);
    *this = {};
}
}
