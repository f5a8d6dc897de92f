#pragma once

#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "vtmux/params.h"

namespace vtmux {
struct PrintableCharacter {
    c32 code_point = 0;

    auto operator==(PrintableCharacter const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PrintableCharacter>) {
        return di::make_fields<"PrintableCharacter">(di::field<"code_point", &PrintableCharacter::code_point>);
    }
};

struct CSI {
    di::String intermediate;
    Params params;
    c32 terminator = 0;

    auto operator==(CSI const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CSI>) {
        return di::make_fields<"CSI">(di::field<"intermediate", &CSI::intermediate>, di::field<"params", &CSI::params>,
                                      di::field<"terminator", &CSI::terminator>);
    }
};

struct Escape {
    di::String intermediate;
    c32 terminator = 0;

    auto operator==(Escape const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Escape>) {
        return di::make_fields<"Escape">(di::field<"intermediate", &Escape::intermediate>,
                                         di::field<"terminator", &Escape::terminator>);
    }
};

struct OSC {
    di::String data;
    di::StringView terminator; ///< Either BEL or ESC \, whichever the application used.

    auto operator==(OSC const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSC>) {
        return di::make_fields<"OSC">(di::field<"data", &OSC::data>, di::field<"terminator", &OSC::terminator>);
    }
};

struct ControlCharacter {
    u32 code_point { 0 };         // Not a c32, so that it will be printed as a decimal.
    bool was_in_escape { false }; // Set when the control character interrupted an escape sequence.

    auto operator==(ControlCharacter const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ControlCharacter>) {
        return di::make_fields<"ControlCharacter">(di::field<"code_point", &ControlCharacter::code_point>,
                                                   di::field<"was_in_escape", &ControlCharacter::was_in_escape>);
    }
};

using ParserResult = di::Variant<PrintableCharacter, CSI, Escape, OSC, ControlCharacter>;

// Parser for the escape sequences written by applications running inside a
// virtual terminal. The parser is incremental: state is carried across calls
// to parse(), so a sequence may be split at any code point boundary.
class EscapeSequenceParser {
public:
    auto parse(di::StringView data) -> di::Vector<ParserResult>;

    // Discard any partially parsed sequence.
    void reset();

private:
// VT500-Series parser states from https://vt100.net/emu/dec_ansi_parser
// DCS, SOS, PM and APC strings are not interpreted, so they share a single
// state which discards everything until the string terminator.
#define __ENUMERATE_STATES(M)                  \
    M(Ground, ground)                          \
    M(Escape, escape)                          \
    M(EscapeIntermediate, escape_intermediate) \
    M(CsiEntry, csi_entry)                     \
    M(CsiParam, csi_param)                     \
    M(CsiIntermediate, csi_intermediate)       \
    M(CsiIgnore, csi_ignore)                   \
    M(OscString, osc_string)                   \
    M(IgnoredString, ignored_string)

    enum class State {
#define __ENUMERATE_STATE(N, n) N,
        __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE
    };

#define __ENUMERATE_STATE(N, n) void n##_state(c32 code_point);
    __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE

    void ignore(c32 code_point);
    void print(c32 code_point);
    void execute(c32 code_point);
    void clear();
    void collect(c32 code_point);
    void param(c32 code_point);
    void finish_param();
    void esc_dispatch(c32 code_point);
    void csi_dispatch(c32 code_point);
    void osc_start();
    void osc_put(c32 code_point);
    void osc_end(di::StringView terminator);

    void transition(State state);

    void on_input(c32 code_point);

    void add_param(di::Optional<u32> param);

    State m_state { State::Ground };
    bool m_entered_state { true };

    di::String m_intermediate;
    di::String m_current_param;
    di::String m_osc_data;
    Params m_params;
    bool m_last_separator_was_colon { false };

    // Set when an ESC interrupts an OSC string. The OSC is only dispatched
    // if the ESC turns out to be the first half of the ST (ESC \).
    bool m_osc_awaiting_string_terminator { false };

    di::Vector<ParserResult> m_result;
};
}
