#include "vtmux/escape_sequence_parser.h"

#include "di/parser/prelude.h"
#include "di/util/scope_exit.h"

#define STATE(state) void EscapeSequenceParser::state##_state([[maybe_unused]] c32 code_point)

#define ON_ENTRY_NOOP()           \
    do {                          \
        m_entered_state = false; \
    } while (0)

#define ON_ENTRY()                            \
    auto __did_enter = m_entered_state;      \
    m_entered_state = false;                 \
    if (__did_enter)

namespace vtmux {
constexpr auto max_osc_length = 4096_usize;

static inline auto is_printable(c32 code_point) -> bool {
    return (code_point >= 0x20 && code_point <= 0x7F) || (code_point >= 0xA0);
}

static inline auto is_executable(c32 code_point) -> bool {
    return code_point <= 0x17 || code_point == 0x19 || (code_point >= 0x1C && code_point <= 0x1F);
}

static inline auto is_csi_terminator(c32 code_point) -> bool {
    return code_point >= 0x40 && code_point <= 0x7E;
}

static inline auto is_param(c32 code_point) -> bool {
    // ':' is accepted alongside ';' so that SGR subparameters survive parsing.
    return (code_point >= 0x30 && code_point <= 0x39) || (code_point == 0x3B) || (code_point == 0x3A);
}

static inline auto is_private_marker(c32 code_point) -> bool {
    return code_point >= 0x3C && code_point <= 0x3F;
}

static inline auto is_intermediate(c32 code_point) -> bool {
    return code_point >= 0x20 && code_point <= 0x2F;
}

static inline auto is_bell(c32 code_point) -> bool {
    // NOTE: BEL as a string terminator is an xterm extension.
    return code_point == '\a';
}

static inline auto is_escape_terminator(c32 code_point) -> bool {
    return (code_point >= 0x30 && code_point <= 0x4F) || (code_point >= 0x51 && code_point <= 0x57) ||
           (code_point == 0x59) || (code_point == 0x5A) || (code_point == 0x5C) ||
           (code_point >= 0x60 && code_point <= 0x7E);
}

STATE(ground) {
    ON_ENTRY_NOOP();

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_printable(code_point)) {
        print(code_point);
        return;
    }
}

STATE(escape) {
    ON_ENTRY() {
        clear();
    }

    if (m_osc_awaiting_string_terminator) {
        m_osc_awaiting_string_terminator = false;
        if (code_point == '\\') {
            osc_end("\033\\"_sv);
            transition(State::Ground);
            return;
        }

        // Anything other than ST means the OSC was cut off, so drop it.
        m_osc_data.clear();
    }

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (code_point == 0x5B) {
        transition(State::CsiEntry);
        return;
    }

    if (code_point == 0x5D) {
        transition(State::OscString);
        return;
    }

    // DCS, SOS, PM, APC
    if (code_point == 0x50 || code_point == 0x58 || code_point == 0x5E || code_point == 0x5F) {
        transition(State::IgnoredString);
        return;
    }

    if (is_escape_terminator(code_point)) {
        esc_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::EscapeIntermediate);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }
}

STATE(escape_intermediate) {
    ON_ENTRY_NOOP();

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        return;
    }

    if (code_point >= 0x30 && code_point <= 0x7E) {
        esc_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }
}

STATE(csi_entry) {
    ON_ENTRY() {
        clear();
    }

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        csi_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::CsiIntermediate);
        return;
    }

    if (is_param(code_point)) {
        param(code_point);
        transition(State::CsiParam);
        return;
    }

    if (is_private_marker(code_point)) {
        collect(code_point);
        transition(State::CsiParam);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }
}

STATE(csi_param) {
    ON_ENTRY_NOOP();

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        transition(State::CsiIntermediate);
        return;
    }

    if (is_csi_terminator(code_point)) {
        // Leaving CsiParam flushes the trailing parameter, so transition first.
        transition(State::Ground);
        csi_dispatch(code_point);
        return;
    }

    if (is_param(code_point)) {
        param(code_point);
        return;
    }

    if (is_private_marker(code_point)) {
        transition(State::CsiIgnore);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }
}

STATE(csi_intermediate) {
    ON_ENTRY_NOOP();

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_intermediate(code_point)) {
        collect(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        csi_dispatch(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point >= 0x30 && code_point <= 0x3F) {
        transition(State::CsiIgnore);
        return;
    }

    if (code_point == 0x7F) {
        ignore(code_point);
        return;
    }
}

STATE(csi_ignore) {
    ON_ENTRY_NOOP();

    if (is_executable(code_point)) {
        execute(code_point);
        return;
    }

    if (is_csi_terminator(code_point)) {
        transition(State::Ground);
        return;
    }

    ignore(code_point);
}

STATE(osc_string) {
    ON_ENTRY() {
        osc_start();
    }

    if (is_bell(code_point)) {
        osc_end("\a"_sv);
        transition(State::Ground);
        return;
    }

    if (is_executable(code_point)) {
        ignore(code_point);
        return;
    }

    if (is_printable(code_point)) {
        osc_put(code_point);
        return;
    }
}

STATE(ignored_string) {
    ON_ENTRY_NOOP();

    if (is_bell(code_point)) {
        transition(State::Ground);
        return;
    }

    ignore(code_point);
}

void EscapeSequenceParser::ignore(c32) {}

void EscapeSequenceParser::print(c32 code_point) {
    m_result.push_back(PrintableCharacter(code_point));
}

void EscapeSequenceParser::execute(c32 code_point) {
    m_result.push_back(ControlCharacter(code_point, m_state == State::Escape));
}

void EscapeSequenceParser::clear() {
    m_current_param.clear();
    m_params = {};
    m_last_separator_was_colon = false;
    m_intermediate.clear();
}

void EscapeSequenceParser::collect(c32 code_point) {
    m_intermediate.push_back(code_point);
}

void EscapeSequenceParser::param(c32 code_point) {
    if (code_point != ';' && code_point != ':') {
        m_current_param.push_back(code_point);
        return;
    }

    auto _ = di::ScopeExit([&] {
        m_last_separator_was_colon = code_point == ':';
    });

    if (m_current_param.empty()) {
        add_param({});
        return;
    }

    add_param(di::parse<u32>(m_current_param.view()).optional_value());
    m_current_param.clear();
}

void EscapeSequenceParser::finish_param() {
    if (!m_current_param.empty()) {
        add_param(di::parse<u32>(m_current_param.view()).optional_value());
        m_current_param.clear();
    } else if (m_last_separator_was_colon) {
        // "38:5:" ends with an empty subparameter.
        add_param({});
    }
}

void EscapeSequenceParser::esc_dispatch(c32 code_point) {
    // ESC \ is the string terminator. Terminated OSC strings are handled in the
    // escape state, so a stray ST has nothing to dispatch.
    if (code_point == '\\') {
        return;
    }
    m_result.push_back(Escape(di::move(m_intermediate), code_point));
}

void EscapeSequenceParser::csi_dispatch(c32 code_point) {
    m_result.push_back(CSI(di::move(m_intermediate), di::move(m_params), code_point));
}

void EscapeSequenceParser::osc_start() {
    m_osc_data.clear();
    m_osc_awaiting_string_terminator = false;
}

void EscapeSequenceParser::osc_put(c32 code_point) {
    if (m_osc_data.size_bytes() < max_osc_length) {
        m_osc_data.push_back(code_point);
    }
}

void EscapeSequenceParser::osc_end(di::StringView terminator) {
    m_result.push_back(OSC(di::move(m_osc_data), terminator));
    m_osc_data.clear();
}

void EscapeSequenceParser::add_param(di::Optional<u32> param) {
    if (m_last_separator_was_colon) {
        if (param) {
            m_params.add_subparam(param.value());
        } else {
            m_params.add_empty_subparam();
        }
    } else {
        if (param) {
            m_params.add_param(param.value());
        } else {
            m_params.add_empty_param();
        }
    }
    m_last_separator_was_colon = false;
}

void EscapeSequenceParser::transition(State state) {
    if (m_state == State::CsiParam) {
        finish_param();
    }
    m_state = state;
    m_entered_state = true;
}

void EscapeSequenceParser::on_input(c32 code_point) {
    // CAN and SUB abort any sequence in progress.
    if (code_point == 0x18 || code_point == 0x1A) {
        m_osc_awaiting_string_terminator = false;
        execute(code_point);
        transition(State::Ground);
        return;
    }

    if (code_point == 0x1B) {
        m_osc_awaiting_string_terminator = m_state == State::OscString;
        if (!m_osc_awaiting_string_terminator) {
            m_osc_data.clear();
        }
        transition(State::Escape);
        return;
    }

    switch (m_state) {
#define __ENUMERATE_STATE(N, n)       \
    case State::N:                    \
        return n##_state(code_point);
        __ENUMERATE_STATES(__ENUMERATE_STATE)
#undef __ENUMERATE_STATE
    }
}

auto EscapeSequenceParser::parse(di::StringView data) -> di::Vector<ParserResult> {
    for (auto code_point : data) {
        on_input(code_point);
    }
    return di::move(m_result);
}

void EscapeSequenceParser::reset() {
    clear();
    m_osc_data.clear();
    m_osc_awaiting_string_terminator = false;
    m_state = State::Ground;
    m_entered_state = true;
    m_result.clear();
}
}
