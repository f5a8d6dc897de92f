#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "vtmux/escape_sequence_parser.h"
#include "vtmux/terminal/escapes/osc_progress.h"
#include "vtmux/terminal/screen.h"
#include "vtmux/utf8_stream_decoder.h"

namespace vtmux {
/// @brief The application changed its window title (OSC 0 or OSC 2).
struct TitleChange {
    di::String title;

    auto operator==(TitleChange const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TitleChange>) {
        return di::make_fields<"TitleChange">(di::field<"title", &TitleChange::title>);
    }
};

/// @brief Notifications produced while decoding, which don't affect the screen.
using OutputEvent = di::Variant<terminal::OSCProgress, TitleChange>;

/// @brief Drives a virtual screen from the output of a child process
///
/// Bytes are decoded as UTF-8, split into escape sequences, and applied to the
/// bound screen. Input may be split at any byte boundary between calls to
/// feed(). Unrecognized or malformed sequences are dropped.
///
/// Requests which expect a reply (device status reports) queue bytes which the
/// owner must write back to the child via take_replies().
class OutputDecoder {
public:
    explicit OutputDecoder(terminal::Screen& screen) : m_screen(screen) {}

    void feed(di::Span<byte const> bytes);
    void feed(di::StringView text);

    auto take_replies() -> di::Vector<byte>;
    auto take_events() -> di::Vector<OutputEvent>;

    auto title() const -> di::StringView { return m_title; }
    auto progress() const -> di::Optional<terminal::OSCProgress> const& { return m_progress; }

    auto screen() -> terminal::Screen& { return m_screen; }
    auto screen() const -> terminal::Screen const& { return m_screen; }

private:
    void on_parser_results(di::Span<ParserResult const> results);
    void on_parser_result(PrintableCharacter const& printable_character);
    void on_parser_result(CSI const& csi);
    void on_parser_result(Escape const& escape);
    void on_parser_result(OSC const& osc);
    void on_parser_result(ControlCharacter const& control_character);

    void reply(di::StringView bytes);

    void esc_decsc();
    void esc_decrc();
    void esc_ris();
    void esc_scs_g0(c32 designator);

    void c0_bs();
    void c0_ht();
    void c0_lf();
    void c0_cr();

    void c1_ind();
    void c1_nel();
    void c1_ri();

    void csi_ich(Params const& params);
    void csi_cuu(Params const& params);
    void csi_cud(Params const& params);
    void csi_cuf(Params const& params);
    void csi_cub(Params const& params);
    void csi_cnl(Params const& params);
    void csi_cpl(Params const& params);
    void csi_cha(Params const& params);
    void csi_cup(Params const& params);
    void csi_ed(Params const& params);
    void csi_el(Params const& params);
    void csi_il(Params const& params);
    void csi_dl(Params const& params);
    void csi_dch(Params const& params);
    void csi_su(Params const& params);
    void csi_sd(Params const& params);
    void csi_ech(Params const& params);
    void csi_vpa(Params const& params);
    void csi_hvp(Params const& params);
    void csi_sgr(Params const& params);
    void csi_dsr(CSI const& csi);
    void csi_decstbm(Params const& params);
    void csi_decset(Params const& params);
    void csi_decrst(Params const& params);

    void osc_title(di::StringView data);
    void osc_9(di::StringView data);

    terminal::Screen& m_screen;
    Utf8StreamDecoder m_utf8_decoder;
    EscapeSequenceParser m_parser;
    di::Vector<byte> m_replies;
    di::Vector<OutputEvent> m_events;
    di::String m_title;
    di::Optional<terminal::OSCProgress> m_progress;
};
}
