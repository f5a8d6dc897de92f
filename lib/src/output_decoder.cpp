#include "vtmux/output_decoder.h"

#include "di/container/algorithm/prelude.h"
#include "di/vocab/variant/visit.h"
#include "vtmux/graphics_rendition.h"
#include "vtmux/params.h"
#include "vtmux/terminal/escapes/device_status.h"
#include "vtmux/terminal/one_based.h"

namespace vtmux {
using terminal::EraseMode;
using terminal::OneBased;

void OutputDecoder::feed(di::Span<byte const> bytes) {
    auto text = m_utf8_decoder.decode(bytes);
    feed(text.view());
}

void OutputDecoder::feed(di::StringView text) {
    if (text.empty()) {
        return;
    }
    auto results = m_parser.parse(text);
    on_parser_results(results.span());
}

auto OutputDecoder::take_replies() -> di::Vector<byte> {
    return di::exchange(m_replies, di::Vector<byte> {});
}

auto OutputDecoder::take_events() -> di::Vector<OutputEvent> {
    return di::exchange(m_events, di::Vector<OutputEvent> {});
}

void OutputDecoder::reply(di::StringView bytes) {
    for (auto code_unit : di::as_bytes(bytes.span())) {
        m_replies.push_back(code_unit);
    }
}

void OutputDecoder::on_parser_results(di::Span<ParserResult const> results) {
    for (auto const& result : results) {
        di::visit(
            [&](auto const& r) {
                this->on_parser_result(r);
            },
            result);
    }
}

void OutputDecoder::on_parser_result(PrintableCharacter const& printable_character) {
    if (printable_character.code_point < 0x7F || printable_character.code_point > 0x9F) {
        m_screen.put_code_point(printable_character.code_point);
    }
}

void OutputDecoder::on_parser_result(OSC const& osc) {
    auto ps_end = osc.data.find(';');
    if (!ps_end) {
        return;
    }

    auto ps = osc.data.substr(osc.data.begin(), ps_end.begin());
    if (ps == "0"_sv || ps == "2"_sv) {
        osc_title(osc.data.substr(ps_end.end()));
        return;
    }
    if (ps == "9"_sv) {
        osc_9(osc.data.substr(ps_end.end()));
        return;
    }
}

void OutputDecoder::on_parser_result(ControlCharacter const& control_character) {
    switch (control_character.code_point) {
        case 8: {
            c0_bs();
            return;
        }
        case '\a':
            return;
        case '\t': {
            c0_ht();
            return;
        }
        case '\n':
        case '\v':
        case '\f': {
            c0_lf();
            return;
        }
        case '\r': {
            c0_cr();
            return;
        }
        default:
            return;
    }
}

void OutputDecoder::on_parser_result(CSI const& csi) {
    if (csi.intermediate == "?"_sv) {
        switch (csi.terminator) {
            case 'h': {
                csi_decset(csi.params);
                return;
            }
            case 'l': {
                csi_decrst(csi.params);
                return;
            }
            default:
                return;
        }
    }

    if (!csi.intermediate.empty()) {
        return;
    }

    switch (csi.terminator) {
        case '@': {
            csi_ich(csi.params);
            return;
        }
        case 'A': {
            csi_cuu(csi.params);
            return;
        }
        case 'B': {
            csi_cud(csi.params);
            return;
        }
        case 'C': {
            csi_cuf(csi.params);
            return;
        }
        case 'D': {
            csi_cub(csi.params);
            return;
        }
        case 'E': {
            csi_cnl(csi.params);
            return;
        }
        case 'F': {
            csi_cpl(csi.params);
            return;
        }
        case 'G': {
            csi_cha(csi.params);
            return;
        }
        case 'H': {
            csi_cup(csi.params);
            return;
        }
        case 'J': {
            csi_ed(csi.params);
            return;
        }
        case 'K': {
            csi_el(csi.params);
            return;
        }
        case 'L': {
            csi_il(csi.params);
            return;
        }
        case 'M': {
            csi_dl(csi.params);
            return;
        }
        case 'P': {
            csi_dch(csi.params);
            return;
        }
        case 'S': {
            csi_su(csi.params);
            return;
        }
        case 'T': {
            csi_sd(csi.params);
            return;
        }
        case 'X': {
            csi_ech(csi.params);
            return;
        }
        case 'd': {
            csi_vpa(csi.params);
            return;
        }
        case 'f': {
            csi_hvp(csi.params);
            return;
        }
        case 'm': {
            csi_sgr(csi.params);
            return;
        }
        case 'n': {
            csi_dsr(csi);
            return;
        }
        case 'r': {
            csi_decstbm(csi.params);
            return;
        }
        case 's': {
            // Save Current Cursor Position - https://vt100.net/docs/vt510-rm/SCOSC.html
            esc_decsc();
            return;
        }
        case 'u': {
            // Restore Saved Cursor Position - https://vt100.net/docs/vt510-rm/SCORC.html
            esc_decrc();
            return;
        }
        default:
            return;
    }
}

void OutputDecoder::on_parser_result(Escape const& escape) {
    if (escape.intermediate == "("_sv) {
        esc_scs_g0(escape.terminator);
        return;
    }

    if (!escape.intermediate.empty()) {
        return;
    }

    switch (escape.terminator) {
        case '7': {
            esc_decsc();
            return;
        }
        case '8': {
            esc_decrc();
            return;
        }
        case 'c': {
            esc_ris();
            return;
        }
        // 8 bit control characters
        case 'D': {
            c1_ind();
            return;
        }
        case 'E': {
            c1_nel();
            return;
        }
        case 'M': {
            c1_ri();
            return;
        }
        default:
            return;
    }
}

// Save Cursor - https://vt100.net/docs/vt510-rm/DECSC.html
void OutputDecoder::esc_decsc() {
    m_screen.save_cursor();
}

// Restore Cursor - https://vt100.net/docs/vt510-rm/DECRC.html
void OutputDecoder::esc_decrc() {
    m_screen.restore_cursor();
}

// Reset to Initial State - https://vt100.net/docs/vt510-rm/RIS.html
void OutputDecoder::esc_ris() {
    m_screen.reset();
}

// Select Character Set - https://vt100.net/docs/vt510-rm/SCS.html
void OutputDecoder::esc_scs_g0(c32 designator) {
    switch (designator) {
        case '0':
            m_screen.set_charset(terminal::Charset::DecLineDrawing);
            return;
        case 'B':
            m_screen.set_charset(terminal::Charset::Ascii);
            return;
        default:
            return;
    }
}

// Backspace - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void OutputDecoder::c0_bs() {
    m_screen.backspace();
}

// Horizontal Tab - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void OutputDecoder::c0_ht() {
    m_screen.tab();
}

// Line Feed - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void OutputDecoder::c0_lf() {
    m_screen.line_feed();
}

// Carriage Return - https://vt100.net/docs/vt510-rm/chapter4.html#T4-1
void OutputDecoder::c0_cr() {
    m_screen.carriage_return();
}

// Index - https://vt100.net/docs/vt510-rm/IND.html
void OutputDecoder::c1_ind() {
    m_screen.line_feed();
}

// Next Line - https://vt100.net/docs/vt510-rm/NEL.html
void OutputDecoder::c1_nel() {
    m_screen.next_line();
}

// Reverse Index - https://vt100.net/docs/vt510-rm/RI.html
void OutputDecoder::c1_ri() {
    m_screen.reverse_index();
}

// Insert Character - https://vt100.net/docs/vt510-rm/ICH.html
void OutputDecoder::csi_ich(Params const& params) {
    m_screen.insert_blank_characters(params.count(0));
}

// Cursor Up - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUU
void OutputDecoder::csi_cuu(Params const& params) {
    m_screen.move_cursor_up(params.count(0));
}

// Cursor Down - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUD
void OutputDecoder::csi_cud(Params const& params) {
    m_screen.move_cursor_down(params.count(0));
}

// Cursor Forward - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUF
void OutputDecoder::csi_cuf(Params const& params) {
    m_screen.move_cursor_forward(params.count(0));
}

// Cursor Backward - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUB
void OutputDecoder::csi_cub(Params const& params) {
    m_screen.move_cursor_backward(params.count(0));
}

// Cursor Next Line - https://vt100.net/docs/vt510-rm/CNL.html
void OutputDecoder::csi_cnl(Params const& params) {
    m_screen.move_cursor_down(params.count(0));
    m_screen.carriage_return();
}

// Cursor Previous Line - https://vt100.net/docs/vt510-rm/CPL.html
void OutputDecoder::csi_cpl(Params const& params) {
    m_screen.move_cursor_up(params.count(0));
    m_screen.carriage_return();
}

// Cursor Horizontal Absolute - https://vt100.net/docs/vt510-rm/CHA.html
void OutputDecoder::csi_cha(Params const& params) {
    m_screen.set_cursor_col(OneBased::from_param(params.get(0, 1)).to_zero_based());
}

// Cursor Position - https://www.vt100.net/docs/vt100-ug/chapter3.html#CUP
void OutputDecoder::csi_cup(Params const& params) {
    auto row = OneBased::from_param(params.get(0, 1));
    auto col = OneBased::from_param(params.get(1, 1));
    m_screen.set_cursor(row.to_zero_based(), col.to_zero_based());
}

// Erase in Display - https://vt100.net/docs/vt510-rm/ED.html
void OutputDecoder::csi_ed(Params const& params) {
    switch (params.get(0, 0)) {
        case 0: {
            m_screen.erase_in_display(EraseMode::ToEnd);
            return;
        }
        case 1: {
            m_screen.erase_in_display(EraseMode::ToStart);
            return;
        }
        case 2:
        case 3: {
            // 3 is the xterm extension which also clears scroll back, which we don't keep.
            m_screen.erase_in_display(EraseMode::All);
            return;
        }
        default:
            return;
    }
}

// Erase in Line - https://vt100.net/docs/vt510-rm/EL.html
void OutputDecoder::csi_el(Params const& params) {
    switch (params.get(0, 0)) {
        case 0: {
            m_screen.erase_in_line(EraseMode::ToEnd);
            return;
        }
        case 1: {
            m_screen.erase_in_line(EraseMode::ToStart);
            return;
        }
        case 2: {
            m_screen.erase_in_line(EraseMode::All);
            return;
        }
        default:
            return;
    }
}

// Insert Line - https://vt100.net/docs/vt510-rm/IL.html
void OutputDecoder::csi_il(Params const& params) {
    m_screen.insert_blank_lines(params.count(0));
}

// Delete Line - https://vt100.net/docs/vt510-rm/DL.html
void OutputDecoder::csi_dl(Params const& params) {
    m_screen.delete_lines(params.count(0));
}

// Delete Character - https://vt100.net/docs/vt510-rm/DCH.html
void OutputDecoder::csi_dch(Params const& params) {
    m_screen.delete_characters(params.count(0));
}

// Scroll Up - https://vt100.net/docs/vt510-rm/SU.html
void OutputDecoder::csi_su(Params const& params) {
    m_screen.scroll_up(params.count(0));
}

// Scroll Down - https://vt100.net/docs/vt510-rm/SD.html
void OutputDecoder::csi_sd(Params const& params) {
    m_screen.scroll_down(params.count(0));
}

// Erase Character - https://vt100.net/docs/vt510-rm/ECH.html
void OutputDecoder::csi_ech(Params const& params) {
    m_screen.erase_characters(params.count(0));
}

// Vertical Line Position Absolute - https://vt100.net/docs/vt510-rm/VPA.html
void OutputDecoder::csi_vpa(Params const& params) {
    m_screen.set_cursor_row(OneBased::from_param(params.get(0, 1)).to_zero_based());
}

// Horizontal and Vertical Position - https://vt100.net/docs/vt510-rm/HVP.html
void OutputDecoder::csi_hvp(Params const& params) {
    csi_cup(params);
}

// Select Graphics Rendition - https://vt100.net/docs/vt510-rm/SGR.html
void OutputDecoder::csi_sgr(Params const& params) {
    // Delegate to graphics rendition class.
    auto rendition = m_screen.current_graphics_rendition();
    rendition.update_with_csi_params(params);
    m_screen.set_current_graphics_rendition(rendition);
}

// Device Status Report - https://vt100.net/docs/vt510-rm/DSR.html
void OutputDecoder::csi_dsr(CSI const& csi) {
    auto request = terminal::parse_device_status_request(csi);
    if (!request) {
        return;
    }

    switch (request.value()) {
        case terminal::DeviceStatusRequest::OperatingStatus: {
            // Operating Status - https://vt100.net/docs/vt510-rm/DSR-OS.html
            auto response = terminal::OperatingStatusReport().serialize();
            reply(response.view());
            return;
        }
        case terminal::DeviceStatusRequest::CursorPosition: {
            // Cursor Position Report - https://vt100.net/docs/vt510-rm/DSR-CPR.html
            // Reported relative to the full screen, not the scroll region.
            auto cursor = m_screen.cursor();
            auto row = di::min(cursor.row, m_screen.max_height() - 1);
            auto col = di::min(cursor.col, m_screen.max_width() - 1);
            auto response = terminal::CursorPositionReport(row, col).serialize();
            reply(response.view());
            return;
        }
    }
}

// DEC Set Top and Bottom Margins - https://www.vt100.net/docs/vt100-ug/chapter3.html#DECSTBM
void OutputDecoder::csi_decstbm(Params const& params) {
    auto top = OneBased::from_param(params.get(0, 1)).to_zero_based();
    auto bottom = OneBased::from_param(params.get(1, m_screen.max_height())).to_zero_based();
    bottom = di::min(bottom, m_screen.max_height() - 1);
    m_screen.set_scroll_region(top, bottom);
}

// DEC Private Mode Set - https://vt100.net/docs/vt510-rm/DECSET.html
void OutputDecoder::csi_decset(Params const& params) {
    for (auto i = 0_usize; i < params.size(); i++) {
        // Text Cursor Enable Mode - https://vt100.net/docs/vt510-rm/DECTCEM.html
        if (params.get(i) == 25) {
            m_screen.set_cursor_hidden(false);
        }
    }
}

// DEC Private Mode Reset - https://vt100.net/docs/vt510-rm/DECRST.html
void OutputDecoder::csi_decrst(Params const& params) {
    for (auto i = 0_usize; i < params.size(); i++) {
        if (params.get(i) == 25) {
            m_screen.set_cursor_hidden(true);
        }
    }
}

// Set Window Title - https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h3-Operating-System-Commands
void OutputDecoder::osc_title(di::StringView data) {
    m_title = data.to_owned();
    m_events.push_back(TitleChange(m_title.clone()));
}

void OutputDecoder::osc_9(di::StringView data) {
    auto report = terminal::OSCProgress::parse(data);
    if (!report) {
        return;
    }
    m_progress = report.value();
    m_events.push_back(report.value());
}
}
