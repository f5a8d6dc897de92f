#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/vocab/error/result.h"
#include "dius/sync_file.h"
#include "vtmux/session_multiplexer.h"
#include "vtmux/terminal/row.h"

namespace vtmux {
/// @brief Paints the active session and the status bar to the real terminal
///
/// Rows are only repainted when their contents changed since the previous
/// render, or after a session switch or resize.
class Renderer final : public Display {
public:
    explicit Renderer(dius::SyncFile& output) : m_output(output) {}

    // Enter the alternate screen and enable the input reporting modes the
    // multiplexer decodes. cleanup() undoes everything in reverse order.
    auto setup() -> di::Result<>;
    auto cleanup() -> di::Result<>;

    void render_active_session(SessionMultiplexer const& multiplexer) override;
    void render_status_bar(SessionMultiplexer const& multiplexer) override;

    // Forget what was painted, so the next render clears and repaints everything.
    void invalidate() override {
        m_painted_rows.clear();
        m_clear_pending = true;
    }

private:
    dius::SyncFile& m_output;
    di::Vector<di::String> m_cleanup;
    di::Vector<terminal::Row> m_painted_rows;
    usize m_painted_session { 0 };
    bool m_clear_pending { true };
};
}
