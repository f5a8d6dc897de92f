#pragma once

#include "di/vocab/error/result.h"
#include "di/vocab/pointer/box.h"
#include "vtmux/input_source.h"

namespace vtmux {
/// @brief Reads the controlling terminal's input
///
/// Waits with poll(2) on standard input, a signalfd(2) for SIGWINCH and an
/// eventfd(2) used by wake(). SIGWINCH must already be blocked in every thread
/// (see dius::system::mask_signal()) for the signalfd to receive it.
class TerminalInputSource final : public InputSource {
public:
    static auto create() -> di::Result<di::Box<TerminalInputSource>>;

    TerminalInputSource(int signal_fd, int wake_fd) : m_signal_fd(signal_fd), m_wake_fd(wake_fd) {}
    ~TerminalInputSource() override;

    auto wait_and_read(di::Span<byte> buffer) -> di::Result<InputReady> override;
    void wake() override;

private:
    int m_signal_fd { -1 };
    int m_wake_fd { -1 };
};
}
