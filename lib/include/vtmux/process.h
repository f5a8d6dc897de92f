#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/vocab/error/result.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/span/prelude.h"
#include "dius/steady_clock.h"
#include "vtmux/size.h"

namespace vtmux {
/// @brief What to run for a session.
struct ProcessCommand {
    di::Vector<di::TransparentString> argv;

    auto clone() const -> ProcessCommand { return { argv.clone() }; }

    // The command as typed, with arguments separated by spaces.
    auto display() const -> di::String;
};

/// @brief A running child process attached to a pseudo terminal
///
/// Output is collected in the background, and taken without blocking by
/// take_output(). Every method is called from the multiplexer's thread.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    // Take all output produced since the last call. Never blocks.
    virtual auto take_output() -> di::Vector<byte> = 0;

    virtual auto write(di::Span<byte const> bytes) -> di::Result<> = 0;
    virtual auto resize(Size const& size) -> di::Result<> = 0;

    // Ask the process to terminate.
    virtual auto kill() -> di::Result<> = 0;

    // Stop accepting input and stop collecting output.
    virtual void close() = 0;

    // True once the process exited. Output produced before exiting can still be taken.
    virtual auto has_exited() -> bool = 0;

    // Wait until the process exits, or the deadline passes. Returns whether it exited.
    virtual auto wait_until(dius::SteadyClock::TimePoint deadline) -> bool = 0;
};

/// @brief Creates child processes. Replaced by a fake in tests.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    virtual auto spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<ChildProcess>> = 0;
};
}
