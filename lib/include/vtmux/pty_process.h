#pragma once

#include "di/container/vector/vector.h"
#include "di/sync/atomic.h"
#include "di/sync/synchronized.h"
#include "di/vocab/error/result.h"
#include "di/vocab/pointer/box.h"
#include "dius/condition_variable.h"
#include "dius/sync_file.h"
#include "dius/system/process.h"
#include "dius/thread.h"
#include "vtmux/process.h"

namespace vtmux {
/// @brief A child process running on a pseudo terminal
///
/// Two threads are owned per process: one blocks on the pseudo terminal and
/// buffers its output, and the other waits for the process to exit and wakes
/// anyone blocked in wait_until().
class PtyProcess final : public ChildProcess {
public:
    static auto spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<PtyProcess>>;

    explicit PtyProcess(dius::SyncFile pty_controller, dius::system::ProcessHandle process);
    ~PtyProcess() override;

    auto take_output() -> di::Vector<byte> override;
    auto write(di::Span<byte const> bytes) -> di::Result<> override;
    auto resize(Size const& size) -> di::Result<> override;
    auto kill() -> di::Result<> override;
    void close() override;
    auto has_exited() -> bool override;
    auto wait_until(dius::SteadyClock::TimePoint deadline) -> bool override;

private:
    dius::SyncFile m_pty_controller;
    dius::system::ProcessHandle m_process;
    di::Synchronized<di::Vector<byte>> m_output;
    di::Synchronized<bool> m_exited;
    dius::ConditionVariable m_exit_condition;
    di::Atomic<bool> m_closed { false };
    dius::Thread m_reader_thread;
    dius::Thread m_process_thread;
};

/// @brief Spawns PtyProcess instances.
class PtyProcessSpawner final : public ProcessSpawner {
public:
    auto spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<ChildProcess>> override;
};
}
