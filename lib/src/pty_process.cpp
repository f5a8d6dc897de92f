#include "vtmux/pty_process.h"

#include "di/sync/memory_order.h"
#include "di/util/exchange.h"
#include "dius/print.h"
#include "dius/tty.h"

namespace vtmux {
auto ProcessCommand::display() const -> di::String {
    auto result = di::String {};
    for (auto const& arg : argv) {
        if (!result.empty()) {
            result.push_back(U' ');
        }
        for (auto code_unit : arg) {
            result.push_back(c32(code_unit));
        }
    }
    return result;
}

static auto spawn_child(ProcessCommand const& command, dius::SyncFile& pty, Size const& size)
    -> di::Result<dius::system::ProcessHandle> {
    auto tty_path = TRY(pty.get_psuedo_terminal_path());

#ifdef __linux__
    // On linux, the size is set on the controller, and opening the pseudo terminal
    // in the child makes it the controlling terminal.
    TRY(pty.set_tty_window_size(size.as_window_size()));
#endif

    return dius::system::Process(command.argv.clone())
        .with_new_session()
        .with_env("TERM"_ts, "xterm-256color"_ts)
        .with_env("COLORTERM"_ts, "truecolor"_ts)
        .with_file_open(0, di::move(tty_path), dius::OpenMode::ReadWrite)
        .with_file_dup(0, 1)
        .with_file_dup(0, 2)
#ifndef __linux__
        .with_tty_window_size(0, size.as_window_size())
        .with_controlling_tty(0)
#endif
        .spawn();
}

auto PtyProcess::spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<PtyProcess>> {
    if (command.argv.empty()) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto pty_controller = TRY(dius::open_psuedo_terminal_controller(dius::OpenMode::ReadWrite));
    auto process = TRY(spawn_child(command, pty_controller, size));
    auto result = di::make_box<PtyProcess>(di::move(pty_controller), process);

    result->m_process_thread = TRY(dius::Thread::create([&self = *result] {
        (void) self.m_process.wait();
        self.m_exited.with_lock([](bool& exited) {
            exited = true;
        });
        self.m_exit_condition.notify_all();
    }));

    result->m_reader_thread = TRY(dius::Thread::create([&self = *result] {
        auto buffer = di::Vector<byte> {};
        buffer.resize(16384);

        while (!self.m_closed.load(di::MemoryOrder::Acquire)) {
            // Reading fails once the child side of the pseudo terminal is gone.
            auto nread = self.m_pty_controller.read_some(buffer.span());
            if (!nread.has_value() || *nread == 0) {
                break;
            }

            self.m_output.with_lock([&](di::Vector<byte>& output) {
                for (auto i = 0_usize; i < *nread; i++) {
                    output.push_back(buffer[i]);
                }
            });
        }
    }));

    return result;
}

PtyProcess::PtyProcess(dius::SyncFile pty_controller, dius::system::ProcessHandle process)
    : m_pty_controller(di::move(pty_controller)), m_process(process) {}

PtyProcess::~PtyProcess() {
    close();
    (void) m_process.signal(dius::Signal::Hangup);
    (void) m_reader_thread.join();
    (void) m_process_thread.join();
}

auto PtyProcess::take_output() -> di::Vector<byte> {
    return m_output.with_lock([&](di::Vector<byte>& output) {
        return di::exchange(output, di::Vector<byte> {});
    });
}

auto PtyProcess::write(di::Span<byte const> bytes) -> di::Result<> {
    if (m_closed.load(di::MemoryOrder::Acquire)) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    return m_pty_controller.write_exactly(bytes);
}

auto PtyProcess::resize(Size const& size) -> di::Result<> {
    return m_pty_controller.set_tty_window_size(size.as_window_size());
}

auto PtyProcess::kill() -> di::Result<> {
    return m_process.signal(dius::Signal::Hangup);
}

void PtyProcess::close() {
    m_closed.store(true, di::MemoryOrder::Release);
}

auto PtyProcess::has_exited() -> bool {
    return m_exited.with_lock([](bool& exited) {
        return exited;
    });
}

auto PtyProcess::wait_until(dius::SteadyClock::TimePoint deadline) -> bool {
    auto lock = di::UniqueLock(m_exited.get_lock());

    // SAFETY: we acquired the lock manually above.
    auto& exited = m_exited.get_assuming_no_concurrent_accesses();
    (void) m_exit_condition.wait_until(lock, deadline, [&] {
        return exited;
    });
    return exited;
}

auto PtyProcessSpawner::spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<ChildProcess>> {
    auto process = TRY(PtyProcess::spawn(command, size));
    return di::Box<ChildProcess>(di::move(process));
}
}
