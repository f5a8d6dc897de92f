#include "vtmux/terminal_input_source.h"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include "dius/print.h"
#include "dius/sync_file.h"
#include "dius/tty.h"

namespace vtmux {
static auto last_error() -> di::BasicError {
    return di::BasicError(errno);
}

auto TerminalInputSource::create() -> di::Result<di::Box<TerminalInputSource>> {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGWINCH);
    auto signal_fd = signalfd(-1, &mask, SFD_CLOEXEC | SFD_NONBLOCK);
    if (signal_fd < 0) {
        return di::Unexpected(last_error());
    }

    auto wake_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd < 0) {
        auto error = last_error();
        close(signal_fd);
        return di::Unexpected(error);
    }
    return di::make_box<TerminalInputSource>(signal_fd, wake_fd);
}

TerminalInputSource::~TerminalInputSource() {
    close(m_signal_fd);
    close(m_wake_fd);
}

auto TerminalInputSource::wait_and_read(di::Span<byte> buffer) -> di::Result<InputReady> {
    for (;;) {
        pollfd fds[3] = {
            { STDIN_FILENO, POLLIN, 0 },
            { m_signal_fd, POLLIN, 0 },
            { m_wake_fd, POLLIN, 0 },
        };
        if (poll(fds, 3, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            return di::Unexpected(last_error());
        }

        auto result = InputReady {};
        if (fds[2].revents & POLLIN) {
            auto value = u64(0);
            (void) read(m_wake_fd, &value, sizeof(value));
            result.woken = true;
        }

        if (fds[1].revents & POLLIN) {
            // Drain every queued signal, since only the latest size matters.
            auto info = signalfd_siginfo {};
            while (read(m_signal_fd, &info, sizeof(info)) == sizeof(info)) {}

            auto size = dius::stdin.get_tty_window_size();
            if (size) {
                result.resize = Size::from_window_size(size.value());
            } else {
                dius::eprintln("Failed to query terminal size after SIGWINCH: {}"_sv, size.error().message());
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            auto nread = TRY(dius::stdin.read_some(buffer));
            result.bytes_read = nread;
            result.end_of_file = nread == 0;
        }

        if (result.bytes_read > 0 || result.resize || result.woken || result.end_of_file) {
            return result;
        }
    }
}

void TerminalInputSource::wake() {
    auto value = u64(1);
    (void) write(m_wake_fd, &value, sizeof(value));
}
}
