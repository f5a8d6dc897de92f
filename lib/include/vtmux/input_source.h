#pragma once

#include "di/types/prelude.h"
#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "vtmux/size.h"

namespace vtmux {
/// @brief What became ready during InputSource::wait_and_read().
struct InputReady {
    usize bytes_read { 0 };       ///< Number of bytes placed in the buffer
    di::Optional<Size> resize;    ///< Set when the terminal was resized
    bool woken { false };         ///< Set when the wait was interrupted by wake()
    bool end_of_file { false };   ///< Set when the source will never produce more bytes
};

/// @brief The source of raw terminal input read by the input bridge
///
/// wait_and_read() is only called from the bridge's thread. wake() may be
/// called from any thread.
class InputSource {
public:
    virtual ~InputSource() = default;

    // Block until input, a resize, end of file or a wake up is ready.
    virtual auto wait_and_read(di::Span<byte> buffer) -> di::Result<InputReady> = 0;

    // Interrupt a blocked wait_and_read().
    virtual void wake() = 0;
};
}
