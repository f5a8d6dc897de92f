#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"

namespace vtmux::terminal {
enum class ProgressState : u8 {
    Cleared = 0,
    Update = 1,
    Error = 2,
    Indeterminate = 3,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ProgressState>) {
    using enum ProgressState;
    return di::make_enumerators<"ProgressState">(di::enumerator<"Cleared", Cleared>, di::enumerator<"Update", Update>,
                                                 di::enumerator<"Error", Error>,
                                                 di::enumerator<"Indeterminate", Indeterminate>);
}

/// @brief Represents a progress report
///
/// The format is OSC 9 ; 4 ; state ; progress ST, originally popularized by
/// ConEmu and now emitted by build tools like cargo. The state is one of
/// cleared (0), update (1), error (2) or indeterminate (3). Progress is a
/// decimal percentage which is truncated and clamped to [0, 100]. Unknown
/// states are rejected.
struct OSCProgress {
    constexpr static auto max_progress = u8(100);

    ProgressState state { ProgressState::Cleared };
    u8 progress { 0 };

    // Parse the OSC payload following "9;", which is "4;state;progress".
    static auto parse(di::StringView data) -> di::Optional<OSCProgress>;

    auto serialize() const -> di::String;

    auto operator==(OSCProgress const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OSCProgress>) {
        return di::make_fields<"OSCProgress">(di::field<"state", &OSCProgress::state>,
                                              di::field<"progress", &OSCProgress::progress>);
    }
};
}
