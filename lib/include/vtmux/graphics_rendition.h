#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "di/vocab/optional/prelude.h"
#include "vtmux/params.h"

namespace vtmux {
struct Color {
    enum class Type {
        Default, ///< Color is the default (unset SGR)
        Palette, ///< Color is one of the 16 basic colors
        Indexed, ///< Color is an index into the 256 color palette (stored in r)
        Custom,  ///< Color is true color (r, g, b fully specified)
    };

    enum Palette : u8 {
        Black,
        Red,
        Green,
        Brown,
        Blue,
        Magenta,
        Cyan,
        LightGrey,
        DarkGrey,
        LightRed,
        LightGreen,
        Yellow,
        LightBlue,
        LightMagenta,
        LightCyan,
        White,
    };

    constexpr static auto indexed(u8 index) -> Color {
        auto result = Color {};
        result.type = Type::Indexed;
        result.r = index;
        return result;
    }

    Color() = default;
    constexpr Color(Palette c) : type(Type::Palette), r(c) {}
    constexpr Color(u8 r, u8 g, u8 b) : type(Type::Custom), r(r), g(g), b(b) {}

    constexpr auto is_default() const -> bool { return type == Type::Default; }

    Type type = Type::Default;
    u8 r = 0;
    u8 g = 0;
    u8 b = 0;

    auto operator==(Color const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color>) {
        return di::make_fields<"Color">(di::field<"type", &Color::type>, di::field<"r", &Color::r>,
                                        di::field<"g", &Color::g>, di::field<"b", &Color::b>);
    }
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color::Type>) {
    using enum Color::Type;
    return di::make_enumerators<"Color::Type">(di::enumerator<"Default", Default>, di::enumerator<"Palette", Palette>,
                                               di::enumerator<"Indexed", Indexed>, di::enumerator<"Custom", Custom>);
}

enum class BlinkMode : u8 {
    None,
    Normal,
    Rapid,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BlinkMode>) {
    using enum BlinkMode;
    return di::make_enumerators<"BlinkMode">(di::enumerator<"None", None>, di::enumerator<"Normal", Normal>,
                                             di::enumerator<"Rapid", Rapid>);
}

// Bold and dim are two settings of the same attribute: a cell is drawn with at
// most one of them, and SGR 22 resets both.
enum class FontWeight : u8 {
    None,
    Bold,
    Dim,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<FontWeight>) {
    using enum FontWeight;
    return di::make_enumerators<"FontWeight">(di::enumerator<"None", None>, di::enumerator<"Bold", Bold>,
                                              di::enumerator<"Dim", Dim>);
}

enum class UnderlineMode : u8 {
    None,
    Normal,
    Double,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<UnderlineMode>) {
    using enum UnderlineMode;
    return di::make_enumerators<"UnderlineMode">(di::enumerator<"None", None>, di::enumerator<"Normal", Normal>,
                                                 di::enumerator<"Double", Double>);
}

/// @brief The style applied to a cell
///
/// The virtual screen holds a "current" rendition which SGR sequences
/// update and which is stamped onto every cell written afterwards.
struct GraphicsRendition {
    Color fg {};
    Color bg {};

    FontWeight font_weight { FontWeight::None };
    BlinkMode blink_mode { BlinkMode::None };
    UnderlineMode underline_mode { UnderlineMode::None };
    bool italic { false };
    bool inverted { false };
    bool invisible { false };
    bool strike_through { false };

    static auto from_csi_params(Params const& params) {
        auto result = GraphicsRendition {};
        result.update_with_csi_params(params);
        return result;
    }

    // Apply the parameters of an SGR sequence (CSI ... m).
    void update_with_csi_params(Params const& params);

    // Produce SGR parameters which, applied to a default rendition, reproduce this one.
    auto as_csi_params() const -> Params;

    auto is_default() const -> bool { return *this == GraphicsRendition {}; }

    auto operator==(GraphicsRendition const& other) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GraphicsRendition>) {
        return di::make_fields<"GraphicsRendition">(
            di::field<"fg", &GraphicsRendition::fg>, di::field<"bg", &GraphicsRendition::bg>,
            di::field<"font_weight", &GraphicsRendition::font_weight>,
            di::field<"blink_mode", &GraphicsRendition::blink_mode>,
            di::field<"underline_mode", &GraphicsRendition::underline_mode>,
            di::field<"italic", &GraphicsRendition::italic>, di::field<"inverted", &GraphicsRendition::inverted>,
            di::field<"invisible", &GraphicsRendition::invisible>,
            di::field<"strike_through", &GraphicsRendition::strike_through>);
    }
};
}
