#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/integers.h"
#include "prez/params.h"

namespace prez {
struct Color {
    enum class Type {
        Default, ///< The terminal's own color
        Palette, ///< One of the 16 ANSI colors, selected by index
        Custom,  ///< True color
    };

    enum Palette : u8 {
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        White,
        BrightBlack,
        BrightRed,
        BrightGreen,
        BrightYellow,
        BrightBlue,
        BrightMagenta,
        BrightCyan,
        BrightWhite,
    };

    Color() = default;
    constexpr Color(Palette palette) : type(Type::Palette), index(palette) {}
    constexpr Color(u8 r, u8 g, u8 b) : type(Type::Custom), r(r), g(g), b(b) {}

    Type type { Type::Default };
    u8 index { 0 };
    u8 r { 0 };
    u8 g { 0 };
    u8 b { 0 };

    auto operator==(Color const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color>) {
        return di::make_fields<"Color">(di::field<"type", &Color::type>, di::field<"index", &Color::index>,
                                        di::field<"r", &Color::r>, di::field<"g", &Color::g>,
                                        di::field<"b", &Color::b>);
    }
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color::Type>) {
    using enum Color::Type;
    return di::make_enumerators<"Color::Type">(di::enumerator<"Default", Default>, di::enumerator<"Palette", Palette>,
                                               di::enumerator<"Custom", Custom>);
}

// Attributes a piece of text is printed with.
struct GraphicsRendition {
    Color fg {};
    Color bg {};
    bool bold { false };
    bool italic { false };

    // Starts with a reset (SGR 0), so the result doesn't depend on what was printed before.
    auto as_csi_params() const -> Params;
    auto as_sgr() const -> di::String;

    auto operator==(GraphicsRendition const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GraphicsRendition>) {
        return di::make_fields<"GraphicsRendition">(
            di::field<"fg", &GraphicsRendition::fg>, di::field<"bg", &GraphicsRendition::bg>,
            di::field<"bold", &GraphicsRendition::bold>, di::field<"italic", &GraphicsRendition::italic>);
    }
};
}
