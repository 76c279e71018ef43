#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "prez/graphics_rendition.h"

namespace prez {
struct Colors {
    di::Optional<Color> foreground;
    di::Optional<Color> background;

    // Colors set here win, unset ones are taken from fallback.
    auto or_else(Colors const& fallback) const -> Colors {
        return { foreground.has_value() ? foreground : fallback.foreground,
                 background.has_value() ? background : fallback.background };
    }

    auto operator==(Colors const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Colors>) {
        return di::make_fields<"Colors">(di::field<"foreground", &Colors::foreground>,
                                         di::field<"background", &Colors::background>);
    }
};

struct TextStyle {
    bool bold { false };
    bool italics { false };
    bool code { false };
    Colors colors {};

    auto bolded() const -> TextStyle {
        auto result = *this;
        result.bold = true;
        return result;
    }

    auto with_colors(Colors new_colors) const -> TextStyle {
        auto result = *this;
        result.colors = new_colors;
        return result;
    }

    // Flags are combined, colors already present on this style are kept.
    void merge(TextStyle const& other) {
        bold |= other.bold;
        italics |= other.italics;
        code |= other.code;
        colors = colors.or_else(other.colors);
    }

    auto as_graphics_rendition(Colors const& fallback) const -> GraphicsRendition;

    auto operator==(TextStyle const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TextStyle>) {
        return di::make_fields<"TextStyle">(di::field<"bold", &TextStyle::bold>,
                                            di::field<"italics", &TextStyle::italics>,
                                            di::field<"code", &TextStyle::code>,
                                            di::field<"colors", &TextStyle::colors>);
    }
};

struct StyledText {
    di::String text;
    TextStyle style {};

    static auto plain(di::StringView text) -> StyledText { return { text.to_owned(), {} }; }
    static auto styled(di::StringView text, TextStyle style) -> StyledText { return { text.to_owned(), style }; }

    auto clone() const -> StyledText { return { text.clone(), style }; }
    auto width() const -> usize;

    auto operator==(StyledText const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<StyledText>) {
        return di::make_fields<"StyledText">(di::field<"text", &StyledText::text>,
                                             di::field<"style", &StyledText::style>);
    }
};

// A piece of text made up of styled chunks. Chunks are displayed in order.
struct Text {
    di::Vector<StyledText> chunks;

    static auto from(di::StringView text) -> Text;
    static auto from(StyledText text) -> Text;

    auto clone() const -> Text { return { di::clone(chunks) }; }

    // Prepends a chunk, used for list markers and heading prefixes.
    void prepend(StyledText chunk);

    void apply_style(TextStyle const& style);
    auto width() const -> usize;

    auto operator==(Text const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Text>) {
        return di::make_fields<"Text">(di::field<"chunks", &Text::chunks>);
    }
};

// Styled text with its display width already computed.
struct WeightedText {
    StyledText text;
    usize width { 0 };

    static auto from(StyledText text) -> WeightedText;

    auto clone() const -> WeightedText { return { text.clone(), width }; }

    auto operator==(WeightedText const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<WeightedText>) {
        return di::make_fields<"WeightedText">(di::field<"text", &WeightedText::text>,
                                               di::field<"width", &WeightedText::width>);
    }
};

struct WeightedLine {
    di::Vector<WeightedText> texts;
    usize width { 0 };

    static auto from(di::Vector<WeightedText> texts) -> WeightedLine;

    auto clone() const -> WeightedLine { return { di::clone(texts), width }; }

    auto operator==(WeightedLine const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<WeightedLine>) {
        return di::make_fields<"WeightedLine">(di::field<"texts", &WeightedLine::texts>,
                                               di::field<"width", &WeightedLine::width>);
    }
};
}
