#include "prez/styled_text.h"

#include "prez/text_width.h"

namespace prez {
auto TextStyle::as_graphics_rendition(Colors const& fallback) const -> GraphicsRendition {
    auto effective = colors.or_else(fallback);
    return GraphicsRendition {
        .fg = effective.foreground.value_or(Color()),
        .bg = effective.background.value_or(Color()),
        .bold = bold,
        .italic = italics,
    };
}

auto StyledText::width() const -> usize {
    return display_width(text.view());
}

auto Text::from(di::StringView text) -> Text {
    return from(StyledText::plain(text));
}

auto Text::from(StyledText text) -> Text {
    auto result = Text {};
    result.chunks.push_back(di::move(text));
    return result;
}

void Text::prepend(StyledText chunk) {
    chunks.insert(chunks.begin(), di::move(chunk));
}

void Text::apply_style(TextStyle const& style) {
    for (auto& chunk : chunks) {
        chunk.style.merge(style);
    }
}

auto Text::width() const -> usize {
    auto result = 0_usize;
    for (auto const& chunk : chunks) {
        result += chunk.width();
    }
    return result;
}

auto WeightedText::from(StyledText text) -> WeightedText {
    auto width = text.width();
    return { di::move(text), width };
}

auto WeightedLine::from(di::Vector<WeightedText> texts) -> WeightedLine {
    auto width = 0_usize;
    for (auto const& text : texts) {
        width += text.width;
    }
    return { di::move(texts), width };
}
}
