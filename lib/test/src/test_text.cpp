#include "di/test/prelude.h"
#include "prez/highlighting.h"
#include "prez/paths.h"
#include "prez/styled_text.h"
#include "prez/text_width.h"

namespace text {
using namespace prez;

static void width() {
    struct Case {
        di::StringView text;
        usize expected;
    };

    auto cases = di::Array {
        Case { ""_sv, 0 },         Case { "abc"_sv, 3 },  Case { "苹果"_sv, 4 },
        Case { "a苹b"_sv, 4 },     Case { "é"_sv, 1 },    Case { "\033"_sv, 0 },
        Case { "• item"_sv, 6 },
    };

    for (auto const& [text, expected] : cases) {
        ASSERT_EQ(display_width(text), expected);
    }
}

static void trim() {
    struct Case {
        di::StringView text;
        di::StringView expected;
    };

    auto cases = di::Array {
        Case { "ab  \n"_sv, "ab"_sv }, Case { "   "_sv, ""_sv },      Case { "a b"_sv, "a b"_sv },
        Case { ""_sv, ""_sv },         Case { "  a\t"_sv, "  a"_sv }, Case { "苹果 "_sv, "苹果"_sv },
    };

    for (auto const& [text, expected] : cases) {
        ASSERT_EQ(trim_end(text), expected);
    }
}

static void lines() {
    auto lines = split_lines("a\nb\n"_sv);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0], "a"_sv);
    ASSERT_EQ(lines[1], "b"_sv);

    lines = split_lines("a\n\nb"_sv);
    ASSERT_EQ(lines.size(), 3u);
    ASSERT_EQ(lines[1], ""_sv);

    ASSERT(split_lines(""_sv).empty());

    auto highlighted = PlainHighlighter {}.highlight("x = 1\ny\n"_sv, "python"_sv);
    ASSERT_EQ(highlighted.size(), 2u);
    ASSERT_EQ(highlighted[0].formatted, "x = 1"_sv);
    ASSERT_EQ(highlighted[0].original, "x = 1"_sv);
}

static void apply_style() {
    auto text = Text::from(StyledText::styled("a"_sv, TextStyle {}.with_colors(Colors { Color(Color::Red), {} })));
    text.chunks.push_back(StyledText::styled("b"_sv, TextStyle { .italics = true }));
    text.prepend(StyledText::plain("> "_sv));

    text.apply_style(TextStyle {}.bolded().with_colors(Colors { Color(Color::Blue), Color(Color::Green) }));

    ASSERT_EQ(text.chunks.size(), 3u);
    ASSERT_EQ(text.chunks[0].text, "> "_sv);
    ASSERT_EQ(text.width(), 4u);

    for (auto const& chunk : text.chunks) {
        ASSERT(chunk.style.bold);
        ASSERT_EQ(chunk.style.colors.background, Color(Color::Green));
    }

    // Colors already set on a chunk win.
    ASSERT_EQ(text.chunks[0].style.colors.foreground, Color(Color::Blue));
    ASSERT_EQ(text.chunks[1].style.colors.foreground, Color(Color::Red));
    ASSERT(text.chunks[2].style.italics);
    ASSERT(!text.chunks[1].style.italics);
}

static void weighted() {
    auto texts = di::Vector<WeightedText> {};
    texts.push_back(WeightedText::from(StyledText::plain("苹果"_sv)));
    texts.push_back(WeightedText::from(StyledText::plain("ab"_sv)));

    ASSERT_EQ(texts[0].width, 4u);
    auto line = WeightedLine::from(di::move(texts));
    ASSERT_EQ(line.width, 6u);
}

static void paths() {
    ASSERT_EQ(parent_directory("/a/b/c.json"_pv), "/a/b"_pv.to_owned());
    ASSERT_EQ(parent_directory("/c.json"_pv), "/"_pv.to_owned());
    ASSERT(parent_directory("c.json"_pv).data().empty());
    ASSERT_EQ(parent_directory("a/c.json"_pv), "a"_pv.to_owned());

    ASSERT_EQ(resolve_path("/base"_pv, "x.png"_sv), "/base/x.png"_pv.to_owned());
    ASSERT_EQ(resolve_path("/base"_pv, "/abs.png"_sv), "/abs.png"_pv.to_owned());
    ASSERT_EQ(resolve_path(""_pv, "x.png"_sv), "x.png"_pv.to_owned());

    ASSERT_EQ(absolute_path("deck.json"_pv, "/home/me"_pv), "/home/me/deck.json"_pv.to_owned());
    ASSERT_EQ(absolute_path("talks/deck.json"_pv, "/home/me"_pv), "/home/me/talks/deck.json"_pv.to_owned());
    ASSERT_EQ(absolute_path("/srv/deck.json"_pv, "/home/me"_pv), "/srv/deck.json"_pv.to_owned());
    ASSERT_EQ(parent_directory(absolute_path("deck.json"_pv, "/home/me"_pv)), "/home/me"_pv.to_owned());
}

TEST(text, width)
TEST(text, trim)
TEST(text, lines)
TEST(text, apply_style)
TEST(text, weighted)
TEST(text, paths)
}
