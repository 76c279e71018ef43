#include "di/test/prelude.h"
#include "prez/footer.h"

namespace footer {
using namespace prez;

static auto make_context(di::StringView author, usize total_slides) -> FooterContext {
    auto context = FooterContext {};
    context.set_author(author.to_owned());
    context.finalize(total_slides);
    return context;
}

static auto text_of(RenderOperation const& operation) -> di::String {
    auto result = di::String {};
    auto line = di::get_if<RenderTextLine>(operation);
    if (!line) {
        return result;
    }
    for (auto const& text : line->texts.texts) {
        result.append(text.text.text.view());
    }
    return result;
}

static void template_footer() {
    auto context = make_context("bob"_sv, 3);
    auto style = FooterStyle(TemplateFooter {
        .left = "{author}"_s,
        .right = "{current_slide} / {total_slides} {current_slide}"_s,
        .colors = Colors { Color(Color::Green), {} },
    });
    auto generator = FooterGenerator(di::move(style), 1, context);

    auto operations = generator.as_render_operations(WindowSize { 24, 80 });
    ASSERT_EQ(operations.size(), 4u);
    ASSERT(di::holds_alternative<JumpToWindowBottom>(operations[0]));
    ASSERT_EQ(text_of(operations[1]), "bob"_sv);
    ASSERT(di::holds_alternative<JumpToWindowBottom>(operations[2]));
    ASSERT_EQ(text_of(operations[3]), "2 / 3 2"_sv);

    auto const& left = *di::get_if<RenderTextLine>(operations[1]);
    ASSERT(left.alignment == Alignment(LeftAlignment { 1 }));
    ASSERT_EQ(left.texts.texts[0].text.style.colors.foreground, Color(Color::Green));

    auto const& right = *di::get_if<RenderTextLine>(operations[3]);
    ASSERT(right.alignment == Alignment(RightAlignment { 1 }));
    ASSERT_EQ(right.texts.width, 7u);
}

static void template_footer_one_side() {
    auto context = make_context(""_sv, 1);
    auto generator = FooterGenerator(FooterStyle(TemplateFooter { .left = {}, .right = "{author}!"_s }), 0, context);

    auto operations = generator.as_render_operations(WindowSize { 24, 80 });
    ASSERT_EQ(operations.size(), 2u);
    ASSERT_EQ(text_of(operations[1]), "!"_sv);
}

static void progress_bar() {
    struct Case {
        usize current_slide;
        usize total_slides;
        u32 columns;
        usize expected_glyphs;
    };

    auto cases = di::Array {
        Case { 0, 4, 80, 20 }, Case { 1, 4, 80, 40 }, Case { 3, 4, 80, 80 },
        Case { 0, 3, 10, 4 },  Case { 2, 3, 10, 10 }, Case { 0, 1, 7, 7 },
    };

    for (auto const& [current_slide, total_slides, columns, expected_glyphs] : cases) {
        auto context = make_context(""_sv, total_slides);
        auto generator = FooterGenerator(FooterStyle(ProgressBarFooter {}), current_slide, context);

        auto operations = generator.as_render_operations(WindowSize { 24, columns });
        ASSERT_EQ(operations.size(), 2u);

        auto const& line = *di::get_if<RenderTextLine>(operations[1]);
        ASSERT(line.alignment == Alignment(LeftAlignment { 0 }));
        ASSERT_EQ(line.texts.width, expected_glyphs);
    }
}

static void progress_bar_wide_character() {
    auto context = make_context(""_sv, 2);
    auto generator = FooterGenerator(FooterStyle(ProgressBarFooter { .character = "果"_s }), 1, context);

    auto operations = generator.as_render_operations(WindowSize { 24, 20 });
    ASSERT_EQ(operations.size(), 2u);
    ASSERT_EQ(text_of(operations[1]), "果果果果果果果果果果"_sv);
}

static void empty_footer() {
    auto context = make_context("bob"_sv, 2);
    auto generator = FooterGenerator(FooterStyle(EmptyFooter {}), 0, context);
    ASSERT(generator.as_render_operations(WindowSize { 24, 80 }).empty());
}

static void clone_generator() {
    auto context = make_context("bob"_sv, 2);
    auto generator = FooterGenerator(FooterStyle(TemplateFooter { .left = "{author}"_s }), 0, context);

    auto copy = generator.clone();
    auto operations = copy->as_render_operations(WindowSize { 24, 80 });
    ASSERT_EQ(operations.size(), 2u);
    ASSERT_EQ(text_of(operations[1]), "bob"_sv);
}

TEST(footer, template_footer)
TEST(footer, template_footer_one_side)
TEST(footer, progress_bar)
TEST(footer, progress_bar_wide_character)
TEST(footer, empty_footer)
TEST(footer, clone_generator)
}
