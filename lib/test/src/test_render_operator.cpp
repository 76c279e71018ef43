#include "di/test/prelude.h"
#include "mock_backend.h"
#include "prez/footer.h"
#include "prez/render_operator.h"

namespace render_operator {
using namespace prez;
using namespace prez::test;

constexpr auto window = WindowSize { 24, 80, 800, 480 };

static auto make_line(di::StringView text, TextStyle style = {}) -> WeightedLine {
    auto texts = di::Vector<WeightedText> {};
    texts.push_back(WeightedText::from(StyledText::styled(text, style)));
    return WeightedLine::from(di::move(texts));
}

static void start_columns() {
    struct Case {
        Alignment alignment;
        usize width;
        u32 columns;
        u32 expected;
    };

    auto cases = di::Array {
        Case { Alignment(LeftAlignment { 5 }), 10, 80, 5 },
        Case { Alignment(LeftAlignment { 5 }), 100, 80, 5 },
        Case { Alignment(RightAlignment { 1 }), 10, 80, 69 },
        Case { Alignment(RightAlignment { 5 }), 100, 80, 0 },
        Case { Alignment(CenterAlignment { 0, 0 }), 10, 80, 35 },
        Case { Alignment(CenterAlignment { 0, 0 }), 11, 80, 34 },
        // Window too narrow for the minimum size, so the text is left aligned at the minimum margin.
        Case { Alignment(CenterAlignment { 50, 5 }), 10, 40, 5 },
        Case { Alignment(CenterAlignment { 0, 5 }), 78, 80, 5 },
        Case { Alignment(CenterAlignment { 0, 5 }), 90, 80, 5 },
        Case { Alignment(CenterAlignment { 50, 5 }), 10, 60, 25 },
    };

    for (auto const& [alignment, width, columns, expected] : cases) {
        ASSERT_EQ(start_column(alignment, width, columns), expected);
    }
}

static void text() {
    auto backend = MockBackend(window);
    auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);

    auto texts = di::Vector<WeightedText> {};
    texts.push_back(WeightedText::from(StyledText::styled("ab"_sv, TextStyle {}.bolded())));
    texts.push_back(WeightedText::from(StyledText::plain("cd"_sv)));

    auto colors = Colors { Color(Color::White), Color(Color::Black) };
    ASSERT(renderer.render(SetColors { colors }));
    ASSERT(renderer.render(ClearScreen {}));
    ASSERT(renderer.render(RenderLineBreak {}));
    ASSERT(renderer.render(RenderTextLine { WeightedLine::from(di::move(texts)), Alignment(CenterAlignment {}) }));

    ASSERT_EQ(backend.clears, 1u);
    ASSERT_EQ(backend.colors.size(), 1u);
    ASSERT_EQ(renderer.current_colors(), colors);
    ASSERT_EQ(renderer.current_row(), 1u);

    ASSERT_EQ(backend.printed.size(), 2u);
    ASSERT_EQ(backend.printed[0].text, "ab"_sv);
    ASSERT_EQ(backend.printed[0].row, 1u);
    ASSERT_EQ(backend.printed[0].col, 38u);
    ASSERT(backend.printed[0].rendition.bold);
    ASSERT_EQ(backend.printed[0].rendition.fg, Color(Color::White));
    ASSERT_EQ(backend.printed[0].rendition.bg, Color(Color::Black));

    ASSERT_EQ(backend.printed[1].text, "cd"_sv);
    ASSERT_EQ(backend.printed[1].col, 40u);
    ASSERT(!backend.printed[1].rendition.bold);
}

static void text_colors() {
    auto backend = MockBackend(window);
    auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);

    ASSERT(renderer.render(SetColors { Colors { Color(Color::White), Color(Color::Black) } }));
    ASSERT(renderer.render(
        RenderTextLine { make_line("x"_sv, TextStyle {}.with_colors(Colors { Color(Color::Red), {} })), {} }));

    ASSERT_EQ(backend.printed.size(), 1u);
    ASSERT_EQ(backend.printed[0].rendition.fg, Color(Color::Red));
    ASSERT_EQ(backend.printed[0].rendition.bg, Color(Color::Black));
}

static void jumps() {
    struct Case {
        RenderOperation operation;
        u32 expected_row;
    };

    auto cases = di::Array {
        Case { RenderOperation(JumpToVerticalCenter {}), 10 },
        Case { RenderOperation(JumpToSlideBottom {}), 20 },
        Case { RenderOperation(JumpToWindowBottom {}), 23 },
    };

    for (auto const& [operation, expected_row] : cases) {
        auto backend = MockBackend(window);
        auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);
        ASSERT(renderer.render(operation));
        ASSERT_EQ(renderer.current_row(), expected_row);
        ASSERT_EQ(backend.row, expected_row);
        ASSERT_EQ(backend.col, 0u);
    }
}

static void preformatted() {
    auto backend = MockBackend(window);
    auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);

    ASSERT(renderer.render(RenderPreformattedLine { "ab"_s, 2, 5, Alignment(LeftAlignment { 2 }) }));
    ASSERT(renderer.render(RenderPreformattedLine { "苹果"_s, 4, 6, Alignment(CenterAlignment {}) }));

    ASSERT_EQ(backend.printed.size(), 2u);
    ASSERT_EQ(backend.printed[0].text, "ab   "_sv);
    ASSERT_EQ(backend.printed[0].col, 2u);

    // Centered on the block length, not the text.
    ASSERT_EQ(backend.printed[1].text, "苹果  "_sv);
    ASSERT_EQ(backend.printed[1].col, 37u);
}

static void preformatted_colors() {
    auto backend = MockBackend(window);
    auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);

    ASSERT(renderer.render(SetColors { Colors { Color(Color::White), Color(Color::Black) } }));
    auto code_colors = Colors { {}, Color(Color::Blue) };
    auto line = RenderPreformattedLine { "let"_s, 3, 5, Alignment(LeftAlignment { 0 }), code_colors };
    ASSERT(renderer.render(line));

    // The padding shares the line's background, and unset colors fall back to the slide's.
    ASSERT_EQ(backend.printed.size(), 1u);
    ASSERT_EQ(backend.printed[0].text, "let  "_sv);
    ASSERT_EQ(backend.printed[0].rendition.fg, Color(Color::White));
    ASSERT_EQ(backend.printed[0].rendition.bg, Color(Color::Blue));
    ASSERT_EQ(renderer.current_colors(), (Colors { Color(Color::White), Color(Color::Black) }));
}

static void separator() {
    auto size = WindowSize { 10, 8 };
    auto backend = MockBackend(size);
    auto renderer = RenderOperator(backend, size, size);

    ASSERT(renderer.render(RenderSeparator {}));
    ASSERT_EQ(backend.printed.size(), 1u);
    ASSERT_EQ(backend.printed[0].text, "————————"_sv);
    ASSERT_EQ(backend.printed[0].col, 0u);
}

static void image() {
    struct Case {
        u32 width;
        u32 height;
        u32 expected_col;
        u32 expected_rows;
        u32 expected_cols;
    };

    // Cells are 10x20 pixels, and the slide has 21 rows.
    auto cases = di::Array {
        Case { 200, 100, 30, 5, 20 },
        Case { 205, 100, 29, 5, 21 },
        Case { 1600, 960, 5, 21, 70 },
        Case { 1600, 20, 0, 1, 80 },
    };

    for (auto const& [width, height, expected_col, expected_rows, expected_cols] : cases) {
        auto backend = MockBackend(window);
        auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);
        ASSERT(renderer.render(RenderImage { ImageHandle { "/tmp/image.png"_pv.to_owned(), width, height } }));

        ASSERT_EQ(backend.images.size(), 1u);
        ASSERT_EQ(backend.images[0].path, "/tmp/image.png"_pv.to_owned());
        ASSERT_EQ(backend.images[0].row, 0u);
        ASSERT_EQ(backend.images[0].col, expected_col);
        ASSERT_EQ(backend.images[0].rows, expected_rows);
        ASSERT_EQ(backend.images[0].cols, expected_cols);
        ASSERT_EQ(renderer.current_row(), expected_rows);
    }
}

static void image_errors() {
    auto no_pixels = WindowSize { 24, 80 };
    auto backend = MockBackend(no_pixels);
    auto renderer = RenderOperator(backend, no_pixels, no_pixels);

    auto result = renderer.render(RenderImage { ImageHandle { "/tmp/image.png"_pv.to_owned(), 10, 10 } });
    ASSERT(!result);
    ASSERT_EQ(result.error().kind, RenderErrorKind::UnsupportedStructure);

    auto failing = MockBackend(window);
    failing.fail_draw_image = true;
    auto failing_renderer = RenderOperator(failing, window, window);
    auto failed = failing_renderer.render(RenderImage { ImageHandle { "/tmp/image.png"_pv.to_owned(), 10, 10 } });
    ASSERT(!failed);
    ASSERT_EQ(failed.error().kind, RenderErrorKind::Other);
}

static void dynamic() {
    auto context = FooterContext {};
    context.set_author("bob"_s);
    context.finalize(2);

    auto backend = MockBackend(window);
    auto renderer = RenderOperator(backend, window.rows_shrinked(3), window);

    auto style = FooterStyle(TemplateFooter { .left = "{author}"_s, .right = "{current_slide}/{total_slides}"_s });
    auto operation = RenderDynamic { di::make_box<FooterGenerator>(di::move(style), 0, context) };
    ASSERT(renderer.render(operation));

    ASSERT_EQ(backend.printed.size(), 2u);
    ASSERT_EQ(backend.printed[0].text, "bob"_sv);
    ASSERT_EQ(backend.printed[0].row, 23u);
    ASSERT_EQ(backend.printed[0].col, 1u);
    ASSERT_EQ(backend.printed[1].text, "1/2"_sv);
    ASSERT_EQ(backend.printed[1].row, 23u);
    ASSERT_EQ(backend.printed[1].col, 76u);
}

TEST(render_operator, start_columns)
TEST(render_operator, text)
TEST(render_operator, text_colors)
TEST(render_operator, jumps)
TEST(render_operator, preformatted)
TEST(render_operator, preformatted_colors)
TEST(render_operator, separator)
TEST(render_operator, image)
TEST(render_operator, image_errors)
TEST(render_operator, dynamic)
}
