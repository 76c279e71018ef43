#include "di/test/prelude.h"
#include "prez/graphics_rendition.h"
#include "prez/styled_text.h"

namespace graphics_rendition {
using namespace prez;

static void as_sgr() {
    struct Case {
        GraphicsRendition rendition;
        di::StringView expected;
    };

    auto cases = di::Array {
        Case { {}, "\033[0m"_sv },
        Case { { .bold = true }, "\033[0;1m"_sv },
        Case { { .bold = true, .italic = true }, "\033[0;1;3m"_sv },
        Case { { .fg = Color(Color::Red) }, "\033[0;31m"_sv },
        Case { { .fg = Color(Color::BrightRed), .bg = Color(Color::Black) }, "\033[0;91;40m"_sv },
        Case { { .bg = Color(Color::BrightWhite) }, "\033[0;107m"_sv },
        Case { { .bg = Color(Color::White), .italic = true }, "\033[0;3;47m"_sv },
        Case { { .fg = Color(1, 2, 3), .bold = true }, "\033[0;1;38;2;1;2;3m"_sv },
        Case { { .fg = Color(255, 0, 16), .bg = Color(0, 0, 0) }, "\033[0;38;2;255;0;16;48;2;0;0;0m"_sv },
    };

    for (auto const& [rendition, expected] : cases) {
        ASSERT_EQ(rendition.as_sgr(), expected);
    }
}

static void from_style() {
    auto style = TextStyle { .bold = true, .italics = true, .code = false, .colors = { {}, Color(Color::Blue) } };
    auto rendition = style.as_graphics_rendition(Colors { Color(Color::White), Color(Color::Black) });

    ASSERT_EQ(rendition, (GraphicsRendition {
                             .fg = Color(Color::White),
                             .bg = Color(Color::Blue),
                             .bold = true,
                             .italic = true,
                         }));

    auto plain = TextStyle {}.as_graphics_rendition({});
    ASSERT_EQ(plain, GraphicsRendition {});
}

TEST(graphics_rendition, as_sgr)
TEST(graphics_rendition, from_style)
}
