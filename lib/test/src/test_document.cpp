#include "di/test/prelude.h"
#include "prez/builder.h"
#include "prez/document.h"
#include "prez/dump.h"

namespace document {
using namespace prez;

constexpr auto example = R"({
    "elements": [
        { "FrontMatter": { "contents": "{\"title\": \"demo\"}" } },
        { "Heading": { "level": 2, "text": { "chunks": [
            { "text": "hello", "style": { "bold": false, "italics": false, "code": false, "colors": {} } }
        ] } } },
        { "Comment": { "text": "end_slide" } },
        { "Code": { "contents": "let x = 1;\n", "language": "rust" } }
    ]
})"_sv;

static void parse() {
    auto document = parse_document(example);
    ASSERT(document);

    auto const& elements = document.value().elements;
    ASSERT_EQ(elements.size(), 4u);
    ASSERT(di::holds_alternative<FrontMatter>(elements[0]));

    auto heading = di::get_if<Heading>(elements[1]);
    ASSERT(heading);
    ASSERT_EQ(heading->level, 2);
    ASSERT_EQ(heading->text.chunks.size(), 1u);
    ASSERT_EQ(heading->text.chunks[0].text, "hello"_sv);

    auto code = di::get_if<Code>(elements[3]);
    ASSERT(code);
    ASSERT_EQ(code->language, "rust"_sv);

    ASSERT(!parse_document("{"_sv));
    ASSERT(!parse_document(R"({ "elements": [ { "Bogus": {} } ] })"_sv));
}

static void dump() {
    auto document = parse_document(example);
    ASSERT(document);

    auto highlighter = PlainHighlighter {};
    auto resources = Resources({});
    auto provider = BuiltinThemeProvider {};
    auto theme = Theme {};
    theme.footer = FooterStyle(TemplateFooter { .left = "{current_slide}/{total_slides}"_s });
    auto builder = PresentationBuilder(highlighter, theme, resources, provider);
    auto presentation = builder.build(di::move(document).value().elements);
    ASSERT(presentation);

    auto output = dump_presentation(presentation.value(), WindowSize { 24, 80 });
    auto expected = R"(slide 1/3
  SetColors fg=unset bg=unset
  ClearScreen
  RenderLineBreak
  JumpToVerticalCenter
  RenderTextLine "demo" width=4 align=left(0)
  RenderLineBreak
  RenderDynamic
    JumpToWindowBottom
    RenderTextLine "1/3" width=3 align=left(1)
slide 2/3
  SetColors fg=unset bg=unset
  ClearScreen
  RenderLineBreak
  RenderTextLine "hello" width=5 align=left(0)
  RenderLineBreak
  RenderLineBreak
  RenderDynamic
    JumpToWindowBottom
    RenderTextLine "2/3" width=3 align=left(1)
slide 3/3
  SetColors fg=unset bg=unset
  ClearScreen
  RenderLineBreak
  RenderPreformattedLine "let x = 1;" unformatted_length=10 block_length=10 align=left(0)
  RenderLineBreak
  RenderLineBreak
  RenderDynamic
    JumpToWindowBottom
    RenderTextLine "3/3" width=3 align=left(1)
)"_sv;
    ASSERT_EQ(output, expected);
}

TEST(document, parse)
TEST(document, dump)
}
