#include "prez/builder.h"

#include "di/container/algorithm/minmax.h"
#include "di/format/prelude.h"
#include "di/serialization/json_deserializer.h"
#include "di/util/clamp.h"
#include "prez/paths.h"
#include "prez/text_width.h"

namespace prez {
static auto repeat(di::StringView text, usize count) -> di::String {
    auto result = di::String {};
    for (auto i = 0_usize; i < count; i++) {
        result.append(text);
    }
    return result;
}

static auto clone_or_empty(di::Optional<di::String> const& text) -> di::String {
    if (!text) {
        return {};
    }
    return text->clone();
}

auto parse_metadata(di::StringView contents) -> di::Optional<PresentationMetadata> {
    auto result = di::from_json_string<PresentationMetadata>(contents);
    if (!result) {
        return {};
    }
    return di::move(result).value();
}

auto BuildError::describe() const -> di::String {
    switch (kind) {
        case BuildErrorKind::InvalidMetadata:
            return *di::present("invalid presentation metadata: {}"_sv, message);
        case BuildErrorKind::InvalidTheme:
            return *di::present("invalid theme: {}"_sv, message);
        case BuildErrorKind::LoadImage:
            return *di::present("loading image: {}"_sv, message);
    }
    return message.clone();
}

PresentationBuilder::PresentationBuilder(CodeHighlighter const& highlighter, Theme const& default_theme,
                                         Resources& resources, ThemeProvider const& theme_provider)
    : m_highlighter(highlighter)
    , m_theme(default_theme.clone())
    , m_resources(resources)
    , m_theme_provider(theme_provider)
    , m_footer_context(di::make_box<FooterContext>()) {}

auto PresentationBuilder::build(di::Vector<Element> elements) -> di::Expected<Presentation, BuildError> {
    // The front matter affects how every other element is rendered, so it goes first.
    if (!elements.empty()) {
        if (auto front_matter = di::get_if<FrontMatter>(elements[0])) {
            TRY(process_front_matter(front_matter->contents.view()));
        }
    }
    if (m_slide_operations.empty()) {
        push_slide_prelude();
    }
    for (auto& element : elements) {
        m_ignore_element_line_break = false;
        TRY(process_element(di::move(element)));
        if (!m_ignore_element_line_break) {
            push_line_break();
        }
    }
    if (!m_slide_operations.empty()) {
        terminate_slide();
    }
    m_footer_context->finalize(m_slides.size());

    return Presentation(di::move(m_slides), di::move(m_footer_context));
}

void PresentationBuilder::push_slide_prelude() {
    m_slide_operations.push_back(SetColors { m_theme.colors() });
    m_slide_operations.push_back(ClearScreen {});
    push_line_break();
}

auto PresentationBuilder::process_element(Element element) -> di::Expected<void, BuildError> {
    auto is_list = di::holds_alternative<List>(element);
    TRY(di::visit(di::overload(
                      [&](FrontMatter&) -> di::Expected<void, BuildError> {
                          m_ignore_element_line_break = true;
                          return {};
                      },
                      [&](SetexHeading& heading) -> di::Expected<void, BuildError> {
                          push_slide_title(di::move(heading.text));
                          return {};
                      },
                      [&](Heading& heading) -> di::Expected<void, BuildError> {
                          push_heading(heading.level, di::move(heading.text));
                          return {};
                      },
                      [&](Paragraph& paragraph) -> di::Expected<void, BuildError> {
                          push_paragraph(di::move(paragraph.elements));
                          return {};
                      },
                      [&](List& list) -> di::Expected<void, BuildError> {
                          push_list(di::move(list.items));
                          return {};
                      },
                      [&](Code& code) -> di::Expected<void, BuildError> {
                          push_code(code);
                          return {};
                      },
                      [&](Table& table) -> di::Expected<void, BuildError> {
                          push_table(di::move(table));
                          return {};
                      },
                      [&](ThematicBreak&) -> di::Expected<void, BuildError> {
                          terminate_slide();
                          return {};
                      },
                      [&](Comment& comment) -> di::Expected<void, BuildError> {
                          process_comment(comment.text.view());
                          return {};
                      },
                      [&](BlockQuote& block_quote) -> di::Expected<void, BuildError> {
                          push_block_quote(block_quote.lines);
                          return {};
                      },
                      [&](Image& image) -> di::Expected<void, BuildError> {
                          return push_image(image.path.view());
                      }),
                  element));
    m_last_element_is_list = is_list;
    return {};
}

auto PresentationBuilder::process_front_matter(di::StringView contents) -> di::Expected<void, BuildError> {
    auto metadata = parse_metadata(contents);
    if (!metadata) {
        return di::Unexpected(BuildError(BuildErrorKind::InvalidMetadata, "front matter is not a valid JSON object"_s));
    }

    m_footer_context->set_author(clone_or_empty(metadata->author));
    if (metadata->theme) {
        TRY(set_theme(*metadata->theme));
    }
    if (metadata->title || metadata->sub_title || metadata->author) {
        push_slide_prelude();
        push_intro_slide(*metadata);
    }
    return {};
}

auto PresentationBuilder::set_theme(PresentationThemeMetadata const& metadata) -> di::Expected<void, BuildError> {
    if (metadata.name && metadata.path) {
        return di::Unexpected(
            BuildError(BuildErrorKind::InvalidMetadata, "cannot have both theme path and theme name"_s));
    }
    if (metadata.name) {
        auto theme = m_theme_provider.lookup_by_name(metadata.name->view());
        if (!theme) {
            return di::Unexpected(BuildError(BuildErrorKind::InvalidMetadata,
                                             *di::present("theme '{}' does not exist"_sv, *metadata.name)));
        }
        m_theme = di::move(theme).value();
    }
    if (metadata.path) {
        auto theme = m_theme_provider.load_from_path(to_path(metadata.path->view()));
        if (!theme) {
            return di::Unexpected(BuildError(BuildErrorKind::InvalidTheme, di::move(theme).error().message));
        }
        m_theme = di::move(theme).value();
    }
    if (metadata.overrides) {
        m_theme = merge_theme(m_theme, *metadata.overrides);
    }
    return {};
}

void PresentationBuilder::push_intro_slide(PresentationMetadata const& metadata) {
    auto styles = m_theme.intro_slide_style();
    auto title_colors = styles.title.value_or(BasicStyle {}).colors.value_or(Colors {});
    auto subtitle_colors = styles.subtitle.value_or(BasicStyle {}).colors.value_or(Colors {});
    auto author_style = styles.author.value_or(AuthorStyle {});

    auto title = StyledText { clone_or_empty(metadata.title),
                              TextStyle {}.bolded().with_colors(title_colors) };

    m_slide_operations.push_back(JumpToVerticalCenter {});
    push_text(Text::from(di::move(title)), ElementType::PresentationTitle);
    push_line_break();
    if (metadata.sub_title) {
        push_text(Text::from(StyledText { metadata.sub_title->clone(), TextStyle {}.with_colors(subtitle_colors) }),
                  ElementType::PresentationSubTitle);
        push_line_break();
    }
    if (metadata.author) {
        switch (author_style.positioning.value_or(AuthorPositioning::BelowTitle)) {
            case AuthorPositioning::BelowTitle:
                push_line_break();
                push_line_break();
                push_line_break();
                break;
            case AuthorPositioning::PageBottom:
                m_slide_operations.push_back(JumpToSlideBottom {});
                break;
        }
        push_text(Text::from(StyledText { metadata.author->clone(),
                                          TextStyle {}.with_colors(author_style.colors.value_or(Colors {})) }),
                  ElementType::PresentationAuthor);
    }
    terminate_slide();
}

void PresentationBuilder::process_comment(di::StringView comment) {
    if (comment == "pause"_sv) {
        process_pause();
    } else if (comment == "end_slide"_sv) {
        terminate_slide();
    }
}

void PresentationBuilder::process_pause() {
    // Drop the trailing line break after a list, so that revealing list items one at a time doesn't
    // leave a gap between them.
    if (m_last_element_is_list && !m_slide_operations.empty() &&
        di::holds_alternative<RenderLineBreak>(*m_slide_operations.back())) {
        m_slide_operations.pop_back();
    }

    auto next_operations = clone_operations(m_slide_operations);
    terminate_slide();
    m_slide_operations = di::move(next_operations);
}

void PresentationBuilder::push_slide_title(Text text) {
    auto style = m_theme.slide_title_style();
    text.apply_style(TextStyle {}.bolded().with_colors(style.colors.value_or(Colors {})));

    for (auto i = 0_u8; i < style.padding_top.value_or(0); i++) {
        push_line_break();
    }
    push_text(di::move(text), ElementType::SlideTitle);
    push_line_break();

    for (auto i = 0_u8; i < style.padding_bottom.value_or(0); i++) {
        push_line_break();
    }
    if (style.separator.value_or(false)) {
        m_slide_operations.push_back(RenderSeparator {});
    }
    push_line_break();
    m_ignore_element_line_break = true;
}

void PresentationBuilder::push_heading(u8 level, Text text) {
    level = di::clamp(level, u8(1), u8(6));
    auto element_type = ElementType(int(ElementType::Heading1) + level - 1);
    auto style = m_theme.heading_style(level);
    if (style.prefix) {
        auto prefix = style.prefix->clone();
        prefix.push_back(U' ');
        text.prepend(StyledText { di::move(prefix), {} });
    }
    text.apply_style(TextStyle {}.bolded().with_colors(style.colors.value_or(Colors {})));

    push_text(di::move(text), element_type);
    push_line_break();
}

void PresentationBuilder::push_paragraph(di::Vector<ParagraphElement> elements) {
    for (auto& element : elements) {
        // Line breaks inside a paragraph need no handling: every text is already followed by one.
        if (auto text = di::get_if<Text>(element)) {
            push_text(di::move(*text), ElementType::Paragraph);
            push_line_break();
        }
    }
}

auto PresentationBuilder::push_image(di::StringView path) -> di::Expected<void, BuildError> {
    auto image = m_resources.image(path);
    if (!image) {
        return di::Unexpected(BuildError(BuildErrorKind::LoadImage, di::move(image).error().message));
    }
    m_slide_operations.push_back(RenderImage { di::move(image).value() });
    return {};
}

void PresentationBuilder::push_list(di::Vector<ListItem> items) {
    for (auto& item : items) {
        push_list_item(di::move(item));
    }
}

void PresentationBuilder::push_list_item(ListItem item) {
    auto prefix = repeat(" "_sv, (usize(item.depth) + 1) * 2);
    di::visit(di::overload(
                  [&](Unordered const&) {
                      switch (item.depth) {
                          case 0:
                              prefix.push_back(U'•');
                              break;
                          case 1:
                              prefix.push_back(U'◦');
                              break;
                          default:
                              prefix.push_back(U'▪');
                              break;
                      }
                  },
                  [&](OrderedParens const& ordered) {
                      prefix.append(*di::present("{}) "_sv, ordered.number));
                  },
                  [&](OrderedPeriod const& ordered) {
                      prefix.append(*di::present("{}. "_sv, ordered.number));
                  }),
              item.item_type);
    prefix.push_back(U' ');

    auto text = di::move(item.contents);
    text.prepend(StyledText { di::move(prefix), {} });
    push_text(di::move(text), ElementType::List);
    push_line_break();
}

void PresentationBuilder::push_block_quote(di::Vector<di::String> const& lines) {
    auto style = m_theme.block_quote_style();
    auto prefix = clone_or_empty(style.prefix);
    auto prefix_width = display_width(prefix.view());
    auto alignment = m_theme.alignment_for(ElementType::BlockQuote);

    auto block_length = 0_usize;
    for (auto const& line : lines) {
        block_length = di::max(block_length, display_width(line.view()) + prefix_width);
    }

    m_slide_operations.push_back(SetColors { style.colors.value_or(Colors {}).or_else(m_theme.colors()) });
    for (auto const& line : lines) {
        auto text = prefix.clone();
        text.append(line.view());

        auto line_length = display_width(text.view());
        m_slide_operations.push_back(RenderPreformattedLine { di::move(text), line_length, block_length, alignment });
        push_line_break();
    }
    m_slide_operations.push_back(SetColors { m_theme.colors() });
}

void PresentationBuilder::push_code(Code const& code) {
    auto style = m_theme.code_style();
    auto padding = style.padding.value_or(PaddingRect {});
    auto horizontal_padding = usize(padding.horizontal.value_or(0));
    auto vertical_padding = padding.vertical.value_or(0);

    auto contents = di::String {};
    if (horizontal_padding == 0 && vertical_padding == 0) {
        contents = code.contents.clone();
    } else {
        if (vertical_padding > 0) {
            contents.push_back(U'\n');
        }
        auto horizontal = repeat(" "_sv, horizontal_padding);
        for (auto line : split_lines(code.contents.view())) {
            contents.append(horizontal.view());
            contents.append(line);
            contents.push_back(U'\n');
        }
        if (vertical_padding > 0) {
            contents.push_back(U'\n');
        }
    }

    auto block_length = 0_usize;
    for (auto line : split_lines(contents.view())) {
        block_length = di::max(block_length, display_width(line));
    }
    block_length += horizontal_padding;

    auto colors = style.colors.value_or(Colors {});
    auto alignment = m_theme.alignment_for(ElementType::Code);
    for (auto const& code_line : m_highlighter.highlight(contents.view(), code.language.view())) {
        auto trimmed = trim_end(code_line.formatted.view());
        auto trailing_width = display_width(code_line.formatted.view()) - display_width(trimmed);
        auto unformatted_length = display_width(code_line.original.view()) - trailing_width;

        m_slide_operations.push_back(
            RenderPreformattedLine { trimmed.to_owned(), unformatted_length, block_length, alignment, colors });
        push_line_break();
    }
}

static auto prepare_table_row(TableRow row, di::Vector<usize> const& widths) -> Text {
    auto result = Text {};
    for (auto column = 0_usize; column < row.cells.size() && column < widths.size(); column++) {
        if (column > 0) {
            result.chunks.push_back(StyledText::plain(" │ "_sv));
        }
        auto& cell = row.cells[column];
        auto text_length = cell.width();
        for (auto& chunk : cell.chunks) {
            result.chunks.push_back(di::move(chunk));
        }

        auto cell_width = widths[column];
        if (text_length < cell_width) {
            result.chunks.push_back(StyledText { repeat(" "_sv, cell_width - text_length), {} });
        }
    }
    return result;
}

void PresentationBuilder::push_table(Table table) {
    auto widths = di::Vector<usize> {};
    for (auto column = 0_usize; column < table.columns(); column++) {
        auto width = table.header.cells[column].width();
        for (auto const& row : table.rows) {
            if (column < row.cells.size()) {
                width = di::max(width, row.cells[column].width());
            }
        }
        widths.push_back(width);
    }

    push_text(prepare_table_row(di::move(table.header), widths), ElementType::Table);
    push_line_break();

    auto separator = Text {};
    for (auto index = 0_usize; index < widths.size(); index++) {
        auto contents = di::String {};
        auto extra_lines = 1_usize;
        if (index > 0) {
            contents.push_back(U'┼');
            extra_lines++;
        }
        contents.append(repeat("─"_sv, widths[index] + extra_lines));
        separator.chunks.push_back(StyledText { di::move(contents), {} });
    }
    push_text(di::move(separator), ElementType::Table);
    push_line_break();

    for (auto& row : table.rows) {
        push_text(prepare_table_row(di::move(row), widths), ElementType::Table);
        push_line_break();
    }
}

void PresentationBuilder::push_text(Text text, ElementType element_type) {
    auto alignment = m_theme.alignment_for(element_type);
    auto code_colors = m_theme.code_style().colors.value_or(Colors {});

    auto texts = di::Vector<WeightedText> {};
    for (auto& chunk : text.chunks) {
        if (chunk.style.code) {
            chunk.style.colors = code_colors;
        }
        texts.push_back(WeightedText::from(di::move(chunk)));
    }
    if (!texts.empty()) {
        m_slide_operations.push_back(RenderTextLine { WeightedLine::from(di::move(texts)), alignment });
    }
}

void PresentationBuilder::push_line_break() {
    m_slide_operations.push_back(RenderLineBreak {});
}

void PresentationBuilder::terminate_slide() {
    push_footer();

    m_slides.push_back(Slide { di::move(m_slide_operations) });
    m_slide_operations = {};
    push_slide_prelude();
    m_ignore_element_line_break = true;
}

void PresentationBuilder::push_footer() {
    auto generator = di::make_box<FooterGenerator>(m_theme.footer_style(), m_slides.size(), *m_footer_context);
    m_slide_operations.push_back(RenderDynamic { di::move(generator) });
}
}
