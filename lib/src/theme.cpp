#include "prez/theme.h"

#include "di/format/prelude.h"
#include "di/serialization/json_deserializer.h"
#include "di/util/clamp.h"
#include "dius/sync_file.h"

namespace prez {
auto clone_footer_style(FooterStyle const& style) -> FooterStyle {
    return di::visit(
        [](auto const& footer) -> FooterStyle {
            return footer.clone();
        },
        style);
}

static auto clone_value(FooterStyle const& style) -> FooterStyle {
    return clone_footer_style(style);
}

template<typename T>
static auto clone_value(T const& value) -> T {
    return di::clone(value);
}

template<typename T>
static auto clone_optional(di::Optional<T> const& value) -> di::Optional<T> {
    if (!value) {
        return {};
    }
    return clone_value(*value);
}

auto Theme::clone() const -> Theme {
    return {
        alignment,
        default_colors,
        slide_title,
        clone_optional(headings),
        code,
        clone_optional(block_quote),
        intro_slide,
        table_alignment,
        clone_optional(footer),
    };
}

auto HeadingStyles::for_level(u8 level) const -> di::Optional<HeadingStyle> const& {
    switch (di::clamp(level, u8(1), u8(6))) {
        case 1:
            return h1;
        case 2:
            return h2;
        case 3:
            return h3;
        case 4:
            return h4;
        case 5:
            return h5;
        default:
            return h6;
    }
}

auto Theme::heading_style(u8 level) const -> HeadingStyle {
    if (!headings) {
        return {};
    }
    return clone_optional(headings->for_level(level)).value_or(HeadingStyle {});
}

auto Theme::block_quote_style() const -> BlockQuoteStyle {
    return clone_optional(block_quote).value_or(BlockQuoteStyle {});
}

auto Theme::footer_style() const -> FooterStyle {
    return clone_optional(footer).value_or(FooterStyle(EmptyFooter {}));
}

auto Theme::alignment_for(ElementType element_type) const -> Alignment {
    auto specific = [&] -> di::Optional<Alignment> {
        switch (element_type) {
            case ElementType::SlideTitle:
                return slide_title_style().alignment;
            case ElementType::Heading1:
            case ElementType::Heading2:
            case ElementType::Heading3:
            case ElementType::Heading4:
            case ElementType::Heading5:
            case ElementType::Heading6:
                return heading_style(u8(int(element_type) - int(ElementType::Heading1) + 1)).alignment;
            case ElementType::Code:
                return code_style().alignment;
            case ElementType::PresentationTitle:
                return intro_slide_style().title.value_or(BasicStyle {}).alignment;
            case ElementType::PresentationSubTitle:
                return intro_slide_style().subtitle.value_or(BasicStyle {}).alignment;
            case ElementType::PresentationAuthor:
                return intro_slide_style().author.value_or(AuthorStyle {}).alignment;
            case ElementType::Table:
                return table_alignment;
            case ElementType::BlockQuote:
                return block_quote_style().alignment;
            case ElementType::Paragraph:
            case ElementType::List:
                return {};
        }
        return {};
    }();
    return specific.value_or(alignment.value_or(Alignment(LeftAlignment {})));
}

// Merging: anything that knows how to merge itself is merged recursively, everything else is a
// leaf and gets replaced.
static void merge_into(Colors& base, Colors const& overrides);
static void merge_into(BasicStyle& base, BasicStyle const& overrides);
static void merge_into(SlideTitleStyle& base, SlideTitleStyle const& overrides);
static void merge_into(HeadingStyle& base, HeadingStyle const& overrides);
static void merge_into(HeadingStyles& base, HeadingStyles const& overrides);
static void merge_into(PaddingRect& base, PaddingRect const& overrides);
static void merge_into(CodeBlockStyle& base, CodeBlockStyle const& overrides);
static void merge_into(BlockQuoteStyle& base, BlockQuoteStyle const& overrides);
static void merge_into(AuthorStyle& base, AuthorStyle const& overrides);
static void merge_into(IntroSlideStyle& base, IntroSlideStyle const& overrides);

template<typename T>
concept Mergeable = requires(T& base, T const& overrides) { merge_into(base, overrides); };

template<typename T>
static void merge_field(di::Optional<T>& base, di::Optional<T> const& overrides) {
    if (!overrides) {
        return;
    }
    if constexpr (Mergeable<T>) {
        if (base) {
            merge_into(*base, *overrides);
            return;
        }
    }
    base = clone_value(*overrides);
}

static void merge_into(Colors& base, Colors const& overrides) {
    merge_field(base.foreground, overrides.foreground);
    merge_field(base.background, overrides.background);
}

static void merge_into(BasicStyle& base, BasicStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.colors, overrides.colors);
}

static void merge_into(SlideTitleStyle& base, SlideTitleStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.colors, overrides.colors);
    merge_field(base.padding_top, overrides.padding_top);
    merge_field(base.padding_bottom, overrides.padding_bottom);
    merge_field(base.separator, overrides.separator);
}

static void merge_into(HeadingStyle& base, HeadingStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.prefix, overrides.prefix);
    merge_field(base.colors, overrides.colors);
}

static void merge_into(HeadingStyles& base, HeadingStyles const& overrides) {
    merge_field(base.h1, overrides.h1);
    merge_field(base.h2, overrides.h2);
    merge_field(base.h3, overrides.h3);
    merge_field(base.h4, overrides.h4);
    merge_field(base.h5, overrides.h5);
    merge_field(base.h6, overrides.h6);
}

static void merge_into(PaddingRect& base, PaddingRect const& overrides) {
    merge_field(base.horizontal, overrides.horizontal);
    merge_field(base.vertical, overrides.vertical);
}

static void merge_into(CodeBlockStyle& base, CodeBlockStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.padding, overrides.padding);
    merge_field(base.colors, overrides.colors);
}

static void merge_into(BlockQuoteStyle& base, BlockQuoteStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.prefix, overrides.prefix);
    merge_field(base.colors, overrides.colors);
}

static void merge_into(AuthorStyle& base, AuthorStyle const& overrides) {
    merge_field(base.alignment, overrides.alignment);
    merge_field(base.colors, overrides.colors);
    merge_field(base.positioning, overrides.positioning);
}

static void merge_into(IntroSlideStyle& base, IntroSlideStyle const& overrides) {
    merge_field(base.title, overrides.title);
    merge_field(base.subtitle, overrides.subtitle);
    merge_field(base.author, overrides.author);
}

auto merge_theme(Theme const& base, Theme const& overrides) -> Theme {
    auto result = base.clone();
    merge_field(result.alignment, overrides.alignment);
    merge_field(result.default_colors, overrides.default_colors);
    merge_field(result.slide_title, overrides.slide_title);
    merge_field(result.headings, overrides.headings);
    merge_field(result.code, overrides.code);
    merge_field(result.block_quote, overrides.block_quote);
    merge_field(result.intro_slide, overrides.intro_slide);
    merge_field(result.table_alignment, overrides.table_alignment);
    merge_field(result.footer, overrides.footer);
    return result;
}

static auto fg(Color color) -> Colors {
    return { color, {} };
}

static auto heading(di::StringView prefix, Color color) -> HeadingStyle {
    return { {}, prefix.to_owned(), fg(color) };
}

auto dark_theme() -> Theme {
    auto const orange = Color(0xee, 0x93, 0x22);
    auto const cyan = Color(0x03, 0xb5, 0xe0);
    auto const lavender = Color(0xb4, 0xcc, 0xff);
    auto const code_bg = Color(0x29, 0x2e, 0x42);

    auto theme = Theme {};
    theme.alignment = Alignment(LeftAlignment { .margin = 5 });
    theme.default_colors = Colors { Color(0xe6, 0xe6, 0xe6), Color(0x04, 0x03, 0x12) };
    theme.slide_title = SlideTitleStyle {
        .alignment = Alignment(CenterAlignment {}),
        .colors = fg(orange),
        .padding_top = 1,
        .padding_bottom = 1,
        .separator = true,
    };
    theme.headings = HeadingStyles {
        heading("██"_sv, cyan),      heading("▓▓▓"_sv, orange),    heading("▒▒▒▒"_sv, lavender),
        heading("░░░░░"_sv, lavender), heading("░░░░░░"_sv, lavender), heading("░░░░░░░"_sv, lavender),
    };
    theme.code = CodeBlockStyle {
        .alignment = Alignment(CenterAlignment { .minimum_size = 50, .minimum_margin = 5 }),
        .padding = PaddingRect { .horizontal = 2, .vertical = 1 },
        .colors = Colors { {}, code_bg },
    };
    theme.block_quote = BlockQuoteStyle {
        .alignment = {},
        .prefix = "▍ "_s,
        .colors = Colors { Color(0xf0, 0xf0, 0xf0), code_bg },
    };
    theme.intro_slide = IntroSlideStyle {
        .title = BasicStyle { .alignment = Alignment(CenterAlignment {}), .colors = fg(orange) },
        .subtitle = BasicStyle { .alignment = Alignment(CenterAlignment {}), .colors = fg(lavender) },
        .author = AuthorStyle { .alignment = Alignment(CenterAlignment {}),
                                .colors = fg(lavender),
                                .positioning = AuthorPositioning::PageBottom },
    };
    theme.footer = FooterStyle(TemplateFooter {
        .left = "{author}"_s,
        .right = "{current_slide} / {total_slides}"_s,
        .colors = fg(lavender),
    });
    return theme;
}

auto light_theme() -> Theme {
    auto const blue = Color(0x1b, 0x4d, 0x89);
    auto const red = Color(0xa6, 0x26, 0x26);
    auto const grey = Color(0x5c, 0x5c, 0x5c);
    auto const code_bg = Color(0xe6, 0xe6, 0xe6);

    auto theme = dark_theme();
    theme.default_colors = Colors { Color(0x21, 0x21, 0x21), Color(0xff, 0xff, 0xff) };
    theme.slide_title->colors = fg(red);
    theme.headings = HeadingStyles {
        heading("██"_sv, blue),    heading("▓▓▓"_sv, red),     heading("▒▒▒▒"_sv, grey),
        heading("░░░░░"_sv, grey), heading("░░░░░░"_sv, grey), heading("░░░░░░░"_sv, grey),
    };
    theme.code->colors = Colors { {}, code_bg };
    theme.block_quote->colors = Colors { Color(0x21, 0x21, 0x21), code_bg };
    theme.intro_slide = IntroSlideStyle {
        .title = BasicStyle { .alignment = Alignment(CenterAlignment {}), .colors = fg(red) },
        .subtitle = BasicStyle { .alignment = Alignment(CenterAlignment {}), .colors = fg(blue) },
        .author = AuthorStyle { .alignment = Alignment(CenterAlignment {}),
                                .colors = fg(blue),
                                .positioning = AuthorPositioning::PageBottom },
    };
    theme.footer = FooterStyle(ProgressBarFooter { .character = {}, .colors = fg(blue) });
    return theme;
}

auto parse_theme(di::StringView json) -> di::Optional<Theme> {
    auto result = di::from_json_string<Theme>(json);
    if (!result) {
        return {};
    }
    return di::move(result).value();
}

auto BuiltinThemeProvider::lookup_by_name(di::StringView name) const -> di::Optional<Theme> {
    if (name == "dark"_sv) {
        return dark_theme();
    }
    if (name == "light"_sv) {
        return light_theme();
    }
    return {};
}

auto BuiltinThemeProvider::load_from_path(di::PathView path) const -> di::Expected<Theme, LoadThemeError> {
    auto file = dius::open_sync(path, dius::OpenMode::Readonly);
    if (!file) {
        return di::Unexpected(LoadThemeError(*di::present("failed to open theme file {}"_sv, path)));
    }
    auto contents = di::read_to_string(file.value());
    if (!contents) {
        return di::Unexpected(LoadThemeError(*di::present("failed to read theme file {}"_sv, path)));
    }
    auto theme = parse_theme(contents.value().view());
    if (!theme) {
        return di::Unexpected(LoadThemeError(*di::present("theme file {} is not a valid theme"_sv, path)));
    }
    return di::move(theme).value();
}
}
