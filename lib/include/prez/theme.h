#pragma once

#include "di/container/path/path.h"
#include "di/container/path/path_view.h"
#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "prez/styled_text.h"

namespace prez {
struct LeftAlignment {
    u16 margin { 0 };

    auto operator==(LeftAlignment const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<LeftAlignment>) {
        return di::make_fields<"Left">(di::field<"margin", &LeftAlignment::margin>);
    }
};

struct RightAlignment {
    u16 margin { 0 };

    auto operator==(RightAlignment const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<RightAlignment>) {
        return di::make_fields<"Right">(di::field<"margin", &RightAlignment::margin>);
    }
};

// Centered, unless the available width is below minimum_size + 2 * minimum_margin. In that case
// the text is left aligned using minimum_margin.
struct CenterAlignment {
    u16 minimum_size { 0 };
    u16 minimum_margin { 0 };

    auto operator==(CenterAlignment const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CenterAlignment>) {
        return di::make_fields<"Center">(di::field<"minimum_size", &CenterAlignment::minimum_size>,
                                         di::field<"minimum_margin", &CenterAlignment::minimum_margin>);
    }
};

using Alignment = di::Variant<LeftAlignment, RightAlignment, CenterAlignment>;

enum class ElementType {
    SlideTitle,
    Heading1,
    Heading2,
    Heading3,
    Heading4,
    Heading5,
    Heading6,
    Paragraph,
    List,
    Code,
    PresentationTitle,
    PresentationSubTitle,
    PresentationAuthor,
    Table,
    BlockQuote,
};

enum class AuthorPositioning {
    BelowTitle,
    PageBottom,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<AuthorPositioning>) {
    using enum AuthorPositioning;
    return di::make_enumerators<"AuthorPositioning">(di::enumerator<"BelowTitle", BelowTitle>,
                                                     di::enumerator<"PageBottom", PageBottom>);
}

/// @brief Footer made of a left and right template.
///
/// Templates may reference `{current_slide}` (1 indexed), `{total_slides}` and `{author}`.
struct TemplateFooter {
    di::Optional<di::String> left;
    di::Optional<di::String> right;
    Colors colors {};

    auto clone() const -> TemplateFooter { return { left.clone(), right.clone(), colors }; }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TemplateFooter>) {
        return di::make_fields<"Template">(di::field<"left", &TemplateFooter::left>,
                                           di::field<"right", &TemplateFooter::right>,
                                           di::field<"colors", &TemplateFooter::colors>);
    }
};

/// @brief Footer showing a bar which grows as the presentation advances.
struct ProgressBarFooter {
    constexpr static auto default_character = U'█';

    di::Optional<di::String> character;
    Colors colors {};

    auto clone() const -> ProgressBarFooter { return { character.clone(), colors }; }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ProgressBarFooter>) {
        return di::make_fields<"ProgressBar">(di::field<"character", &ProgressBarFooter::character>,
                                              di::field<"colors", &ProgressBarFooter::colors>);
    }
};

struct EmptyFooter {
    auto clone() const -> EmptyFooter { return {}; }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<EmptyFooter>) {
        return di::make_fields<"Empty">();
    }
};

using FooterStyle = di::Variant<TemplateFooter, ProgressBarFooter, EmptyFooter>;

auto clone_footer_style(FooterStyle const& style) -> FooterStyle;

// Every leaf of the theme is optional: an unset value means "use the default". This lets the
// same type describe both a full theme and a partial override of one.

struct BasicStyle {
    di::Optional<Alignment> alignment;
    di::Optional<Colors> colors;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BasicStyle>) {
        return di::make_fields<"BasicStyle">(di::field<"alignment", &BasicStyle::alignment>,
                                             di::field<"colors", &BasicStyle::colors>);
    }
};

struct SlideTitleStyle {
    di::Optional<Alignment> alignment;
    di::Optional<Colors> colors;
    di::Optional<u8> padding_top;
    di::Optional<u8> padding_bottom;
    di::Optional<bool> separator;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SlideTitleStyle>) {
        return di::make_fields<"SlideTitleStyle">(
            di::field<"alignment", &SlideTitleStyle::alignment>, di::field<"colors", &SlideTitleStyle::colors>,
            di::field<"padding_top", &SlideTitleStyle::padding_top>,
            di::field<"padding_bottom", &SlideTitleStyle::padding_bottom>,
            di::field<"separator", &SlideTitleStyle::separator>);
    }
};

struct HeadingStyle {
    di::Optional<Alignment> alignment;
    di::Optional<di::String> prefix;
    di::Optional<Colors> colors;

    auto clone() const -> HeadingStyle { return { alignment, prefix.clone(), colors }; }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<HeadingStyle>) {
        return di::make_fields<"HeadingStyle">(di::field<"alignment", &HeadingStyle::alignment>,
                                               di::field<"prefix", &HeadingStyle::prefix>,
                                               di::field<"colors", &HeadingStyle::colors>);
    }
};

struct HeadingStyles {
    di::Optional<HeadingStyle> h1;
    di::Optional<HeadingStyle> h2;
    di::Optional<HeadingStyle> h3;
    di::Optional<HeadingStyle> h4;
    di::Optional<HeadingStyle> h5;
    di::Optional<HeadingStyle> h6;

    auto clone() const -> HeadingStyles {
        return { h1.clone(), h2.clone(), h3.clone(), h4.clone(), h5.clone(), h6.clone() };
    }

    // Level is clamped to [1, 6].
    auto for_level(u8 level) const -> di::Optional<HeadingStyle> const&;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<HeadingStyles>) {
        return di::make_fields<"HeadingStyles">(
            di::field<"h1", &HeadingStyles::h1>, di::field<"h2", &HeadingStyles::h2>,
            di::field<"h3", &HeadingStyles::h3>, di::field<"h4", &HeadingStyles::h4>,
            di::field<"h5", &HeadingStyles::h5>, di::field<"h6", &HeadingStyles::h6>);
    }
};

struct PaddingRect {
    di::Optional<u8> horizontal;
    di::Optional<u8> vertical;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PaddingRect>) {
        return di::make_fields<"PaddingRect">(di::field<"horizontal", &PaddingRect::horizontal>,
                                              di::field<"vertical", &PaddingRect::vertical>);
    }
};

struct CodeBlockStyle {
    di::Optional<Alignment> alignment;
    di::Optional<PaddingRect> padding;
    di::Optional<Colors> colors;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CodeBlockStyle>) {
        return di::make_fields<"CodeBlockStyle">(di::field<"alignment", &CodeBlockStyle::alignment>,
                                                 di::field<"padding", &CodeBlockStyle::padding>,
                                                 di::field<"colors", &CodeBlockStyle::colors>);
    }
};

struct BlockQuoteStyle {
    di::Optional<Alignment> alignment;
    di::Optional<di::String> prefix;
    di::Optional<Colors> colors;

    auto clone() const -> BlockQuoteStyle { return { alignment, prefix.clone(), colors }; }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BlockQuoteStyle>) {
        return di::make_fields<"BlockQuoteStyle">(di::field<"alignment", &BlockQuoteStyle::alignment>,
                                                  di::field<"prefix", &BlockQuoteStyle::prefix>,
                                                  di::field<"colors", &BlockQuoteStyle::colors>);
    }
};

struct AuthorStyle {
    di::Optional<Alignment> alignment;
    di::Optional<Colors> colors;
    di::Optional<AuthorPositioning> positioning;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<AuthorStyle>) {
        return di::make_fields<"AuthorStyle">(di::field<"alignment", &AuthorStyle::alignment>,
                                              di::field<"colors", &AuthorStyle::colors>,
                                              di::field<"positioning", &AuthorStyle::positioning>);
    }
};

struct IntroSlideStyle {
    di::Optional<BasicStyle> title;
    di::Optional<BasicStyle> subtitle;
    di::Optional<AuthorStyle> author;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<IntroSlideStyle>) {
        return di::make_fields<"IntroSlideStyle">(di::field<"title", &IntroSlideStyle::title>,
                                                  di::field<"subtitle", &IntroSlideStyle::subtitle>,
                                                  di::field<"author", &IntroSlideStyle::author>);
    }
};

struct Theme {
    di::Optional<Alignment> alignment;
    di::Optional<Colors> default_colors;
    di::Optional<SlideTitleStyle> slide_title;
    di::Optional<HeadingStyles> headings;
    di::Optional<CodeBlockStyle> code;
    di::Optional<BlockQuoteStyle> block_quote;
    di::Optional<IntroSlideStyle> intro_slide;
    di::Optional<Alignment> table_alignment;
    di::Optional<FooterStyle> footer;

    auto clone() const -> Theme;

    // Resolved accessors, falling back to defaults for anything left unset.
    auto alignment_for(ElementType element_type) const -> Alignment;
    auto colors() const -> Colors { return default_colors.value_or(Colors {}); }
    auto slide_title_style() const -> SlideTitleStyle { return slide_title.value_or(SlideTitleStyle {}); }
    auto heading_style(u8 level) const -> HeadingStyle;
    auto code_style() const -> CodeBlockStyle { return code.value_or(CodeBlockStyle {}); }
    auto block_quote_style() const -> BlockQuoteStyle;
    auto intro_slide_style() const -> IntroSlideStyle { return intro_slide.value_or(IntroSlideStyle {}); }
    auto footer_style() const -> FooterStyle;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Theme>) {
        return di::make_fields<"Theme">(
            di::field<"alignment", &Theme::alignment>, di::field<"default_colors", &Theme::default_colors>,
            di::field<"slide_title", &Theme::slide_title>, di::field<"headings", &Theme::headings>,
            di::field<"code", &Theme::code>, di::field<"block_quote", &Theme::block_quote>,
            di::field<"intro_slide", &Theme::intro_slide>, di::field<"table_alignment", &Theme::table_alignment>,
            di::field<"footer", &Theme::footer>);
    }
};

/// @brief Merge overrides onto base.
///
/// Fields set in overrides replace the ones in base, unset fields fall through to base. Nested
/// styles are merged recursively, while alignments and footer styles are replaced as a whole.
auto merge_theme(Theme const& base, Theme const& overrides) -> Theme;

auto dark_theme() -> Theme;
auto light_theme() -> Theme;

struct LoadThemeError {
    di::String message;

    auto operator==(LoadThemeError const&) const -> bool = default;
};

class ThemeProvider {
public:
    virtual ~ThemeProvider() = default;

    virtual auto lookup_by_name(di::StringView name) const -> di::Optional<Theme> = 0;
    virtual auto load_from_path(di::PathView path) const -> di::Expected<Theme, LoadThemeError> = 0;
};

// Provides the built-in themes by name, and loads JSON theme files.
class BuiltinThemeProvider final : public ThemeProvider {
public:
    auto lookup_by_name(di::StringView name) const -> di::Optional<Theme> override;
    auto load_from_path(di::PathView path) const -> di::Expected<Theme, LoadThemeError> override;
};

auto parse_theme(di::StringView json) -> di::Optional<Theme>;
}
