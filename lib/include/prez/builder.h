#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/pointer/box.h"
#include "prez/elements.h"
#include "prez/footer.h"
#include "prez/highlighting.h"
#include "prez/presentation.h"
#include "prez/render_operation.h"
#include "prez/resources.h"
#include "prez/theme.h"

namespace prez {
struct PresentationThemeMetadata {
    di::Optional<di::String> name;
    di::Optional<di::String> path;
    di::Optional<Theme> overrides;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PresentationThemeMetadata>) {
        return di::make_fields<"PresentationThemeMetadata">(
            di::field<"name", &PresentationThemeMetadata::name>, di::field<"path", &PresentationThemeMetadata::path>,
            di::field<"override", &PresentationThemeMetadata::overrides>);
    }
};

// Contents of the front matter at the top of a presentation.
struct PresentationMetadata {
    di::Optional<di::String> title;
    di::Optional<di::String> sub_title;
    di::Optional<di::String> author;
    di::Optional<PresentationThemeMetadata> theme;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<PresentationMetadata>) {
        return di::make_fields<"PresentationMetadata">(
            di::field<"title", &PresentationMetadata::title>, di::field<"sub_title", &PresentationMetadata::sub_title>,
            di::field<"author", &PresentationMetadata::author>, di::field<"theme", &PresentationMetadata::theme>);
    }
};

auto parse_metadata(di::StringView contents) -> di::Optional<PresentationMetadata>;

enum class BuildErrorKind {
    InvalidMetadata,
    InvalidTheme,
    LoadImage,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BuildErrorKind>) {
    using enum BuildErrorKind;
    return di::make_enumerators<"BuildErrorKind">(di::enumerator<"InvalidMetadata", InvalidMetadata>,
                                                  di::enumerator<"InvalidTheme", InvalidTheme>,
                                                  di::enumerator<"LoadImage", LoadImage>);
}

struct BuildError {
    BuildErrorKind kind { BuildErrorKind::InvalidMetadata };
    di::String message;

    // Human readable description, prefixed by what kind of failure this is.
    auto describe() const -> di::String;

    auto operator==(BuildError const&) const -> bool = default;
};

/// @brief Turns document elements into a presentation.
///
/// Each element is translated into render operations which are accumulated into the current slide.
/// Slides are terminated by thematic breaks, `end_slide` comments and `pause` comments. A builder
/// is meant to build a single presentation.
class PresentationBuilder {
public:
    explicit PresentationBuilder(CodeHighlighter const& highlighter, Theme const& default_theme, Resources& resources,
                                 ThemeProvider const& theme_provider);

    auto build(di::Vector<Element> elements) -> di::Expected<Presentation, BuildError>;

private:
    auto process_front_matter(di::StringView contents) -> di::Expected<void, BuildError>;
    auto set_theme(PresentationThemeMetadata const& metadata) -> di::Expected<void, BuildError>;
    auto process_element(Element element) -> di::Expected<void, BuildError>;

    void push_slide_prelude();
    void push_intro_slide(PresentationMetadata const& metadata);
    void process_comment(di::StringView comment);
    void process_pause();
    void push_slide_title(Text text);
    void push_heading(u8 level, Text text);
    void push_paragraph(di::Vector<ParagraphElement> elements);
    auto push_image(di::StringView path) -> di::Expected<void, BuildError>;
    void push_list(di::Vector<ListItem> items);
    void push_list_item(ListItem item);
    void push_block_quote(di::Vector<di::String> const& lines);
    void push_code(Code const& code);
    void push_table(Table table);
    void push_text(Text text, ElementType element_type);
    void push_line_break();
    void terminate_slide();
    void push_footer();

    di::Vector<RenderOperation> m_slide_operations;
    di::Vector<Slide> m_slides;
    CodeHighlighter const& m_highlighter;
    Theme m_theme;
    Resources& m_resources;
    ThemeProvider const& m_theme_provider;
    bool m_ignore_element_line_break { false };
    bool m_last_element_is_list { false };
    di::Box<FooterContext> m_footer_context;
};
}
