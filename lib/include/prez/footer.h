#pragma once

#include "di/assert/prelude.h"
#include "di/container/string/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "prez/render_operation.h"
#include "prez/theme.h"

namespace prez {
/// @brief State shared by the footers of every slide in a presentation.
///
/// The author is known as soon as the front matter is processed, but the total number of slides
/// is only known once the whole presentation has been built. Footers are resolved at render time,
/// after finalize() has been called.
class FooterContext {
public:
    void set_author(di::String author) { m_author = di::move(author); }
    auto author() const -> di::StringView { return m_author; }

    void finalize(usize total_slides) {
        DI_ASSERT(!m_total_slides);
        m_total_slides = total_slides;
    }

    auto is_finalized() const -> bool { return m_total_slides.has_value(); }

    auto total_slides() const -> usize {
        DI_ASSERT(m_total_slides);
        return *m_total_slides;
    }

private:
    di::String m_author;
    di::Optional<usize> m_total_slides;
};

class FooterGenerator final : public AsRenderOperations {
public:
    explicit FooterGenerator(FooterStyle style, usize current_slide, FooterContext const& context)
        : m_style(di::move(style)), m_current_slide(current_slide), m_context(&context) {}

    auto as_render_operations(WindowSize const& dimensions) const -> di::Vector<RenderOperation> override;
    auto clone() const -> di::Box<AsRenderOperations> override;

    auto current_slide() const -> usize { return m_current_slide; }

private:
    auto render_template(di::StringView text, Colors const& colors) const -> WeightedText;

    FooterStyle m_style;
    usize m_current_slide { 0 };
    FooterContext const* m_context { nullptr };
};
}
