#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/pointer/box.h"
#include "prez/footer.h"
#include "prez/render_operation.h"

namespace prez {
// A built presentation: its slides plus the cursor pointing at the slide being shown.
class Presentation {
public:
    explicit Presentation(di::Vector<Slide> slides, di::Box<FooterContext> footer_context)
        : m_slides(di::move(slides)), m_footer_context(di::move(footer_context)) {}

    auto slides() const -> di::Span<Slide const> { return m_slides.span(); }
    auto current_slide() const -> Slide const&;
    auto current_slide_index() const -> usize { return m_current_slide_index; }
    auto total_slides() const -> usize { return m_slides.size(); }
    auto footer_context() const -> FooterContext const& { return *m_footer_context; }

    // Each jump returns true if the current slide changed.
    auto jump_next() -> bool;
    auto jump_previous() -> bool;
    auto jump_first() -> bool;
    auto jump_last() -> bool;
    auto jump_to(usize index) -> bool;

private:
    di::Vector<Slide> m_slides;
    di::Box<FooterContext> m_footer_context;
    usize m_current_slide_index { 0 };
};
}
