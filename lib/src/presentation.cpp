#include "prez/presentation.h"

namespace prez {
auto Presentation::current_slide() const -> Slide const& {
    DI_ASSERT(!m_slides.empty());
    return m_slides[m_current_slide_index];
}

auto Presentation::jump_next() -> bool {
    if (m_current_slide_index + 1 >= m_slides.size()) {
        return false;
    }
    m_current_slide_index++;
    return true;
}

auto Presentation::jump_previous() -> bool {
    if (m_current_slide_index == 0) {
        return false;
    }
    m_current_slide_index--;
    return true;
}

auto Presentation::jump_first() -> bool {
    return jump_to(0);
}

auto Presentation::jump_last() -> bool {
    if (m_slides.empty()) {
        return false;
    }
    return jump_to(m_slides.size() - 1);
}

auto Presentation::jump_to(usize index) -> bool {
    if (index >= m_slides.size() || index == m_current_slide_index) {
        return false;
    }
    m_current_slide_index = index;
    return true;
}
}
