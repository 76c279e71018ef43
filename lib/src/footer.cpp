#include "prez/footer.h"

#include "di/container/algorithm/minmax.h"
#include "di/format/prelude.h"
#include "prez/text_width.h"

namespace prez {
static auto replace_all(di::StringView text, di::StringView pattern, di::StringView replacement) -> di::String {
    auto result = di::String {};
    for (;;) {
        auto match = text.find(pattern);
        if (match.empty()) {
            result.append(text);
            return result;
        }
        result.append(text.substr(text.begin(), match.begin()));
        result.append(replacement);
        text = text.substr(match.end());
    }
}

auto FooterGenerator::render_template(di::StringView text, Colors const& colors) const -> WeightedText {
    auto current_slide = di::to_string(m_current_slide + 1);
    auto total_slides = di::to_string(m_context->total_slides());

    auto contents = replace_all(text, "{current_slide}"_sv, current_slide.view());
    contents = replace_all(contents.view(), "{total_slides}"_sv, total_slides.view());
    contents = replace_all(contents.view(), "{author}"_sv, m_context->author());
    return WeightedText::from(StyledText { di::move(contents), TextStyle {}.with_colors(colors) });
}

auto FooterGenerator::as_render_operations(WindowSize const& dimensions) const -> di::Vector<RenderOperation> {
    auto result = di::Vector<RenderOperation> {};
    auto push_line = [&](WeightedText text, Alignment alignment) {
        auto texts = di::Vector<WeightedText> {};
        texts.push_back(di::move(text));
        result.push_back(JumpToWindowBottom {});
        result.push_back(RenderTextLine { WeightedLine::from(di::move(texts)), alignment });
    };

    di::visit(di::overload(
                  [&](TemplateFooter const& footer) {
                      if (footer.left) {
                          push_line(render_template(footer.left->view(), footer.colors), LeftAlignment { 1 });
                      }
                      if (footer.right) {
                          push_line(render_template(footer.right->view(), footer.colors), RightAlignment { 1 });
                      }
                  },
                  [&](ProgressBarFooter const& footer) {
                      auto character = footer.character.transform([](di::String const& c) {
                                                           return c.clone();
                                                       })
                                           .value_or(di::String {});
                      if (character.empty()) {
                          character.push_back(ProgressBarFooter::default_character);
                      }

                      auto total_slides = m_context->total_slides();
                      if (total_slides == 0) {
                          return;
                      }

                      // Round up so the last slide always fills the whole bar.
                      auto total_columns = usize(dimensions.cols) / di::max(display_width(character.view()), 1_usize);
                      auto progress = total_columns * (m_current_slide + 1);
                      auto glyphs = (progress + total_slides - 1) / total_slides;

                      auto bar = di::String {};
                      for (auto i = 0_usize; i < glyphs; i++) {
                          bar.append(character.view());
                      }
                      push_line(WeightedText::from(StyledText { di::move(bar), TextStyle {}.with_colors(footer.colors) }),
                                LeftAlignment { 0 });
                  },
                  [&](EmptyFooter const&) {}),
              m_style);
    return result;
}

auto FooterGenerator::clone() const -> di::Box<AsRenderOperations> {
    return di::make_box<FooterGenerator>(clone_footer_style(m_style), m_current_slide, *m_context);
}
}
