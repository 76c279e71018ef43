#include "prez/render_operator.h"

#include "di/container/algorithm/minmax.h"
#include "di/format/prelude.h"

namespace prez {
auto RenderError::describe() const -> di::String {
    switch (kind) {
        case RenderErrorKind::Io:
            return *di::present("io: {}"_sv, message);
        case RenderErrorKind::UnsupportedStructure:
            return *di::present("unsupported structure: {}"_sv, message);
        case RenderErrorKind::Other:
            break;
    }
    return message.clone();
}

auto start_column(Alignment const& alignment, usize width, u32 columns) -> u32 {
    return di::visit(di::overload(
                         [&](LeftAlignment const& left) -> u32 {
                             return left.margin;
                         },
                         [&](RightAlignment const& right) -> u32 {
                             auto used = usize(right.margin) + width;
                             if (used >= columns) {
                                 return 0;
                             }
                             return u32(columns - used);
                         },
                         [&](CenterAlignment const& center) -> u32 {
                             auto minimum_margin = u32(center.minimum_margin);
                             if (usize(columns) < usize(center.minimum_size) + 2 * usize(minimum_margin)) {
                                 return minimum_margin;
                             }
                             if (width >= columns) {
                                 return minimum_margin;
                             }
                             return di::max(u32((columns - width) / 2), minimum_margin);
                         }),
                     alignment);
}

auto RenderOperator::render(RenderOperation const& operation) -> di::Expected<void, RenderError> {
    return di::visit(di::overload(
                         [&](SetColors const& op) -> di::Expected<void, RenderError> {
                             m_current_colors = op.colors;
                             m_backend.set_colors(op.colors);
                             return {};
                         },
                         [&](ClearScreen const&) -> di::Expected<void, RenderError> {
                             m_backend.clear_screen();
                             jump_to_row(0);
                             return {};
                         },
                         [&](RenderTextLine const& op) -> di::Expected<void, RenderError> {
                             render_text(op.texts, op.alignment);
                             return {};
                         },
                         [&](RenderPreformattedLine const& op) -> di::Expected<void, RenderError> {
                             render_preformatted_line(op);
                             return {};
                         },
                         [&](RenderLineBreak const&) -> di::Expected<void, RenderError> {
                             jump_to_row(m_current_row + 1);
                             return {};
                         },
                         [&](RenderSeparator const&) -> di::Expected<void, RenderError> {
                             render_separator();
                             return {};
                         },
                         [&](RenderImage const& op) -> di::Expected<void, RenderError> {
                             return render_image(op.image);
                         },
                         [&](JumpToVerticalCenter const&) -> di::Expected<void, RenderError> {
                             jump_to_row(m_slide_dimensions.rows / 2);
                             return {};
                         },
                         [&](JumpToSlideBottom const&) -> di::Expected<void, RenderError> {
                             jump_to_row(m_slide_dimensions.rows == 0 ? 0 : m_slide_dimensions.rows - 1);
                             return {};
                         },
                         [&](JumpToWindowBottom const&) -> di::Expected<void, RenderError> {
                             jump_to_row(m_window_dimensions.rows == 0 ? 0 : m_window_dimensions.rows - 1);
                             return {};
                         },
                         [&](RenderDynamic const& op) -> di::Expected<void, RenderError> {
                             return render_dynamic(*op.generator);
                         }),
                     operation);
}

void RenderOperator::jump_to_row(u32 row) {
    m_current_row = row;
    m_backend.move_to(row, 0);
}

void RenderOperator::render_text(WeightedLine const& line, Alignment const& alignment) {
    m_backend.move_to_column(start_column(alignment, line.width, m_slide_dimensions.cols));
    for (auto const& text : line.texts) {
        m_backend.print(text.text.text.view(), text.text.style.as_graphics_rendition(m_current_colors));
    }
}

void RenderOperator::render_preformatted_line(RenderPreformattedLine const& line) {
    m_backend.move_to_column(start_column(line.alignment, line.block_length, m_slide_dimensions.cols));

    // Pad up to the block length so that every line of the block has the same background.
    auto text = line.text.clone();
    for (auto i = line.unformatted_length; i < line.block_length; i++) {
        text.push_back(U' ');
    }
    m_backend.print(text.view(), TextStyle {}.with_colors(line.colors).as_graphics_rendition(m_current_colors));
}

void RenderOperator::render_separator() {
    auto separator = di::String {};
    for (auto i = 0_u32; i < m_slide_dimensions.cols; i++) {
        separator.push_back(U'—');
    }
    m_backend.move_to_column(0);
    m_backend.print(separator.view(), TextStyle {}.as_graphics_rendition(m_current_colors));
}

auto RenderOperator::render_image(ImageHandle const& image) -> di::Expected<void, RenderError> {
    auto cell_width = m_window_dimensions.cell_width();
    auto cell_height = m_window_dimensions.cell_height();
    if (cell_width == 0 || cell_height == 0) {
        return di::Unexpected(
            RenderError(RenderErrorKind::UnsupportedStructure, "terminal does not report its size in pixels"_s));
    }

    // Size of the image in cells, rounded up.
    auto columns = (image.width + cell_width - 1) / cell_width;
    auto rows = (image.height + cell_height - 1) / cell_height;

    // Scale down, keeping the aspect ratio, if it doesn't fit in what's left of the slide.
    auto available_rows = m_current_row >= m_slide_dimensions.rows ? 0 : m_slide_dimensions.rows - m_current_row;
    auto available_columns = m_slide_dimensions.cols;
    if (available_rows == 0 || available_columns == 0) {
        return {};
    }
    if (columns > available_columns || rows > available_rows) {
        if (u64(columns) * available_rows > u64(rows) * available_columns) {
            rows = di::max(u32(u64(rows) * available_columns / columns), 1_u32);
            columns = available_columns;
        } else {
            columns = di::max(u32(u64(columns) * available_rows / rows), 1_u32);
            rows = available_rows;
        }
    }

    m_backend.move_to(m_current_row, (available_columns - columns) / 2);
    if (auto result = m_backend.draw_image(image, rows, columns); !result) {
        return di::Unexpected(RenderError(RenderErrorKind::Other,
                                          *di::present("failed to draw image {}"_sv, image.path)));
    }
    jump_to_row(m_current_row + rows);
    return {};
}

auto RenderOperator::render_dynamic(AsRenderOperations const& generator) -> di::Expected<void, RenderError> {
    auto operations = generator.as_render_operations(m_slide_dimensions);
    for (auto const& operation : operations) {
        TRY(render(operation));
    }
    return {};
}
}
