#include "prez/dump.h"

#include "di/format/prelude.h"

namespace prez {
// Escape sequences embedded in preformatted text would otherwise be interpreted by the terminal.
static auto printable(di::StringView text) -> di::String {
    auto result = di::String {};
    for (auto code_point : text) {
        if (code_point == U'\033') {
            result.append("\\e"_sv);
        } else {
            result.push_back(code_point);
        }
    }
    return result;
}

static auto describe_color(di::Optional<Color> const& color) -> di::String {
    if (!color) {
        return "unset"_s;
    }
    switch (color->type) {
        case Color::Type::Default:
            return "default"_s;
        case Color::Type::Palette:
            return *di::present("palette({})"_sv, color->index);
        case Color::Type::Custom:
            return *di::present("rgb({}, {}, {})"_sv, color->r, color->g, color->b);
    }
    return "unset"_s;
}

static auto describe_alignment(Alignment const& alignment) -> di::String {
    return di::visit(di::overload(
                         [](LeftAlignment const& left) {
                             return *di::present("left({})"_sv, left.margin);
                         },
                         [](RightAlignment const& right) {
                             return *di::present("right({})"_sv, right.margin);
                         },
                         [](CenterAlignment const& center) {
                             return *di::present("center({}, {})"_sv, center.minimum_size, center.minimum_margin);
                         }),
                     alignment);
}

auto dump_operations(di::Span<RenderOperation const> operations, WindowSize const& dimensions, usize depth)
    -> di::String {
    auto result = di::String {};
    for (auto const& operation : operations) {
        for (auto i = 0_usize; i < depth; i++) {
            result.append("  "_sv);
        }
        auto line = di::visit(
            di::overload(
                [&](SetColors const& op) {
                    return *di::present("SetColors fg={} bg={}"_sv, describe_color(op.colors.foreground),
                                        describe_color(op.colors.background));
                },
                [&](ClearScreen const&) {
                    return "ClearScreen"_s;
                },
                [&](RenderTextLine const& op) {
                    auto text = di::String {};
                    for (auto const& chunk : op.texts.texts) {
                        text.append(chunk.text.text);
                    }
                    return *di::present("RenderTextLine \"{}\" width={} align={}"_sv, text, op.texts.width,
                                        describe_alignment(op.alignment));
                },
                [&](RenderPreformattedLine const& op) {
                    return *di::present("RenderPreformattedLine \"{}\" unformatted_length={} block_length={} align={}"_sv,
                                        printable(op.text.view()), op.unformatted_length, op.block_length,
                                        describe_alignment(op.alignment));
                },
                [&](RenderLineBreak const&) {
                    return "RenderLineBreak"_s;
                },
                [&](RenderSeparator const&) {
                    return "RenderSeparator"_s;
                },
                [&](RenderImage const& op) {
                    return *di::present("RenderImage {} {}x{}"_sv, op.image.path, op.image.width, op.image.height);
                },
                [&](JumpToVerticalCenter const&) {
                    return "JumpToVerticalCenter"_s;
                },
                [&](JumpToSlideBottom const&) {
                    return "JumpToSlideBottom"_s;
                },
                [&](JumpToWindowBottom const&) {
                    return "JumpToWindowBottom"_s;
                },
                [&](RenderDynamic const&) {
                    return "RenderDynamic"_s;
                }),
            operation);
        result.append(line);
        result.push_back(U'\n');

        if (auto dynamic = di::get_if<RenderDynamic>(operation)) {
            auto generated = dynamic->generator->as_render_operations(dimensions);
            result.append(dump_operations(generated.span(), dimensions, depth + 1));
        }
    }
    return result;
}

auto dump_presentation(Presentation const& presentation, WindowSize const& dimensions) -> di::String {
    auto result = di::String {};
    auto index = 0_usize;
    for (auto const& slide : presentation.slides()) {
        result.append(*di::present("slide {}/{}\n"_sv, ++index, presentation.total_slides()));
        result.append(dump_operations(slide.render_operations.span(), dimensions, 1));
    }
    return result;
}
}
