#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/variant/prelude.h"
#include "prez/resources.h"
#include "prez/size.h"
#include "prez/styled_text.h"
#include "prez/theme.h"

namespace prez {
class AsRenderOperations;

// Changes the colors used for the remainder of the slide.
struct SetColors {
    Colors colors;

    auto operator==(SetColors const&) const -> bool = default;
};

// Clears the entire screen using the current colors.
struct ClearScreen {
    auto operator==(ClearScreen const&) const -> bool = default;
};

struct RenderTextLine {
    WeightedLine texts;
    Alignment alignment;

    auto clone() const -> RenderTextLine { return { texts.clone(), alignment }; }

    auto operator==(RenderTextLine const&) const -> bool = default;
};

/// @brief A line of text which may carry its own escape sequences.
///
/// The text is written as is, in colors, which fall back to the current colors. unformatted_length
/// is the number of visible columns the text occupies, and the line is padded with spaces up to
/// block_length so that all lines of a block have the same background.
struct RenderPreformattedLine {
    di::String text;
    usize unformatted_length { 0 };
    usize block_length { 0 };
    Alignment alignment;
    Colors colors;

    auto clone() const -> RenderPreformattedLine {
        return { text.clone(), unformatted_length, block_length, alignment, colors };
    }

    auto operator==(RenderPreformattedLine const&) const -> bool = default;
};

struct RenderLineBreak {
    auto operator==(RenderLineBreak const&) const -> bool = default;
};

// A horizontal line which spans the whole window.
struct RenderSeparator {
    auto operator==(RenderSeparator const&) const -> bool = default;
};

struct RenderImage {
    ImageHandle image;

    auto clone() const -> RenderImage { return { image.clone() }; }

    auto operator==(RenderImage const&) const -> bool = default;
};

struct JumpToVerticalCenter {
    auto operator==(JumpToVerticalCenter const&) const -> bool = default;
};

struct JumpToSlideBottom {
    auto operator==(JumpToSlideBottom const&) const -> bool = default;
};

struct JumpToWindowBottom {
    auto operator==(JumpToWindowBottom const&) const -> bool = default;
};

/// @brief Operations which are only generated once the window dimensions are known.
///
/// This is used for things like the footer, whose layout depends on the window size.
struct RenderDynamic {
    di::Box<AsRenderOperations> generator;

    auto clone() const -> RenderDynamic;
};

using RenderOperation =
    di::Variant<SetColors, ClearScreen, RenderTextLine, RenderPreformattedLine, RenderLineBreak, RenderSeparator,
                RenderImage, JumpToVerticalCenter, JumpToSlideBottom, JumpToWindowBottom, RenderDynamic>;

auto clone_operation(RenderOperation const& operation) -> RenderOperation;
auto clone_operations(di::Vector<RenderOperation> const& operations) -> di::Vector<RenderOperation>;

class AsRenderOperations {
public:
    virtual ~AsRenderOperations() = default;

    virtual auto as_render_operations(WindowSize const& dimensions) const -> di::Vector<RenderOperation> = 0;
    virtual auto clone() const -> di::Box<AsRenderOperations> = 0;
};

inline auto RenderDynamic::clone() const -> RenderDynamic {
    return { generator->clone() };
}

struct Slide {
    di::Vector<RenderOperation> render_operations;

    auto clone() const -> Slide { return { clone_operations(render_operations) }; }
};
}
