#pragma once

#include "di/container/path/path.h"
#include "di/container/path/path_view.h"
#include "di/container/string/prelude.h"
#include "di/container/tree/tree_map.h"
#include "di/container/vector/vector.h"
#include "di/vocab/error/result.h"

namespace prez {
enum class ImageFormat {
    Png,
    Other,
};

/// @brief A decoded image.
///
/// Every image is fully decoded when loaded. PNG files are handed to the terminal by path,
/// which decodes them itself, while the RGBA pixels of any other format are sent directly.
struct ImageHandle {
    di::Path path;
    u32 width { 0 };
    u32 height { 0 };
    ImageFormat format { ImageFormat::Png };
    di::Vector<byte> pixels;

    auto clone() const -> ImageHandle { return { path.clone(), width, height, format, pixels.clone() }; }

    auto operator==(ImageHandle const&) const -> bool = default;
};

struct LoadImageError {
    di::String message;

    auto operator==(LoadImageError const&) const -> bool = default;
};

// Loads images referenced by a presentation. Relative paths are resolved against the
// presentation's directory, which should be absolute, and every image is loaded at most once.
class Resources {
public:
    explicit Resources(di::Path base_path) : m_base_path(di::move(base_path)) {}

    auto image(di::StringView path) -> di::Expected<ImageHandle, LoadImageError>;

private:
    di::Path m_base_path;
    di::TreeMap<di::String, ImageHandle> m_images;
};
}
