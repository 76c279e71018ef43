#include "prez/resources.h"

#include "di/format/prelude.h"
#include "di/math/numeric_limits.h"
#include "di/util/scope_exit.h"
#include "di/vocab/array/array.h"
#include "dius/sync_file.h"
#include "prez/paths.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace prez {
constexpr static auto png_signature = di::Array<u8, 8> { 0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a };

static auto read_all(dius::SyncFile& file) -> di::Result<di::Vector<byte>> {
    auto result = di::Vector<byte> {};
    auto buffer = di::Array<byte, 4096> {};
    for (;;) {
        auto nread = TRY(file.read_some(buffer.span()));
        if (nread == 0) {
            return result;
        }
        for (auto i = 0_usize; i < nread; i++) {
            result.push_back(buffer[i]);
        }
    }
}

static auto detect_format(di::Vector<byte> const& contents) -> ImageFormat {
    if (contents.size() < png_signature.size()) {
        return ImageFormat::Other;
    }
    for (auto i = 0_usize; i < png_signature.size(); i++) {
        if (u8(contents[i]) != png_signature[i]) {
            return ImageFormat::Other;
        }
    }
    return ImageFormat::Png;
}

static auto load_image(di::Path path, di::StringView display_path) -> di::Expected<ImageHandle, LoadImageError> {
    auto file = dius::open_sync(path, dius::OpenMode::Readonly);
    if (!file) {
        return di::Unexpected(LoadImageError(*di::present("failed to open image '{}'"_sv, display_path)));
    }
    auto contents = read_all(file.value());
    if (!contents) {
        return di::Unexpected(LoadImageError(*di::present("failed to read image '{}'"_sv, display_path)));
    }
    if (contents.value().size() > usize(di::NumericLimits<i32>::max)) {
        return di::Unexpected(LoadImageError(*di::present("image '{}' is too large"_sv, display_path)));
    }

    auto width = 0;
    auto height = 0;
    auto channels = 0;
    auto* data = stbi_load_from_memory(reinterpret_cast<stbi_uc const*>(contents.value().data()),
                                       i32(contents.value().size()), &width, &height, &channels, 4);
    if (!data) {
        return di::Unexpected(LoadImageError(*di::present("failed to decode image '{}'"_sv, display_path)));
    }
    auto _ = di::ScopeExit([&] {
        stbi_image_free(data);
    });

    auto format = detect_format(contents.value());
    auto pixels = di::Vector<byte> {};
    if (format == ImageFormat::Other) {
        auto size = usize(width) * usize(height) * 4;
        pixels.reserve(size);
        for (auto i = 0_usize; i < size; i++) {
            pixels.push_back(byte(data[i]));
        }
    }
    return ImageHandle { di::move(path), u32(width), u32(height), format, di::move(pixels) };
}

auto Resources::image(di::StringView path) -> di::Expected<ImageHandle, LoadImageError> {
    if (auto cached = m_images.at(path)) {
        return cached->clone();
    }

    auto image = TRY(load_image(resolve_path(m_base_path, path), path));
    m_images.insert_or_assign(path.to_owned(), image.clone());
    return image;
}
}
