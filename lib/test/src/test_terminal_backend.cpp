#include "di/test/prelude.h"
#include "di/vocab/array/array.h"
#include "dius/sync_file.h"
#include "prez/terminal_backend.h"

namespace terminal_backend {
using namespace prez;

constexpr auto output_path = "/tmp/prez-test-backend.out"_pv;

static auto read_output() -> di::String {
    auto file = dius::open_sync(output_path, dius::OpenMode::Readonly);
    if (!file) {
        return {};
    }
    return di::read_to_string(file.value()).value_or(di::String {});
}

static void draw_png() {
    auto output = dius::open_sync(output_path, dius::OpenMode::WriteClobber);
    ASSERT(output);
    auto backend = AnsiTerminalBackend(output.value());

    ASSERT(backend.draw_image(ImageHandle { "/a.png"_pv.to_owned(), 10, 10 }, 2, 3));
    ASSERT(backend.flush());
    ASSERT_EQ(read_output(), "\033_Gf=100,t=f,a=T,q=2,c=3,r=2;L2EucG5n\033\\"_sv);

    // The terminal resolves paths itself, so relative ones would point somewhere else.
    ASSERT(!backend.draw_image(ImageHandle { "a.png"_pv.to_owned(), 10, 10 }, 2, 3));
}

static void draw_pixels() {
    auto output = dius::open_sync(output_path, dius::OpenMode::WriteClobber);
    ASSERT(output);
    auto backend = AnsiTerminalBackend(output.value());

    auto pixels = di::Vector<byte> {};
    for (auto value : di::Array<u8, 4> { 255, 0, 0, 255 }) {
        pixels.push_back(byte(value));
    }
    auto image = ImageHandle { "/a.jpg"_pv.to_owned(), 1, 1, ImageFormat::Other, di::move(pixels) };
    ASSERT(backend.draw_image(image, 1, 1));
    ASSERT(backend.flush());
    ASSERT_EQ(read_output(), "\033_Gf=32,s=1,v=1,a=T,q=2,c=1,r=1,m=0;/wAA/w==\033\\"_sv);

    auto empty = ImageHandle { "/a.jpg"_pv.to_owned(), 1, 1, ImageFormat::Other, {} };
    ASSERT(!backend.draw_image(empty, 1, 1));
}

static void draw_pixels_chunked() {
    auto output = dius::open_sync(output_path, dius::OpenMode::WriteClobber);
    ASSERT(output);
    auto backend = AnsiTerminalBackend(output.value());

    // One pixel more than fits in a single chunk.
    auto pixels = di::Vector<byte> {};
    for (auto i = 0_usize; i < 769 * 4; i++) {
        pixels.push_back(byte(0));
    }
    auto image = ImageHandle { "/a.jpg"_pv.to_owned(), 769, 1, ImageFormat::Other, di::move(pixels) };
    ASSERT(backend.draw_image(image, 1, 80));
    ASSERT(backend.flush());

    auto written = read_output();
    auto first = "\033_Gf=32,s=769,v=1,a=T,q=2,c=80,r=1,m=1;"_sv;
    auto last = "\033\\\033_Gm=0;AAAAAA==\033\\"_sv;
    ASSERT(written.starts_with(first));
    ASSERT(written.ends_with(last));
    ASSERT_EQ(written.size_bytes(), first.size_bytes() + 4096 + last.size_bytes());
}

TEST(terminal_backend, draw_png)
TEST(terminal_backend, draw_pixels)
TEST(terminal_backend, draw_pixels_chunked)
}
