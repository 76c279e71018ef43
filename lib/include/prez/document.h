#pragma once

#include "di/container/path/path_view.h"
#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/error/result.h"
#include "prez/elements.h"

namespace prez {
// A parsed presentation, as stored on disk.
struct Document {
    di::Vector<Element> elements;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Document>) {
        return di::make_fields<"Document">(di::field<"elements", &Document::elements>);
    }
};

auto parse_document(di::StringView json) -> di::Result<Document>;
auto load_document(di::PathView path) -> di::Result<Document>;
}
