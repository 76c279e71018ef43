#include "prez/document.h"

#include "di/serialization/json_deserializer.h"
#include "dius/sync_file.h"

namespace prez {
auto parse_document(di::StringView json) -> di::Result<Document> {
    return di::from_json_string<Document>(json);
}

auto load_document(di::PathView path) -> di::Result<Document> {
    auto file = TRY(dius::open_sync(path, dius::OpenMode::Readonly));
    auto contents = TRY(di::read_to_string(file));
    return parse_document(contents.view());
}
}
