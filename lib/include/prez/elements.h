#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "prez/styled_text.h"

// Structural elements of a parsed document. These are produced by a document parser and consumed
// exactly once by the presentation builder.
namespace prez {
struct FrontMatter {
    di::String contents;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<FrontMatter>) {
        return di::make_fields<"FrontMatter">(di::field<"contents", &FrontMatter::contents>);
    }
};

// A heading underlined with `===` or `---`, used as a slide's title.
struct SetexHeading {
    Text text;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SetexHeading>) {
        return di::make_fields<"SetexHeading">(di::field<"text", &SetexHeading::text>);
    }
};

struct Heading {
    u8 level { 1 };
    Text text;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Heading>) {
        return di::make_fields<"Heading">(di::field<"level", &Heading::level>, di::field<"text", &Heading::text>);
    }
};

struct LineBreak {
    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<LineBreak>) {
        return di::make_fields<"LineBreak">();
    }
};

using ParagraphElement = di::Variant<Text, LineBreak>;

struct Paragraph {
    di::Vector<ParagraphElement> elements;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Paragraph>) {
        return di::make_fields<"Paragraph">(di::field<"elements", &Paragraph::elements>);
    }
};

struct Unordered {
    auto operator==(Unordered const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Unordered>) {
        return di::make_fields<"Unordered">();
    }
};

// Ordered item rendered as `N) `.
struct OrderedParens {
    u32 number { 1 };

    auto operator==(OrderedParens const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OrderedParens>) {
        return di::make_fields<"OrderedParens">(di::field<"number", &OrderedParens::number>);
    }
};

// Ordered item rendered as `N. `.
struct OrderedPeriod {
    u32 number { 1 };

    auto operator==(OrderedPeriod const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<OrderedPeriod>) {
        return di::make_fields<"OrderedPeriod">(di::field<"number", &OrderedPeriod::number>);
    }
};

using ListItemType = di::Variant<Unordered, OrderedParens, OrderedPeriod>;

struct ListItem {
    u8 depth { 0 };
    ListItemType item_type { Unordered {} };
    Text contents;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ListItem>) {
        return di::make_fields<"ListItem">(di::field<"depth", &ListItem::depth>,
                                           di::field<"item_type", &ListItem::item_type>,
                                           di::field<"contents", &ListItem::contents>);
    }
};

struct List {
    di::Vector<ListItem> items;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<List>) {
        return di::make_fields<"List">(di::field<"items", &List::items>);
    }
};

struct Code {
    di::String contents;
    di::String language;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Code>) {
        return di::make_fields<"Code">(di::field<"contents", &Code::contents>,
                                       di::field<"language", &Code::language>);
    }
};

struct TableRow {
    di::Vector<Text> cells;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<TableRow>) {
        return di::make_fields<"TableRow">(di::field<"cells", &TableRow::cells>);
    }
};

struct Table {
    TableRow header;
    di::Vector<TableRow> rows;

    auto columns() const -> usize { return header.cells.size(); }

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Table>) {
        return di::make_fields<"Table">(di::field<"header", &Table::header>, di::field<"rows", &Table::rows>);
    }
};

struct ThematicBreak {
    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<ThematicBreak>) {
        return di::make_fields<"ThematicBreak">();
    }
};

// An HTML comment. Its text may hold a builder directive.
struct Comment {
    di::String text;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Comment>) {
        return di::make_fields<"Comment">(di::field<"text", &Comment::text>);
    }
};

struct BlockQuote {
    di::Vector<di::String> lines;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BlockQuote>) {
        return di::make_fields<"BlockQuote">(di::field<"lines", &BlockQuote::lines>);
    }
};

struct Image {
    di::String path;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Image>) {
        return di::make_fields<"Image">(di::field<"path", &Image::path>);
    }
};

using Element = di::Variant<FrontMatter, SetexHeading, Heading, Paragraph, List, Code, Table, ThematicBreak, Comment,
                            BlockQuote, Image>;
}
