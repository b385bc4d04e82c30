#include "board/core/types.h"

namespace board {

namespace {
    constexpr const char* kPortNames[kPortCount] = {"n", "e", "s", "w", "nw", "ne", "se", "sw"};

    TableData makeDefaultTable() {
        TableData table{};
        table.columns = {"c1", "c2", "c3"};
        table.rows = {"r1", "r2", "r3"};
        for (const auto& col : table.columns) table.columnWidths[col] = 120.0;
        for (const auto& row : table.rows) table.rowHeights[row] = 32.0;
        return table;
    }
}

bool operator==(const TextStyle& a, const TextStyle& b) {
    return a.bold == b.bold && a.italic == b.italic && a.size == b.size;
}

bool operator==(const StickyData& a, const StickyData& b) {
    return a.text == b.text && a.color == b.color;
}

bool operator==(const ShapeData& a, const ShapeData& b) {
    return a.shapeKind == b.shapeKind && a.color == b.color && a.strokeColor == b.strokeColor;
}

bool operator==(const TextData& a, const TextData& b) {
    return a.content == b.content && a.color == b.color && a.style == b.style;
}

bool operator==(const ConnectorEndpoint& a, const ConnectorEndpoint& b) {
    return a.objectId == b.objectId && a.port == b.port && a.point == b.point;
}

bool operator==(const ConnectorData& a, const ConnectorData& b) {
    return a.from == b.from && a.to == b.to && a.style == b.style && a.points == b.points;
}

bool operator==(const FrameData& a, const FrameData& b) {
    return a.title == b.title && a.color == b.color && a.children == b.children;
}

bool operator==(const TableData& a, const TableData& b) {
    return a.title == b.title && a.color == b.color
        && a.columns == b.columns && a.rows == b.rows
        && a.columnWidths == b.columnWidths && a.rowHeights == b.rowHeights
        && a.cells == b.cells;
}

bool operator==(const BoardObject& a, const BoardObject& b) {
    return a.id == b.id
        && a.x == b.x && a.y == b.y
        && a.width == b.width && a.height == b.height
        && a.rotation == b.rotation
        && a.createdBy == b.createdBy
        && a.parentFrameId == b.parentFrameId
        && a.payload == b.payload;
}

const char* objectKindName(ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Sticky: return "sticky";
        case ObjectKind::Shape: return "shape";
        case ObjectKind::Text: return "text";
        case ObjectKind::Connector: return "connector";
        case ObjectKind::Frame: return "frame";
        case ObjectKind::Table: return "table";
    }
    return "unknown";
}

std::optional<ObjectKind> objectKindFromName(const std::string& name) {
    if (name == "sticky") return ObjectKind::Sticky;
    if (name == "shape" || name == "rectangle" || name == "ellipse") return ObjectKind::Shape;
    if (name == "text") return ObjectKind::Text;
    if (name == "connector") return ObjectKind::Connector;
    if (name == "frame") return ObjectKind::Frame;
    if (name == "table") return ObjectKind::Table;
    return std::nullopt;
}

const char* portNameString(PortName port) noexcept {
    const auto idx = static_cast<std::size_t>(port);
    if (idx >= kPortCount) return "";
    return kPortNames[idx];
}

std::optional<PortName> portNameFromString(const std::string& name) {
    for (std::size_t i = 0; i < kPortCount; ++i) {
        if (name == kPortNames[i]) return static_cast<PortName>(i);
    }
    return std::nullopt;
}

const char* connectorStyleName(ConnectorStyle style) noexcept {
    return style == ConnectorStyle::Line ? "line" : "arrow";
}

const char* textSizeName(TextSize size) noexcept {
    switch (size) {
        case TextSize::Small: return "small";
        case TextSize::Medium: return "medium";
        case TextSize::Large: return "large";
    }
    return "medium";
}

const char* shapeKindName(ShapeKind kind) noexcept {
    return kind == ShapeKind::Ellipse ? "ellipse" : "rectangle";
}

const char* boardErrorName(BoardError error) noexcept {
    switch (error) {
        case BoardError::Ok: return "Ok";
        case BoardError::NotFound: return "NotFound";
        case BoardError::UnsupportedOperation: return "UnsupportedOperation";
        case BoardError::InvalidArgument: return "InvalidArgument";
        case BoardError::UnknownTool: return "UnknownTool";
    }
    return "Unknown";
}

ObjectPayload defaultPayload(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Sticky: return StickyData{};
        case ObjectKind::Shape: return ShapeData{};
        case ObjectKind::Text: return TextData{};
        case ObjectKind::Connector: return ConnectorData{};
        case ObjectKind::Frame: return FrameData{};
        case ObjectKind::Table: return makeDefaultTable();
    }
    return StickyData{};
}

} // namespace board
