#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace board {

// Lightweight value types shared by the store, the document and the agent runner.

struct Point {
    double x;
    double y;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Axis-aligned box in world units (top-left + size).
struct Bounds {
    double x;
    double y;
    double width;
    double height;
};

enum class ObjectKind : std::uint8_t {
    Sticky    = 0,
    Shape     = 1,
    Text      = 2,
    Connector = 3,
    Frame     = 4,
    Table     = 5,
};

enum class ShapeKind : std::uint8_t {
    Rectangle = 0,
    Ellipse   = 1,
};

enum class ConnectorStyle : std::uint8_t {
    Line  = 0,
    Arrow = 1,
};

enum class TextSize : std::uint8_t {
    Small  = 0,
    Medium = 1,
    Large  = 2,
};

// Port order matches the perimeter walk used by the resolver:
// cardinal points first, then the four corners.
enum class PortName : std::uint8_t {
    N  = 0,
    E  = 1,
    S  = 2,
    W  = 3,
    NW = 4,
    NE = 5,
    SE = 6,
    SW = 7,
};

static constexpr std::size_t kPortCount = 8;

enum class BoardError : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    UnsupportedOperation = 2,
    InvalidArgument = 3,
    UnknownTool = 4,
};

// ============================================================================
// Variant payloads
// ============================================================================

struct TextStyle {
    bool bold = false;
    bool italic = false;
    TextSize size = TextSize::Medium;
};

struct StickyData {
    std::string text;
    std::string color = "yellow";
};

struct ShapeData {
    ShapeKind shapeKind = ShapeKind::Rectangle;
    std::string color = "blue";
    std::string strokeColor = "#64748b";
};

struct TextData {
    std::string content;
    std::string color = "#334155";
    TextStyle style;
};

// One end of a connector: bound to (objectId, port) or free at `point`.
// The two forms are exclusive; build endpoints through bound()/freeAt().
struct ConnectorEndpoint {
    std::optional<std::string> objectId;
    std::optional<PortName> port;
    std::optional<Point> point;

    bool isBound() const { return objectId.has_value(); }

    static ConnectorEndpoint bound(const std::string& id, PortName portName) {
        ConnectorEndpoint ep;
        ep.objectId = id;
        ep.port = portName;
        return ep;
    }

    static ConnectorEndpoint freeAt(Point p) {
        ConnectorEndpoint ep;
        ep.point = p;
        return ep;
    }
};

enum class ConnectorSide : std::uint8_t {
    From = 0,
    To   = 1,
};

struct ConnectorData {
    ConnectorEndpoint from;
    ConnectorEndpoint to;
    ConnectorStyle style = ConnectorStyle::Arrow;
    std::vector<Point> points;

    ConnectorEndpoint& endpoint(ConnectorSide side) { return side == ConnectorSide::From ? from : to; }
    const ConnectorEndpoint& endpoint(ConnectorSide side) const { return side == ConnectorSide::From ? from : to; }
};

struct FrameData {
    std::string title = "Frame";
    std::string color = "#E3E8EF";
    std::vector<std::string> children;
};

struct TableData {
    std::string title = "Table";
    std::string color = "#e2e8f0";
    std::vector<std::string> columns;
    std::vector<std::string> rows;
    std::map<std::string, double> columnWidths;
    std::map<std::string, double> rowHeights;
    std::map<std::string, std::string> cells; // keyed "rowId:colId"
};

// Alternative order must match ObjectKind.
using ObjectPayload = std::variant<StickyData, ShapeData, TextData, ConnectorData, FrameData, TableData>;

struct BoardObject {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;       // degrees, [0, 360)
    std::string createdBy;
    std::optional<std::string> parentFrameId; // weak back-reference, lookup only
    ObjectPayload payload;

    ObjectKind kind() const noexcept { return static_cast<ObjectKind>(payload.index()); }
    bool isFrame() const noexcept { return kind() == ObjectKind::Frame; }
    bool isConnector() const noexcept { return kind() == ObjectKind::Connector; }

    FrameData* frame() { return std::get_if<FrameData>(&payload); }
    const FrameData* frame() const { return std::get_if<FrameData>(&payload); }
    ConnectorData* connector() { return std::get_if<ConnectorData>(&payload); }
    const ConnectorData* connector() const { return std::get_if<ConnectorData>(&payload); }
    TableData* table() { return std::get_if<TableData>(&payload); }
    const TableData* table() const { return std::get_if<TableData>(&payload); }
};

bool operator==(const TextStyle& a, const TextStyle& b);
bool operator==(const StickyData& a, const StickyData& b);
bool operator==(const ShapeData& a, const ShapeData& b);
bool operator==(const TextData& a, const TextData& b);
bool operator==(const ConnectorEndpoint& a, const ConnectorEndpoint& b);
bool operator==(const ConnectorData& a, const ConnectorData& b);
bool operator==(const FrameData& a, const FrameData& b);
bool operator==(const TableData& a, const TableData& b);
bool operator==(const BoardObject& a, const BoardObject& b);
inline bool operator!=(const BoardObject& a, const BoardObject& b) { return !(a == b); }

// Partial update for ObjectStore::update. Unset fields are left untouched.
// The payload, when present, replaces the variant payload wholesale and must
// be of the same kind as the target object.
struct ObjectPatch {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> rotation;
    std::optional<std::string> createdBy;
    std::optional<ObjectPayload> payload;
};

const char* objectKindName(ObjectKind kind) noexcept;
std::optional<ObjectKind> objectKindFromName(const std::string& name);

const char* portNameString(PortName port) noexcept;
std::optional<PortName> portNameFromString(const std::string& name);

const char* connectorStyleName(ConnectorStyle style) noexcept;
const char* textSizeName(TextSize size) noexcept;
const char* shapeKindName(ShapeKind kind) noexcept;
const char* boardErrorName(BoardError error) noexcept;

// Default payload for a freshly created object of `kind`.
ObjectPayload defaultPayload(ObjectKind kind);

} // namespace board
