#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace board {

// Leaf fields of a BoardObject. Remote merge, undo and agent commits move
// these individually so edits to different fields of one object never
// overwrite each other.
enum class ObjectField : std::uint8_t {
    X = 0,
    Y,
    Width,
    Height,
    Rotation,
    CreatedBy,
    ParentFrame,
    Payload,        // whole payload; only when the kinds differ
    Color,
    Text,           // sticky text or text content
    ShapeKind,
    StrokeColor,
    TextStyle,
    FromEndpoint,
    ToEndpoint,
    ConnectorStyle,
    Waypoints,
    Title,
    Children,
    Columns,
    Rows,
    ColumnWidths,
    RowHeights,
    Cell,           // one table cell; key is "row:col"
};

struct FieldRef {
    ObjectField field;
    std::string key;
};

inline bool operator==(const FieldRef& a, const FieldRef& b) { return a.field == b.field && a.key == b.key; }

// Stable textual key, e.g. "x" or "cell:r1:c2".
std::string fieldKey(const FieldRef& ref);

// Fields whose values differ between two records of the same object.
std::vector<FieldRef> changedFields(const BoardObject& before, const BoardObject& after);

// Copies one field from `source` into `target`. Returns false when the field
// does not exist on the target's kind.
bool copyField(BoardObject& target, const BoardObject& source, const FieldRef& ref);

// Frame membership fields, owned by the containment synchronizer.
bool isContainmentField(ObjectField field) noexcept;

// Color or text of kinds that carry one; nullptr otherwise.
std::string* colorField(BoardObject& obj);
const std::string* colorField(const BoardObject& obj);
std::string* textField(BoardObject& obj);
const std::string* textField(const BoardObject& obj);

} // namespace board
