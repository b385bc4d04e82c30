#include "board/core/object_fields.h"

#include <set>

namespace board {

namespace {

const char* fieldName(ObjectField field) noexcept {
    switch (field) {
        case ObjectField::X: return "x";
        case ObjectField::Y: return "y";
        case ObjectField::Width: return "width";
        case ObjectField::Height: return "height";
        case ObjectField::Rotation: return "rotation";
        case ObjectField::CreatedBy: return "createdBy";
        case ObjectField::ParentFrame: return "parentFrameId";
        case ObjectField::Payload: return "payload";
        case ObjectField::Color: return "color";
        case ObjectField::Text: return "text";
        case ObjectField::ShapeKind: return "shapeKind";
        case ObjectField::StrokeColor: return "strokeColor";
        case ObjectField::TextStyle: return "style";
        case ObjectField::FromEndpoint: return "from";
        case ObjectField::ToEndpoint: return "to";
        case ObjectField::ConnectorStyle: return "connectorStyle";
        case ObjectField::Waypoints: return "points";
        case ObjectField::Title: return "title";
        case ObjectField::Children: return "children";
        case ObjectField::Columns: return "columns";
        case ObjectField::Rows: return "rows";
        case ObjectField::ColumnWidths: return "columnWidths";
        case ObjectField::RowHeights: return "rowHeights";
        case ObjectField::Cell: return "cell";
    }
    return "unknown";
}

// Copies `member` of payload type T; false when either side is another kind.
template <typename T, typename M>
bool copyMember(BoardObject& target, const BoardObject& source, M T::*member) {
    T* to = std::get_if<T>(&target.payload);
    const T* from = std::get_if<T>(&source.payload);
    if (!to || !from) return false;
    to->*member = from->*member;
    return true;
}

void diffCells(const TableData& a, const TableData& b, std::vector<FieldRef>& out) {
    std::set<std::string> keys;
    for (const auto& entry : a.cells) keys.insert(entry.first);
    for (const auto& entry : b.cells) keys.insert(entry.first);
    for (const auto& key : keys) {
        const auto ia = a.cells.find(key);
        const auto ib = b.cells.find(key);
        const bool inA = ia != a.cells.end();
        const bool inB = ib != b.cells.end();
        if (inA != inB || (inA && ia->second != ib->second)) out.push_back(FieldRef{ObjectField::Cell, key});
    }
}

} // namespace

std::string fieldKey(const FieldRef& ref) {
    std::string key = fieldName(ref.field);
    if (!ref.key.empty()) {
        key += ':';
        key += ref.key;
    }
    return key;
}

std::vector<FieldRef> changedFields(const BoardObject& before, const BoardObject& after) {
    std::vector<FieldRef> out;
    auto add = [&out](ObjectField field) { out.push_back(FieldRef{field, std::string()}); };

    if (before.x != after.x) add(ObjectField::X);
    if (before.y != after.y) add(ObjectField::Y);
    if (before.width != after.width) add(ObjectField::Width);
    if (before.height != after.height) add(ObjectField::Height);
    if (before.rotation != after.rotation) add(ObjectField::Rotation);
    if (before.createdBy != after.createdBy) add(ObjectField::CreatedBy);
    if (before.parentFrameId != after.parentFrameId) add(ObjectField::ParentFrame);

    if (before.kind() != after.kind()) {
        add(ObjectField::Payload);
        return out;
    }

    switch (before.kind()) {
        case ObjectKind::Sticky: {
            const auto& a = std::get<StickyData>(before.payload);
            const auto& b = std::get<StickyData>(after.payload);
            if (a.text != b.text) add(ObjectField::Text);
            if (a.color != b.color) add(ObjectField::Color);
            break;
        }
        case ObjectKind::Shape: {
            const auto& a = std::get<ShapeData>(before.payload);
            const auto& b = std::get<ShapeData>(after.payload);
            if (a.shapeKind != b.shapeKind) add(ObjectField::ShapeKind);
            if (a.color != b.color) add(ObjectField::Color);
            if (a.strokeColor != b.strokeColor) add(ObjectField::StrokeColor);
            break;
        }
        case ObjectKind::Text: {
            const auto& a = std::get<TextData>(before.payload);
            const auto& b = std::get<TextData>(after.payload);
            if (a.content != b.content) add(ObjectField::Text);
            if (a.color != b.color) add(ObjectField::Color);
            if (!(a.style == b.style)) add(ObjectField::TextStyle);
            break;
        }
        case ObjectKind::Connector: {
            const auto& a = std::get<ConnectorData>(before.payload);
            const auto& b = std::get<ConnectorData>(after.payload);
            if (!(a.from == b.from)) add(ObjectField::FromEndpoint);
            if (!(a.to == b.to)) add(ObjectField::ToEndpoint);
            if (a.style != b.style) add(ObjectField::ConnectorStyle);
            if (a.points != b.points) add(ObjectField::Waypoints);
            break;
        }
        case ObjectKind::Frame: {
            const auto& a = std::get<FrameData>(before.payload);
            const auto& b = std::get<FrameData>(after.payload);
            if (a.title != b.title) add(ObjectField::Title);
            if (a.color != b.color) add(ObjectField::Color);
            if (a.children != b.children) add(ObjectField::Children);
            break;
        }
        case ObjectKind::Table: {
            const auto& a = std::get<TableData>(before.payload);
            const auto& b = std::get<TableData>(after.payload);
            if (a.title != b.title) add(ObjectField::Title);
            if (a.color != b.color) add(ObjectField::Color);
            if (a.columns != b.columns) add(ObjectField::Columns);
            if (a.rows != b.rows) add(ObjectField::Rows);
            if (a.columnWidths != b.columnWidths) add(ObjectField::ColumnWidths);
            if (a.rowHeights != b.rowHeights) add(ObjectField::RowHeights);
            diffCells(a, b, out);
            break;
        }
    }
    return out;
}

bool copyField(BoardObject& target, const BoardObject& source, const FieldRef& ref) {
    switch (ref.field) {
        case ObjectField::X: target.x = source.x; return true;
        case ObjectField::Y: target.y = source.y; return true;
        case ObjectField::Width: target.width = source.width; return true;
        case ObjectField::Height: target.height = source.height; return true;
        case ObjectField::Rotation: target.rotation = source.rotation; return true;
        case ObjectField::CreatedBy: target.createdBy = source.createdBy; return true;
        case ObjectField::ParentFrame: target.parentFrameId = source.parentFrameId; return true;
        case ObjectField::Payload: target.payload = source.payload; return true;
        case ObjectField::Color: {
            std::string* to = colorField(target);
            const std::string* from = colorField(source);
            if (!to || !from) return false;
            *to = *from;
            return true;
        }
        case ObjectField::Text: {
            std::string* to = textField(target);
            const std::string* from = textField(source);
            if (!to || !from) return false;
            *to = *from;
            return true;
        }
        case ObjectField::ShapeKind: return copyMember(target, source, &ShapeData::shapeKind);
        case ObjectField::StrokeColor: return copyMember(target, source, &ShapeData::strokeColor);
        case ObjectField::TextStyle: return copyMember(target, source, &TextData::style);
        case ObjectField::FromEndpoint: return copyMember(target, source, &ConnectorData::from);
        case ObjectField::ToEndpoint: return copyMember(target, source, &ConnectorData::to);
        case ObjectField::ConnectorStyle: return copyMember(target, source, &ConnectorData::style);
        case ObjectField::Waypoints: return copyMember(target, source, &ConnectorData::points);
        case ObjectField::Title:
            if (target.frame() && source.frame()) return copyMember(target, source, &FrameData::title);
            return copyMember(target, source, &TableData::title);
        case ObjectField::Children: return copyMember(target, source, &FrameData::children);
        case ObjectField::Columns: return copyMember(target, source, &TableData::columns);
        case ObjectField::Rows: return copyMember(target, source, &TableData::rows);
        case ObjectField::ColumnWidths: return copyMember(target, source, &TableData::columnWidths);
        case ObjectField::RowHeights: return copyMember(target, source, &TableData::rowHeights);
        case ObjectField::Cell: {
            TableData* to = target.table();
            const TableData* from = source.table();
            if (!to || !from) return false;
            const auto it = from->cells.find(ref.key);
            if (it == from->cells.end()) {
                to->cells.erase(ref.key);
            } else {
                to->cells[ref.key] = it->second;
            }
            return true;
        }
    }
    return false;
}

bool isContainmentField(ObjectField field) noexcept {
    return field == ObjectField::ParentFrame || field == ObjectField::Children;
}

std::string* colorField(BoardObject& obj) {
    switch (obj.kind()) {
        case ObjectKind::Sticky: return &std::get<StickyData>(obj.payload).color;
        case ObjectKind::Shape: return &std::get<ShapeData>(obj.payload).color;
        case ObjectKind::Text: return &std::get<TextData>(obj.payload).color;
        case ObjectKind::Frame: return &std::get<FrameData>(obj.payload).color;
        case ObjectKind::Table: return &std::get<TableData>(obj.payload).color;
        case ObjectKind::Connector: return nullptr;
    }
    return nullptr;
}

const std::string* colorField(const BoardObject& obj) {
    return colorField(const_cast<BoardObject&>(obj));
}

std::string* textField(BoardObject& obj) {
    switch (obj.kind()) {
        case ObjectKind::Sticky: return &std::get<StickyData>(obj.payload).text;
        case ObjectKind::Text: return &std::get<TextData>(obj.payload).content;
        case ObjectKind::Shape:
        case ObjectKind::Connector:
        case ObjectKind::Frame:
        case ObjectKind::Table:
            return nullptr;
    }
    return nullptr;
}

const std::string* textField(const BoardObject& obj) {
    return textField(const_cast<BoardObject&>(obj));
}

} // namespace board
