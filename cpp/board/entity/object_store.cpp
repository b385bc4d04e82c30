#include "board/entity/object_store.h"
#include "board/core/board_constants.h"
#include "board/core/logging.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace board {

namespace {
    constexpr double kMinSize = constants::MIN_OBJECT_SIZE;

    // Connectors carry no box of their own; everything else keeps the floor size.
    void clampSize(BoardObject& obj) {
        if (obj.isConnector()) {
            obj.width = 0.0;
            obj.height = 0.0;
            return;
        }
        obj.width = std::max(kMinSize, obj.width);
        obj.height = std::max(kMinSize, obj.height);
    }

    double tableHeight(const TableData& table) {
        double total = constants::TABLE_TITLE_HEIGHT;
        for (const auto& rowId : table.rows) {
            const auto it = table.rowHeights.find(rowId);
            total += it != table.rowHeights.end() ? it->second : constants::TABLE_DEFAULT_ROW_HEIGHT;
        }
        return total;
    }

    double tableWidth(const TableData& table) {
        double total = 0.0;
        for (const auto& colId : table.columns) {
            const auto it = table.columnWidths.find(colId);
            total += it != table.columnWidths.end() ? it->second : constants::TABLE_DEFAULT_COLUMN_WIDTH;
        }
        return total;
    }

    std::string cellKey(const std::string& rowId, const std::string& colId) {
        return rowId + ":" + colId;
    }

    // Unbinds ends whose target cannot anchor a connector: a missing id,
    // another connector or the connector itself. The end stays where it was
    // given, else at the connector's origin.
    bool dropDanglingBindings(BoardObject& obj, const ObjectLookup& find) {
        ConnectorData* conn = obj.connector();
        if (!conn) return false;
        bool dropped = false;
        for (ConnectorSide side : {ConnectorSide::From, ConnectorSide::To}) {
            ConnectorEndpoint& ep = conn->endpoint(side);
            if (!ep.objectId) continue;
            const BoardObject* target = *ep.objectId == obj.id ? nullptr : find(*ep.objectId);
            if (target && !target->isConnector()) continue;
            BOARD_LOG_WARN("connector %s: cannot bind to %s", obj.id.c_str(), ep.objectId->c_str());
            ep = ConnectorEndpoint::freeAt(ep.point.value_or(Point{obj.x, obj.y}));
            dropped = true;
        }
        return dropped;
    }

    void shiftConnectorPoints(ConnectorData& data, double dx, double dy) {
        for (ConnectorSide side : {ConnectorSide::From, ConnectorSide::To}) {
            auto& ep = data.endpoint(side);
            if (!ep.isBound() && ep.point) {
                ep.point = Point{ep.point->x + dx, ep.point->y + dy};
            }
        }
        for (auto& p : data.points) {
            p.x += dx;
            p.y += dy;
        }
    }
}

ObjectStore::ObjectStore(Document& doc, ObjectStoreOptions options)
    : doc_(doc),
      containment_(doc),
      actorName_(std::move(options.actorName)),
      ids_(std::move(options.ids)) {}

void ObjectStore::withOrigin(TransactionOrigin origin, const std::function<void()>& fn) {
    const TransactionOrigin prev = origin_;
    origin_ = origin;
    try {
        fn();
    } catch (...) {
        origin_ = prev;
        throw;
    }
    origin_ = prev;
}

void ObjectStore::mutate(const std::function<void()>& fn) {
    doc_.transact(origin_, fn);
}

bool ObjectStore::fail(BoardError error, const char* op, const std::string& id) const {
    lastError_ = error;
    BOARD_LOG_WARN("%s(%s) rejected: %s", op, id.c_str(), boardErrorName(error));
    return false;
}

const BoardObject* ObjectStore::require(const std::string& id) const {
    const BoardObject* obj = doc_.get(id);
    if (!obj) {
        fail(BoardError::NotFound, "lookup", id);
        return nullptr;
    }
    lastError_ = BoardError::Ok;
    return obj;
}

const BoardObject* ObjectStore::requireKind(const std::string& id, ObjectKind kind) const {
    const BoardObject* obj = require(id);
    if (!obj) return nullptr;
    if (obj->kind() != kind) {
        fail(BoardError::UnsupportedOperation, objectKindName(kind), id);
        return nullptr;
    }
    return obj;
}

// ============================================================================
// Queries
// ============================================================================

const BoardObject* ObjectStore::get(const std::string& id) const {
    return doc_.get(id);
}

ObjectLookup ObjectStore::lookup() const {
    const Document* doc = &doc_;
    return [doc](const std::string& id) { return doc->get(id); };
}

std::vector<const BoardObject*> ObjectStore::getAll() const {
    std::vector<const BoardObject*> frames;
    std::vector<const BoardObject*> others;
    for (const auto& id : doc_.order()) {
        const BoardObject* obj = doc_.get(id);
        if (!obj) continue;
        (obj->isFrame() ? frames : others).push_back(obj);
    }
    frames.insert(frames.end(), others.begin(), others.end());
    return frames;
}

std::optional<Bounds> ObjectStore::getSelectionBounds(const std::vector<std::string>& ids) const {
    std::vector<const BoardObject*> selected;
    selected.reserve(ids.size());
    for (const auto& id : ids) {
        if (const BoardObject* obj = doc_.get(id)) selected.push_back(obj);
    }
    return selectionBounds(selected, lookup());
}

std::optional<AttachTarget> ObjectStore::getAttachableAtPoint(double x, double y, const std::vector<std::string>& excludeIds) const {
    std::vector<std::string> order;
    for (const BoardObject* obj : getAll()) order.push_back(obj->id);
    const std::unordered_set<std::string> excluded(excludeIds.begin(), excludeIds.end());
    return findAttachTarget(x, y, order, lookup(), excluded, constants::ATTACH_RADIUS);
}

std::optional<std::string> ObjectStore::objectAtPoint(double x, double y) const {
    const auto all = getAll();
    const ObjectLookup find = lookup();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        const BoardObject& obj = **it;
        if (obj.isConnector()) {
            const auto dist = connectorDistance(obj, x, y, find);
            if (dist && *dist <= constants::CONNECTOR_HIT_TOLERANCE) return obj.id;
            continue;
        }
        if (pointInObject(x, y, obj)) return obj.id;
    }
    return std::nullopt;
}

// ============================================================================
// Core mutations
// ============================================================================

std::string ObjectStore::create(ObjectKind kind, double x, double y, double width, double height, const ObjectPatch& extra) {
    lastError_ = BoardError::Ok;

    BoardObject obj;
    obj.id = ids_.next();
    obj.x = extra.x.value_or(x);
    obj.y = extra.y.value_or(y);
    obj.width = extra.width.value_or(width);
    obj.height = extra.height.value_or(height);
    obj.rotation = normalizeAngle(extra.rotation.value_or(0.0));
    obj.createdBy = extra.createdBy.value_or(actorName_);
    obj.payload = defaultPayload(kind);
    if (extra.payload) {
        if (static_cast<ObjectKind>(extra.payload->index()) == kind) {
            obj.payload = *extra.payload;
        } else {
            lastError_ = BoardError::InvalidArgument;
            BOARD_LOG_WARN("create(%s): payload kind mismatch, using defaults", objectKindName(kind));
        }
    }
    // Membership is derived, never taken from the caller.
    if (FrameData* frame = obj.frame()) frame->children.clear();
    clampSize(obj);
    if (dropDanglingBindings(obj, lookup())) lastError_ = BoardError::InvalidArgument;

    mutate([&]() {
        doc_.set(obj);
        doc_.pushOrder(obj.id);
        containment_.sync(obj.id);
    });
    return obj.id;
}

void ObjectStore::createFromSnapshot(const BoardObject& snapshot) {
    lastError_ = BoardError::Ok;
    BoardObject obj = snapshot;
    obj.rotation = normalizeAngle(obj.rotation);
    clampSize(obj);
    if (FrameData* frame = obj.frame()) frame->children.clear();
    if (dropDanglingBindings(obj, lookup())) lastError_ = BoardError::InvalidArgument;

    mutate([&]() {
        doc_.set(obj);
        if (!doc_.indexOf(obj.id)) doc_.pushOrder(obj.id);
        containment_.sync(obj.id);
    });
}

bool ObjectStore::update(const std::string& id, const ObjectPatch& patch) {
    const BoardObject* current = require(id);
    if (!current) return false;
    if (patch.payload && patch.payload->index() != current->payload.index()) {
        return fail(BoardError::UnsupportedOperation, "update", id);
    }

    BoardObject next = *current;
    if (patch.x) next.x = *patch.x;
    if (patch.y) next.y = *patch.y;
    if (patch.width) next.width = *patch.width;
    if (patch.height) next.height = *patch.height;
    if (patch.rotation) next.rotation = *patch.rotation;
    if (patch.createdBy) next.createdBy = *patch.createdBy;
    if (patch.payload) {
        next.payload = *patch.payload;
        // Keep the membership list owned by containment.
        if (FrameData* frame = next.frame()) frame->children = current->frame()->children;
    }
    next.rotation = normalizeAngle(next.rotation);
    clampSize(next);
    const bool dropped = dropDanglingBindings(next, lookup());

    mutate([&]() {
        doc_.set(next);
        containment_.sync(id);
    });
    if (dropped) lastError_ = BoardError::InvalidArgument;
    return true;
}

std::vector<std::string> ObjectStore::expandWithDescendants(const std::vector<std::string>& ids) const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (seen.insert(id).second) out.push_back(id);
    }
    for (const auto& id : ids) {
        const BoardObject* obj = doc_.get(id);
        if (!obj || !obj->isFrame()) continue;
        for (const auto& childId : containment_.descendants(id)) {
            if (seen.insert(childId).second) out.push_back(childId);
        }
    }
    return out;
}

void ObjectStore::move(const std::vector<std::string>& ids, double dx, double dy) {
    lastError_ = BoardError::Ok;
    if (ids.empty() || (dx == 0.0 && dy == 0.0)) return;

    const std::vector<std::string> moveSet = expandWithDescendants(ids);
    mutate([&]() {
        std::vector<std::string> moved;
        for (const auto& id : moveSet) {
            const BoardObject* current = doc_.get(id);
            if (!current) continue;
            BoardObject next = *current;
            next.x += dx;
            next.y += dy;
            if (ConnectorData* conn = next.connector()) shiftConnectorPoints(*conn, dx, dy);
            doc_.set(next);
            moved.push_back(id);
        }
        // All positions land before any membership is re-evaluated.
        containment_.sync(moved);
    });
}

void ObjectStore::moveTo(const std::string& id, double x, double y) {
    const BoardObject* obj = require(id);
    if (!obj) return;
    move({id}, x - obj->x, y - obj->y);
}

bool ObjectStore::resize(const std::string& id, double x, double y, double width, double height) {
    const BoardObject* current = require(id);
    if (!current) return false;
    if (current->isConnector()) return fail(BoardError::UnsupportedOperation, "resize", id);

    BoardObject next = *current;
    next.x = x;
    next.y = y;
    next.width = width;
    next.height = height;
    clampSize(next);

    mutate([&]() {
        doc_.set(next);
        containment_.sync(id);
    });
    return true;
}

void ObjectStore::rotate(const std::vector<std::string>& ids, double deltaDeg, std::optional<Point> pivot) {
    lastError_ = BoardError::Ok;
    if (ids.empty() || deltaDeg == 0.0) return;

    std::vector<const BoardObject*> current;
    for (const auto& id : ids) {
        if (const BoardObject* obj = doc_.get(id)) current.push_back(obj);
    }
    if (current.empty()) return;

    if (!pivot) {
        const auto bounds = selectionBounds(current);
        if (!bounds) return;
        pivot = boundsCenter(*bounds);
    }

    std::vector<BoardObject> rotated;
    for (const BoardObject* obj : current) {
        if (obj->isConnector()) continue;
        const Point c = objectCenter(*obj);
        const Point nc = rotatePoint(c.x, c.y, pivot->x, pivot->y, deltaDeg);
        BoardObject next = *obj;
        next.x = nc.x - obj->width * 0.5;
        next.y = nc.y - obj->height * 0.5;
        next.rotation = normalizeAngle(obj->rotation + deltaDeg);
        rotated.push_back(std::move(next));
    }

    mutate([&]() {
        std::vector<std::string> touched;
        for (const auto& obj : rotated) {
            doc_.set(obj);
            touched.push_back(obj.id);
        }
        containment_.sync(touched);
    });
}

void ObjectStore::deleteObjects(const std::vector<std::string>& ids) {
    lastError_ = BoardError::Ok;
    if (ids.empty()) return;

    std::unordered_set<std::string> deleting;
    std::vector<std::string> deletingOrdered;
    for (const auto& id : expandWithDescendants(ids)) {
        if (doc_.contains(id) && deleting.insert(id).second) deletingOrdered.push_back(id);
    }
    if (deleting.empty()) return;

    mutate([&]() {
        // Freeze connector ends while the targets are still resolvable.
        const ObjectLookup find = lookup();
        std::vector<BoardObject> frozen;
        for (const auto& id : doc_.order()) {
            if (deleting.count(id)) continue;
            const BoardObject* obj = doc_.get(id);
            if (!obj || !obj->isConnector()) continue;
            BoardObject next = *obj;
            if (freezeRemovedEndpoints(next, deleting, find)) frozen.push_back(std::move(next));
        }
        for (const auto& conn : frozen) doc_.set(conn);

        for (const auto& id : deletingOrdered) {
            const BoardObject* obj = doc_.get(id);
            if (!obj || !obj->parentFrameId || deleting.count(*obj->parentFrameId)) continue;
            const BoardObject* parent = doc_.get(*obj->parentFrameId);
            if (!parent || !parent->isFrame()) continue;
            BoardObject nextParent = *parent;
            auto& children = nextParent.frame()->children;
            children.erase(std::remove(children.begin(), children.end(), id), children.end());
            doc_.set(nextParent);
        }

        for (const auto& id : deletingOrdered) {
            doc_.erase(id);
            doc_.removeOrder(id);
        }
    });
}

void ObjectStore::bringToFront(const std::string& id) {
    if (!require(id)) return;
    const auto index = doc_.indexOf(id);
    if (!index || *index + 1 == doc_.order().size()) return;
    mutate([&]() {
        doc_.removeOrder(id);
        doc_.pushOrder(id);
    });
}

ClipboardPayload ObjectStore::serializeSelection(const std::vector<std::string>& ids) const {
    lastError_ = BoardError::Ok;
    const std::unordered_set<std::string> wanted(ids.begin(), ids.end());
    ClipboardPayload payload;
    std::unordered_set<std::string> selected;
    for (const BoardObject* obj : getAll()) {
        if (wanted.count(obj->id)) selected.insert(obj->id);
    }

    const ObjectLookup find = lookup();
    std::unordered_set<std::string> outside;
    for (const auto& [id, obj] : doc_.objects()) {
        if (!selected.count(id)) outside.insert(id);
    }

    for (const BoardObject* obj : getAll()) {
        if (!selected.count(obj->id)) continue;
        BoardObject clone = *obj;
        switch (clone.kind()) {
            case ObjectKind::Connector:
                freezeRemovedEndpoints(clone, outside, find);
                break;
            case ObjectKind::Frame: {
                auto& children = clone.frame()->children;
                children.erase(std::remove_if(children.begin(), children.end(),
                    [&](const std::string& child) { return selected.count(child) == 0; }), children.end());
                break;
            }
            case ObjectKind::Sticky:
            case ObjectKind::Shape:
            case ObjectKind::Text:
            case ObjectKind::Table:
                break;
        }
        if (clone.parentFrameId && !selected.count(*clone.parentFrameId)) clone.parentFrameId.reset();
        payload.objects.push_back(std::move(clone));
    }
    return payload;
}

std::vector<std::string> ObjectStore::pasteSerialized(const ClipboardPayload& payload, Point placement, PasteMode mode) {
    lastError_ = BoardError::Ok;
    if (payload.objects.empty()) return {};

    std::unordered_map<std::string, std::string> idMap;
    for (const auto& obj : payload.objects) idMap[obj.id] = ids_.next();
    auto remap = [&idMap](const std::string& id) -> std::optional<std::string> {
        const auto it = idMap.find(id);
        if (it == idMap.end()) return std::nullopt;
        return it->second;
    };

    std::vector<BoardObject> clones;
    clones.reserve(payload.objects.size());
    for (const auto& source : payload.objects) {
        BoardObject obj = source;
        obj.id = idMap[source.id];
        obj.createdBy = actorName_;
        if (obj.parentFrameId) obj.parentFrameId = remap(*obj.parentFrameId);

        switch (obj.kind()) {
            case ObjectKind::Connector: {
                ConnectorData& conn = *obj.connector();
                for (ConnectorSide side : {ConnectorSide::From, ConnectorSide::To}) {
                    ConnectorEndpoint& ep = conn.endpoint(side);
                    if (!ep.objectId) continue;
                    const auto mapped = remap(*ep.objectId);
                    if (mapped) {
                        ep.objectId = mapped;
                    } else {
                        // Payloads built elsewhere may still point outside; keep only the point.
                        ep = ConnectorEndpoint::freeAt(ep.point.value_or(Point{obj.x, obj.y}));
                    }
                }
                break;
            }
            case ObjectKind::Frame: {
                std::vector<std::string> children;
                for (const auto& child : obj.frame()->children) {
                    if (const auto mapped = remap(child)) children.push_back(*mapped);
                }
                obj.frame()->children = std::move(children);
                break;
            }
            case ObjectKind::Sticky:
            case ObjectKind::Shape:
            case ObjectKind::Text:
            case ObjectKind::Table:
                break;
        }
        obj.rotation = normalizeAngle(obj.rotation);
        clampSize(obj);
        clones.push_back(std::move(obj));
    }

    std::unordered_map<std::string, const BoardObject*> cloneIndex;
    for (const auto& obj : clones) cloneIndex[obj.id] = &obj;
    const ObjectLookup findClone = [&cloneIndex](const std::string& id) -> const BoardObject* {
        const auto it = cloneIndex.find(id);
        return it == cloneIndex.end() ? nullptr : it->second;
    };
    for (auto& obj : clones) {
        if (dropDanglingBindings(obj, findClone)) lastError_ = BoardError::InvalidArgument;
    }

    std::vector<const BoardObject*> placeable;
    for (const auto& obj : clones) {
        if (!obj.isConnector()) placeable.push_back(&obj);
    }
    if (const auto bounds = selectionBounds(placeable)) {
        const Point c = boundsCenter(*bounds);
        const double dx = mode == PasteMode::Relative ? placement.x : placement.x - c.x;
        const double dy = mode == PasteMode::Relative ? placement.y : placement.y - c.y;
        for (auto& obj : clones) {
            obj.x += dx;
            obj.y += dy;
            if (ConnectorData* conn = obj.connector()) shiftConnectorPoints(*conn, dx, dy);
        }
    }

    std::vector<std::string> created;
    mutate([&]() {
        for (const auto& obj : clones) {
            doc_.set(obj);
            doc_.pushOrder(obj.id);
            created.push_back(obj.id);
        }
        containment_.sync(created);
    });
    return created;
}

std::vector<std::string> ObjectStore::duplicate(const std::vector<std::string>& ids, Point offset) {
    return pasteSerialized(serializeSelection(ids), offset, PasteMode::Relative);
}

// ============================================================================
// Content edits
// ============================================================================

bool ObjectStore::updateText(const std::string& id, const std::string& text) {
    const BoardObject* current = require(id);
    if (!current) return false;
    BoardObject next = *current;
    switch (next.kind()) {
        case ObjectKind::Sticky:
            std::get<StickyData>(next.payload).text = text;
            break;
        case ObjectKind::Text:
            std::get<TextData>(next.payload).content = text;
            break;
        case ObjectKind::Shape:
        case ObjectKind::Connector:
        case ObjectKind::Frame:
        case ObjectKind::Table:
            return fail(BoardError::UnsupportedOperation, "updateText", id);
    }
    mutate([&]() { doc_.set(next); });
    return true;
}

bool ObjectStore::updateTextStyle(const std::string& id, const TextStyle& style) {
    const BoardObject* current = requireKind(id, ObjectKind::Text);
    if (!current) return false;
    BoardObject next = *current;
    std::get<TextData>(next.payload).style = style;
    mutate([&]() { doc_.set(next); });
    return true;
}

bool ObjectStore::updateColor(const std::string& id, const std::string& color) {
    const BoardObject* current = require(id);
    if (!current) return false;
    BoardObject next = *current;
    switch (next.kind()) {
        case ObjectKind::Sticky: std::get<StickyData>(next.payload).color = color; break;
        case ObjectKind::Shape: std::get<ShapeData>(next.payload).color = color; break;
        case ObjectKind::Text: std::get<TextData>(next.payload).color = color; break;
        case ObjectKind::Frame: std::get<FrameData>(next.payload).color = color; break;
        case ObjectKind::Table: std::get<TableData>(next.payload).color = color; break;
        case ObjectKind::Connector:
            return fail(BoardError::UnsupportedOperation, "updateColor", id);
    }
    mutate([&]() { doc_.set(next); });
    return true;
}

bool ObjectStore::updateConnectorEndpoint(const std::string& id, ConnectorSide side, const ConnectorEndpoint& endpoint) {
    const BoardObject* current = requireKind(id, ObjectKind::Connector);
    if (!current) return false;

    ConnectorEndpoint normalized;
    if (endpoint.objectId) {
        const BoardObject* target = doc_.get(*endpoint.objectId);
        if (!target || target->isConnector()) {
            return fail(BoardError::InvalidArgument, "updateConnectorEndpoint", *endpoint.objectId);
        }
        normalized = ConnectorEndpoint::bound(*endpoint.objectId, endpoint.port.value_or(PortName::N));
        if (!endpoint.port && endpoint.point) {
            normalized.port = closestPort(*target, endpoint.point->x, endpoint.point->y).name;
        }
    } else if (endpoint.point) {
        normalized = ConnectorEndpoint::freeAt(*endpoint.point);
    } else {
        return fail(BoardError::InvalidArgument, "updateConnectorEndpoint", id);
    }

    BoardObject next = *current;
    next.connector()->endpoint(side) = normalized;
    mutate([&]() { doc_.set(next); });
    return true;
}

std::string ObjectStore::startConnector(double x, double y) {
    ConnectorData data;
    data.from = ConnectorEndpoint::freeAt(Point{x, y});
    data.to = ConnectorEndpoint::freeAt(Point{x, y});
    ObjectPatch extra;
    extra.payload = data;
    return create(ObjectKind::Connector, x, y, 0.0, 0.0, extra);
}

// ============================================================================
// Tables
// ============================================================================

void ObjectStore::writeTable(const BoardObject& obj, TableData table) {
    BoardObject next = obj;
    next.width = tableWidth(table);
    next.height = tableHeight(table);
    next.payload = std::move(table);
    clampSize(next);
    mutate([&]() {
        doc_.set(next);
        containment_.sync(next.id);
    });
}

bool ObjectStore::updateTableCell(const std::string& id, const std::string& rowId, const std::string& colId, const std::string& text) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    BoardObject next = *current;
    next.table()->cells[cellKey(rowId, colId)] = text;
    mutate([&]() { doc_.set(next); });
    return true;
}

bool ObjectStore::updateTableRowHeight(const std::string& id, const std::string& rowId, double height) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    TableData table = *current->table();
    table.rowHeights[rowId] = std::max(1.0, height);
    writeTable(*current, std::move(table));
    return true;
}

bool ObjectStore::addTableRow(const std::string& id) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    TableData table = *current->table();
    const std::string rowId = "r" + ids_.next();
    table.rows.push_back(rowId);
    table.rowHeights[rowId] = constants::TABLE_DEFAULT_ROW_HEIGHT;
    writeTable(*current, std::move(table));
    return true;
}

bool ObjectStore::deleteTableRow(const std::string& id, const std::string& rowId) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    TableData table = *current->table();
    const auto it = std::find(table.rows.begin(), table.rows.end(), rowId);
    if (it == table.rows.end()) return fail(BoardError::NotFound, "deleteTableRow", rowId);
    if (table.rows.size() <= 1) return fail(BoardError::UnsupportedOperation, "deleteTableRow", id);
    table.rows.erase(it);
    table.rowHeights.erase(rowId);
    for (const auto& colId : table.columns) table.cells.erase(cellKey(rowId, colId));
    writeTable(*current, std::move(table));
    return true;
}

bool ObjectStore::addTableColumn(const std::string& id) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    TableData table = *current->table();
    const std::string colId = "c" + ids_.next();
    table.columns.push_back(colId);
    table.columnWidths[colId] = constants::TABLE_DEFAULT_COLUMN_WIDTH;
    writeTable(*current, std::move(table));
    return true;
}

bool ObjectStore::deleteTableColumn(const std::string& id, const std::string& colId) {
    const BoardObject* current = requireKind(id, ObjectKind::Table);
    if (!current) return false;
    TableData table = *current->table();
    const auto it = std::find(table.columns.begin(), table.columns.end(), colId);
    if (it == table.columns.end()) return fail(BoardError::NotFound, "deleteTableColumn", colId);
    if (table.columns.size() <= 1) return fail(BoardError::UnsupportedOperation, "deleteTableColumn", id);
    table.columns.erase(it);
    table.columnWidths.erase(colId);
    for (const auto& rowId : table.rows) table.cells.erase(cellKey(rowId, colId));
    writeTable(*current, std::move(table));
    return true;
}

} // namespace board
