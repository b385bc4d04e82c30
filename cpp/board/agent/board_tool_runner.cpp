#include "board/agent/board_tool_runner.h"
#include "board/agent/tool_args.h"
#include "board/connector/connector_resolver.h"
#include "board/core/board_constants.h"
#include "board/core/logging.h"
#include "board/core/object_fields.h"
#include "board/core/string_utils.h"
#include "board/entity/containment.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <utility>

namespace board {
namespace agent {

using nlohmann::json;

namespace {

json failure(const std::string& message) {
    return json{{"ok", false}, {"error", message}};
}

json pointJson(Point p) {
    return json{{"x", p.x}, {"y", p.y}};
}

std::optional<Point> pointFromJson(const json& value) {
    if (!value.is_object()) return std::nullopt;
    return Point{value.at("x").get<double>(), value.at("y").get<double>()};
}

std::optional<std::string> stringArg(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<double> numberArg(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

TextSize textSizeFromName(const std::string& name) {
    if (name == "small") return TextSize::Small;
    if (name == "large") return TextSize::Large;
    return TextSize::Medium;
}

double clampState(double v, double min, double max) {
    return std::min(max, std::max(min, v));
}

} // namespace

// =============================================================================
// OrderedIdSet
// =============================================================================

bool OrderedIdSet::insert(const std::string& id) {
    if (!index_.insert(id).second) return false;
    ids_.push_back(id);
    return true;
}

bool OrderedIdSet::erase(const std::string& id) {
    if (index_.erase(id) == 0) return false;
    ids_.erase(std::remove(ids_.begin(), ids_.end(), id), ids_.end());
    return true;
}

// =============================================================================
// Construction and dispatch
// =============================================================================

BoardToolRunner::BoardToolRunner(Document& doc, ToolRunnerOptions options)
    : doc_(doc),
      objects_(doc.objects().begin(), doc.objects().end()),
      snapshot_(objects_),
      order_(doc.order()),
      actorId_(std::move(options.actorId)),
      viewportCenter_(normalizeViewportCenter(options.viewportCenter)),
      ids_(std::move(options.ids)) {
    if (actorId_.empty()) actorId_ = "ai:" + ids_.next();
}

const std::unordered_map<std::string, BoardToolRunner::Tool>& BoardToolRunner::tools() {
    static const std::unordered_map<std::string, Tool> table = {
        {"createStickyNote", &BoardToolRunner::createStickyNote},
        {"createShape", &BoardToolRunner::createShape},
        {"createFrame", &BoardToolRunner::createFrame},
        {"createConnector", &BoardToolRunner::createConnector},
        {"createText", &BoardToolRunner::createText},
        {"createTable", &BoardToolRunner::createTable},
        {"moveObject", &BoardToolRunner::moveObject},
        {"resizeObject", &BoardToolRunner::resizeObject},
        {"rotateObject", &BoardToolRunner::rotateObject},
        {"updateText", &BoardToolRunner::updateText},
        {"changeColor", &BoardToolRunner::changeColor},
        {"deleteObject", &BoardToolRunner::deleteObject},
        {"arrangeObjectsInGrid", &BoardToolRunner::arrangeObjectsInGrid},
        {"createObjects", &BoardToolRunner::createObjects},
        {"updateObjects", &BoardToolRunner::updateObjects},
        {"deleteObjects", &BoardToolRunner::deleteObjects},
        {"getBoardState", &BoardToolRunner::getBoardState},
    };
    return table;
}

json BoardToolRunner::invoke(const std::string& toolName, const json& args) {
    const auto& table = tools();
    const auto it = table.find(toolName);
    if (it == table.end()) {
        BOARD_LOG_WARN("unknown tool %s", toolName.c_str());
        throw UnknownToolError(toolName);
    }

    json validated = validateToolArgs(toolName, args);
    json result = (this->*(it->second))(validated);
    if (result.contains("ok") && !result["ok"].get<bool>()) {
        BOARD_LOG_DEBUG("tool %s failed: %s", toolName.c_str(),
                        result.contains("error") ? result["error"].get<std::string>().c_str() : "(batch)");
    }
    toolCalls_.push_back(ToolCallEntry{toolName, std::move(validated), result});
    return result;
}

// =============================================================================
// Mirror bookkeeping
// =============================================================================

const BoardObject* BoardToolRunner::object(const std::string& id) const {
    const auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : &it->second;
}

BoardObject* BoardToolRunner::find(const std::string& id) {
    const auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : &it->second;
}

ObjectLookup BoardToolRunner::mirrorLookup() const {
    return [this](const std::string& id) { return object(id); };
}

void BoardToolRunner::syncMirror(const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    MapObjectSpace space(objects_, order_);
    ContainmentSynchronizer(space).sync(ids);
}

Point BoardToolRunner::nextPlacement(double width, double height) {
    const int col = placementCount_ % constants::PLACEMENT_COLUMNS;
    const int row = placementCount_ / constants::PLACEMENT_COLUMNS;
    ++placementCount_;
    const double originX = viewportCenter_.x - constants::PLACEMENT_GAP_X;
    const double originY = viewportCenter_.y - constants::PLACEMENT_GAP_Y;
    return Point{
        std::round(originX + col * constants::PLACEMENT_GAP_X - width / 2.0),
        std::round(originY + row * constants::PLACEMENT_GAP_Y - height / 2.0),
    };
}

Point BoardToolRunner::placementFor(const json& args, double width, double height) {
    const auto x = numberArg(args, "x");
    const auto y = numberArg(args, "y");
    if (x && y) return Point{*x, *y};
    const Point slot = nextPlacement(width, height);
    return Point{x.value_or(slot.x), y.value_or(slot.y)};
}

BoardObject BoardToolRunner::makeBase(ObjectKind kind, Point at, double width, double height) {
    BoardObject obj;
    obj.id = ids_.next();
    obj.x = at.x;
    obj.y = at.y;
    obj.width = width;
    obj.height = height;
    obj.createdBy = actorId_;
    obj.payload = defaultPayload(kind);
    return obj;
}

std::string BoardToolRunner::storeCreated(BoardObject obj) {
    const std::string id = obj.id;
    objects_[id] = std::move(obj);
    if (std::find(order_.begin(), order_.end(), id) == order_.end()) order_.push_back(id);
    created_.insert(id);
    deleted_.erase(id);
    syncMirror({id});
    return id;
}

void BoardToolRunner::storeUpdated(const BoardObject& obj) {
    objects_[obj.id] = obj;
    touchUpdated(obj.id);
}

void BoardToolRunner::touchUpdated(const std::string& id) {
    if (created_.contains(id) || !objects_.count(id)) return;
    updated_.insert(id);
}

bool BoardToolRunner::removeObject(const std::string& id) {
    if (!objects_.count(id)) return false;

    // Freeze connector ends while the target still resolves.
    const std::unordered_set<std::string> removed{id};
    const ObjectLookup lookup = mirrorLookup();
    for (auto& [otherId, other] : objects_) {
        if (otherId == id || !other.isConnector()) continue;
        if (freezeRemovedEndpoints(other, removed, lookup)) touchUpdated(otherId);
    }

    // Detach from the parent and release the children before erasing.
    const BoardObject& doomed = objects_.at(id);
    std::vector<std::string> orphans;
    if (const FrameData* frame = doomed.frame()) orphans = frame->children;
    if (doomed.parentFrameId) {
        if (BoardObject* parent = find(*doomed.parentFrameId); parent && parent->frame()) {
            auto& children = parent->frame()->children;
            children.erase(std::remove(children.begin(), children.end(), id), children.end());
        }
    }

    objects_.erase(id);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    for (const auto& childId : orphans) {
        if (BoardObject* child = find(childId)) child->parentFrameId.reset();
    }
    syncMirror(orphans);

    if (created_.erase(id)) return true;
    updated_.erase(id);
    deleted_.insert(id);
    return true;
}

std::vector<std::string> BoardToolRunner::moveWithDescendants(const std::string& id, double x, double y) {
    std::vector<std::string> moved;
    BoardObject* root = find(id);
    if (!root) return moved;
    const double dx = x - root->x;
    const double dy = y - root->y;
    if (dx == 0.0 && dy == 0.0) return moved;

    std::unordered_set<std::string> seen{id};
    std::deque<std::string> pending{id};
    while (!pending.empty()) {
        BoardObject* obj = find(pending.front());
        pending.pop_front();
        if (!obj) continue;
        obj->x += dx;
        obj->y += dy;
        touchUpdated(obj->id);
        moved.push_back(obj->id);
        if (const FrameData* frame = obj->frame()) {
            for (const auto& childId : frame->children) {
                if (seen.insert(childId).second) pending.push_back(childId);
            }
        }
    }
    return moved;
}

// =============================================================================
// Create tools
// =============================================================================

json BoardToolRunner::createStickyNote(const json& args) {
    const double width = args["width"].get<double>();
    const double height = args["height"].get<double>();
    BoardObject obj = makeBase(ObjectKind::Sticky, placementFor(args, width, height), width, height);
    auto& data = std::get<StickyData>(obj.payload);
    data.text = args["text"].get<std::string>();
    data.color = args["color"].get<std::string>();
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

json BoardToolRunner::createShape(const json& args) {
    const double width = args["width"].get<double>();
    const double height = args["height"].get<double>();
    BoardObject obj = makeBase(ObjectKind::Shape, placementFor(args, width, height), width, height);
    auto& data = std::get<ShapeData>(obj.payload);
    data.shapeKind = args["type"] == "ellipse" ? ShapeKind::Ellipse : ShapeKind::Rectangle;
    data.color = args["color"].get<std::string>();
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

json BoardToolRunner::createFrame(const json& args) {
    const double width = args["width"].get<double>();
    const double height = args["height"].get<double>();
    BoardObject obj = makeBase(ObjectKind::Frame, placementFor(args, width, height), width, height);
    std::get<FrameData>(obj.payload).title = args["title"].get<std::string>();
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

json BoardToolRunner::createText(const json& args) {
    const double width = args["width"].get<double>();
    const double height = args["height"].get<double>();
    BoardObject obj = makeBase(ObjectKind::Text, placementFor(args, width, height), width, height);
    auto& data = std::get<TextData>(obj.payload);
    data.content = args["content"].get<std::string>();
    data.color = args["color"].get<std::string>();
    data.style.bold = args["bold"].get<bool>();
    data.style.italic = args["italic"].get<bool>();
    data.style.size = textSizeFromName(args["fontSize"].get<std::string>());
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

json BoardToolRunner::createConnector(const json& args) {
    const Point defaultPoint = nextPlacement(0.0, 0.0);

    auto liveTarget = [this](const std::optional<std::string>& id) -> const BoardObject* {
        if (!id) return nullptr;
        const BoardObject* obj = object(*id);
        return obj && !obj->isConnector() ? obj : nullptr;
    };
    const BoardObject* from = liveTarget(stringArg(args, "fromId"));
    const BoardObject* to = liveTarget(stringArg(args, "toId"));

    const Point fromPoint = pointFromJson(args["fromPoint"]).value_or(defaultPoint);
    const Point toPoint = pointFromJson(args["toPoint"]).value_or(Point{defaultPoint.x + 180.0, defaultPoint.y + 60.0});

    // A bound end without a port takes the port facing the other end.
    auto endpointFor = [](const BoardObject* target, const json& port, Point freePoint, Point towards) {
        if (!target) return ConnectorEndpoint::freeAt(freePoint);
        if (port.is_string()) {
            if (const auto name = portNameFromString(port.get<std::string>())) {
                return ConnectorEndpoint::bound(target->id, *name);
            }
        }
        return ConnectorEndpoint::bound(target->id, closestPort(*target, towards.x, towards.y).name);
    };
    const Point fromAnchor = from ? objectCenter(*from) : fromPoint;
    const Point toAnchor = to ? objectCenter(*to) : toPoint;

    BoardObject obj = makeBase(ObjectKind::Connector, defaultPoint, 0.0, 0.0);
    auto& data = std::get<ConnectorData>(obj.payload);
    data.from = endpointFor(from, args["fromPort"], fromPoint, toAnchor);
    data.to = endpointFor(to, args["toPort"], toPoint, fromAnchor);
    data.style = args["style"] == "line" ? ConnectorStyle::Line : ConnectorStyle::Arrow;
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

json BoardToolRunner::createTable(const json& args) {
    const int numColumns = args["numColumns"].get<int>();
    const int numRows = args["numRows"].get<int>();

    TableData table;
    table.title = args["title"].get<std::string>();
    table.color = args["color"].get<std::string>();
    for (int c = 1; c <= numColumns; ++c) {
        const std::string colId = "c" + std::to_string(c);
        table.columns.push_back(colId);
        table.columnWidths[colId] = constants::TABLE_DEFAULT_COLUMN_WIDTH;
    }
    for (int r = 1; r <= numRows; ++r) {
        const std::string rowId = "r" + std::to_string(r);
        table.rows.push_back(rowId);
        table.rowHeights[rowId] = constants::TABLE_DEFAULT_ROW_HEIGHT;
    }

    // Headers fill the first row; data rows follow.
    std::vector<json> contentRows;
    if (!args["headers"].empty()) contentRows.push_back(args["headers"]);
    for (const auto& row : args["data"]) contentRows.push_back(row);
    for (std::size_t r = 0; r < contentRows.size() && r < table.rows.size(); ++r) {
        const json& cells = contentRows[r];
        for (std::size_t c = 0; c < cells.size() && c < table.columns.size(); ++c) {
            const std::string text = cells[c].get<std::string>();
            if (!text.empty()) table.cells[table.rows[r] + ":" + table.columns[c]] = text;
        }
    }

    const double width = numColumns * constants::TABLE_DEFAULT_COLUMN_WIDTH;
    const double height = constants::TABLE_TITLE_HEIGHT + numRows * constants::TABLE_DEFAULT_ROW_HEIGHT;
    BoardObject obj = makeBase(ObjectKind::Table, placementFor(args, width, height), width, height);
    obj.payload = std::move(table);
    return json{{"ok", true}, {"objectId", storeCreated(std::move(obj))}};
}

// =============================================================================
// Edit tools
// =============================================================================

json BoardToolRunner::moveObject(const json& args) {
    const auto id = stringArg(args, "objectId");
    const BoardObject* obj = id ? object(*id) : nullptr;
    if (!obj) return failure("Object not found");
    if (obj->isConnector()) return failure("Connectors cannot be moved directly");
    syncMirror(moveWithDescendants(*id, args["x"].get<double>(), args["y"].get<double>()));
    return json{{"ok", true}};
}

json BoardToolRunner::resizeObject(const json& args) {
    const auto id = stringArg(args, "objectId");
    BoardObject* obj = id ? find(*id) : nullptr;
    if (!obj) return failure("Object not found");
    if (obj->isConnector()) return failure("Connectors cannot be resized");
    obj->width = args["width"].get<double>();
    obj->height = args["height"].get<double>();
    touchUpdated(*id);
    syncMirror({*id});
    return json{{"ok", true}};
}

json BoardToolRunner::rotateObject(const json& args) {
    const auto id = stringArg(args, "objectId");
    BoardObject* obj = id ? find(*id) : nullptr;
    if (!obj) return failure("Object not found");
    if (obj->isConnector()) return failure("Connectors cannot be rotated");
    obj->rotation = args["angleDegrees"].get<double>();
    touchUpdated(*id);
    syncMirror({*id});
    return json{{"ok", true}};
}

json BoardToolRunner::updateText(const json& args) {
    const auto id = stringArg(args, "objectId");
    BoardObject* obj = id ? find(*id) : nullptr;
    if (!obj) return failure("Object not found");
    std::string* text = textField(*obj);
    if (!text) return failure("Object type does not support text updates");
    *text = args["newText"].get<std::string>();
    touchUpdated(*id);
    return json{{"ok", true}};
}

json BoardToolRunner::changeColor(const json& args) {
    const auto id = stringArg(args, "objectId");
    BoardObject* obj = id ? find(*id) : nullptr;
    if (!obj) return failure("Object not found");
    std::string* color = colorField(*obj);
    if (!color) return failure("Connectors do not support palette color updates");
    *color = args["color"].get<std::string>();
    touchUpdated(*id);
    return json{{"ok", true}};
}

json BoardToolRunner::deleteObject(const json& args) {
    const auto id = stringArg(args, "objectId");
    if (!id || !removeObject(*id)) return failure("Object not found");
    return json{{"ok", true}};
}

json BoardToolRunner::arrangeObjectsInGrid(const json& args) {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& value : args["objectIds"]) {
        const std::string id = value.get<std::string>();
        const BoardObject* obj = object(id);
        if (!obj || obj->isConnector() || !seen.insert(id).second) continue;
        ids.push_back(id);
    }
    if (ids.empty()) return failure("No valid objects to arrange");

    double cellW = 0.0;
    double cellH = 0.0;
    std::vector<const BoardObject*> selection;
    for (const auto& id : ids) {
        const BoardObject* obj = object(id);
        cellW = std::max(cellW, obj->width);
        cellH = std::max(cellH, obj->height);
        selection.push_back(obj);
    }
    const Bounds bounds = *selectionBounds(selection);

    const std::size_t columns = args["columns"].is_number()
        ? static_cast<std::size_t>(args["columns"].get<double>())
        : static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(ids.size()))));
    const double gapX = args["gapX"].get<double>();
    const double gapY = args["gapY"].get<double>();
    const double originX = numberArg(args, "originX").value_or(bounds.x);
    const double originY = numberArg(args, "originY").value_or(bounds.y);

    // Containment settles once every cell is placed.
    json movedIds = json::array();
    std::vector<std::string> touched;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        const double x = originX + static_cast<double>(i % columns) * (cellW + gapX);
        const double y = originY + static_cast<double>(i / columns) * (cellH + gapY);
        const auto moved = moveWithDescendants(ids[i], x, y);
        touched.insert(touched.end(), moved.begin(), moved.end());
        movedIds.push_back(ids[i]);
    }
    syncMirror(touched);
    return json{{"ok", true}, {"movedIds", movedIds}};
}

// =============================================================================
// Batch tools
// =============================================================================

json BoardToolRunner::createObjects(const json& args) {
    bool allOk = true;
    json createdIds = json::array();
    json results = json::array();
    for (const auto& item : args["items"]) {
        if (item["tool"].is_null()) {
            allOk = false;
            results.push_back(failure("Unsupported object type"));
            continue;
        }
        const Tool tool = tools().at(item["tool"].get<std::string>());
        json result = (this->*tool)(item["args"]);
        if (result.value("ok", false)) {
            createdIds.push_back(result["objectId"]);
        } else {
            allOk = false;
        }
        results.push_back(std::move(result));
    }
    return json{{"ok", allOk}, {"createdIds", createdIds}, {"results", results}};
}

json BoardToolRunner::updateObjects(const json& args) {
    bool allOk = true;
    json results = json::array();
    for (const auto& update : args["updates"]) {
        const auto id = stringArg(update, "objectId");
        BoardObject* obj = id ? find(*id) : nullptr;
        json result;
        const bool moves = !update["x"].is_null() || !update["y"].is_null();
        const bool resizes = !update["width"].is_null() || !update["height"].is_null();
        const bool rotates = !update["rotation"].is_null();
        const bool writesText = !update["text"].is_null();
        const bool recolors = !update["color"].is_null();

        // Every requested change is checked before any is applied.
        if (!obj) {
            result = failure("Object not found");
        } else if (moves && obj->isConnector()) {
            result = failure("Connectors cannot be moved directly");
        } else if (resizes && obj->isConnector()) {
            result = failure("Connectors cannot be resized");
        } else if (rotates && obj->isConnector()) {
            result = failure("Connectors cannot be rotated");
        } else if (writesText && !textField(*obj)) {
            result = failure("Object type does not support text updates");
        } else if (recolors && !colorField(*obj)) {
            result = failure("Connectors do not support palette color updates");
        } else {
            if (resizes) {
                obj->width = update["width"].is_null() ? obj->width : update["width"].get<double>();
                obj->height = update["height"].is_null() ? obj->height : update["height"].get<double>();
            }
            if (rotates) obj->rotation = update["rotation"].get<double>();
            if (writesText) *textField(*obj) = update["text"].get<std::string>();
            if (recolors) *colorField(*obj) = update["color"].get<std::string>();
            if (resizes || rotates || writesText || recolors) touchUpdated(*id);
            std::vector<std::string> touched;
            if (moves) {
                const double x = update["x"].is_null() ? obj->x : update["x"].get<double>();
                const double y = update["y"].is_null() ? obj->y : update["y"].get<double>();
                touched = moveWithDescendants(*id, x, y);
            }
            if (resizes || rotates) touched.push_back(*id);
            syncMirror(touched);
            result = json{{"ok", true}};
        }

        result["objectId"] = id ? json(*id) : json(nullptr);
        allOk = allOk && result["ok"].get<bool>();
        results.push_back(std::move(result));
    }
    return json{{"ok", allOk}, {"results", results}};
}

json BoardToolRunner::deleteObjects(const json& args) {
    json deletedIds = json::array();
    json missingIds = json::array();
    for (const auto& value : args["objectIds"]) {
        const std::string id = value.get<std::string>();
        if (removeObject(id)) {
            deletedIds.push_back(id);
        } else {
            missingIds.push_back(id);
        }
    }
    return json{{"ok", !deletedIds.empty()}, {"deletedIds", deletedIds}, {"missingIds", missingIds}};
}

json BoardToolRunner::getBoardState(const json&) {
    return getCompactBoardState();
}

json BoardToolRunner::getCompactBoardState() const {
    using constants::COORD_LIMIT;
    const ObjectLookup lookup = mirrorLookup();

    json objects = json::array();
    for (const auto& id : order_) {
        const BoardObject* obj = object(id);
        if (!obj) continue;

        json entry = {
            {"id", obj->id},
            {"type", objectKindName(obj->kind())},
            {"x", clampState(obj->x, -COORD_LIMIT, COORD_LIMIT)},
            {"y", clampState(obj->y, -COORD_LIMIT, COORD_LIMIT)},
            {"width", clampState(obj->width, 0.0, COORD_LIMIT)},
            {"height", clampState(obj->height, 0.0, COORD_LIMIT)},
            {"rotation", obj->rotation},
        };
        if (obj->parentFrameId) entry["parentFrameId"] = *obj->parentFrameId;

        switch (obj->kind()) {
            case ObjectKind::Sticky: {
                const auto& data = std::get<StickyData>(obj->payload);
                entry["text"] = truncateUtf8(data.text, constants::STATE_TEXT_LENGTH);
                entry["color"] = data.color;
                break;
            }
            case ObjectKind::Shape: {
                const auto& data = std::get<ShapeData>(obj->payload);
                entry["shapeKind"] = shapeKindName(data.shapeKind);
                entry["color"] = data.color;
                break;
            }
            case ObjectKind::Text: {
                const auto& data = std::get<TextData>(obj->payload);
                entry["content"] = truncateUtf8(data.content, constants::STATE_TEXT_LENGTH);
                entry["color"] = data.color;
                break;
            }
            case ObjectKind::Frame: {
                const auto& data = std::get<FrameData>(obj->payload);
                entry["title"] = truncateUtf8(data.title, constants::STATE_TITLE_LENGTH);
                break;
            }
            case ObjectKind::Table: {
                const auto& data = std::get<TableData>(obj->payload);
                entry["title"] = truncateUtf8(data.title, constants::STATE_TITLE_LENGTH);
                entry["numColumns"] = data.columns.size();
                entry["numRows"] = data.rows.size();
                break;
            }
            case ObjectKind::Connector: {
                const auto& data = std::get<ConnectorData>(obj->payload);
                const ConnectorEndpoints ends = resolveConnectorEndpoints(*obj, lookup);
                entry["fromId"] = data.from.objectId ? json(*data.from.objectId) : json(nullptr);
                entry["toId"] = data.to.objectId ? json(*data.to.objectId) : json(nullptr);
                entry["fromPoint"] = ends.start ? pointJson(*ends.start) : json(nullptr);
                entry["toPoint"] = ends.end ? pointJson(*ends.end) : json(nullptr);
                entry["style"] = connectorStyleName(data.style);
                break;
            }
        }
        objects.push_back(std::move(entry));
    }

    return json{
        {"objectCount", objects.size()},
        {"viewportCenter", pointJson(viewportCenter_)},
        {"objects", objects},
    };
}

// =============================================================================
// Commit
// =============================================================================

ApplyResult BoardToolRunner::applyToDoc() {
    std::vector<std::string> createdFrames;
    for (const auto& id : created_.ids()) {
        const BoardObject* obj = object(id);
        if (obj && obj->isFrame()) createdFrames.push_back(id);
    }
    const std::vector<std::string> relaid = normalizeCreatedFrames(objects_, createdFrames);
    for (const auto& id : relaid) touchUpdated(id);
    syncMirror(relaid);

    std::vector<std::string> written = created_.ids();
    written.insert(written.end(), updated_.ids().begin(), updated_.ids().end());
    const std::unordered_set<std::string> writtenSet(written.begin(), written.end());
    const std::unordered_set<std::string> deleting(deleted_.ids().begin(), deleted_.ids().end());

    std::vector<std::string> vanished;
    doc_.transact(TransactionOrigin::Agent, [&]() {
        std::vector<std::string> resync = written;

        if (!deleting.empty()) {
            // Live connectors the mirror never saw still need their ends frozen.
            const ObjectLookup live = [this](const std::string& id) { return doc_.get(id); };
            std::vector<BoardObject> frozen;
            for (const auto& id : doc_.order()) {
                if (deleting.count(id) || writtenSet.count(id)) continue;
                const BoardObject* obj = doc_.get(id);
                if (!obj || !obj->isConnector()) continue;
                BoardObject next = *obj;
                if (freezeRemovedEndpoints(next, deleting, live)) frozen.push_back(std::move(next));
            }
            for (const auto& conn : frozen) doc_.set(conn);

            for (const auto& [id, obj] : doc_.objects()) {
                if (deleting.count(id)) continue;
                if (obj.parentFrameId && deleting.count(*obj.parentFrameId)) resync.push_back(id);
            }
            for (const auto& id : deleted_.ids()) {
                const BoardObject* obj = doc_.get(id);
                if (obj && obj->parentFrameId && !deleting.count(*obj->parentFrameId)) {
                    if (const BoardObject* parent = doc_.get(*obj->parentFrameId); parent && parent->isFrame()) {
                        BoardObject nextParent = *parent;
                        auto& children = nextParent.frame()->children;
                        children.erase(std::remove(children.begin(), children.end(), id), children.end());
                        doc_.set(nextParent);
                    }
                }
                doc_.erase(id);
                doc_.removeOrder(id);
            }
        }

        // Containment bookkeeping is the live document's; the synchronizer
        // re-derives it for every written id below.
        for (const auto& id : created_.ids()) {
            const BoardObject* mirrored = object(id);
            if (!mirrored) continue;
            BoardObject next = *mirrored;
            next.parentFrameId.reset();
            if (FrameData* frame = next.frame()) frame->children.clear();
            doc_.set(next);
        }

        // Updates carry only the fields the agent changed, so concurrent
        // human edits to other fields survive.
        for (const auto& id : updated_.ids()) {
            const BoardObject* mirrored = object(id);
            const BoardObject* current = doc_.get(id);
            if (!mirrored) continue;
            if (!current) {
                BOARD_LOG_DEBUG("agent update to %s dropped: deleted on the live board", id.c_str());
                vanished.push_back(id);
                continue;
            }
            const auto base = snapshot_.find(id);
            if (base == snapshot_.end()) continue;
            BoardObject next = *current;
            for (const auto& ref : changedFields(base->second, *mirrored)) {
                if (isContainmentField(ref.field)) continue;
                copyField(next, *mirrored, ref);
            }
            doc_.set(next);
        }

        for (const auto& id : created_.ids()) {
            if (!doc_.indexOf(id)) doc_.pushOrder(id);
        }

        ContainmentSynchronizer(doc_).sync(resync);
    });
    for (const auto& id : vanished) updated_.erase(id);

    BOARD_LOG_DEBUG("agent %s applied %zu created, %zu updated, %zu deleted over %zu calls",
                    actorId_.c_str(), created_.size(), updated_.size(), deleted_.size(), toolCalls_.size());
    return ApplyResult{created_.ids(), updated_.ids(), deleted_.ids(), toolCalls_};
}

} // namespace agent
} // namespace board
