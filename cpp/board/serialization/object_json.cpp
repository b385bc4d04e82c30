#include "board/serialization/object_json.h"

#include <map>
#include <optional>
#include <type_traits>
#include <vector>

namespace board {

namespace {

constexpr const char* kClipboardKind = "board-clipboard";

std::string stringOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double numberOr(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

bool boolOr(const nlohmann::json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

std::optional<Point> pointFrom(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("x") || !j["x"].is_number() || !j.contains("y") || !j["y"].is_number()) {
        return std::nullopt;
    }
    return Point{j["x"].get<double>(), j["y"].get<double>()};
}

std::vector<std::string> stringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

template <typename Value>
void readMap(const nlohmann::json& j, const char* key, std::map<std::string, Value>& out) {
    if (!j.contains(key) || !j[key].is_object()) return;
    for (auto it = j[key].begin(); it != j[key].end(); ++it) {
        if constexpr (std::is_same_v<Value, double>) {
            if (it.value().is_number()) out[it.key()] = it.value().get<double>();
        } else {
            if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
        }
    }
}

TextSize textSizeFrom(const std::string& s) {
    if (s == "small") return TextSize::Small;
    if (s == "large") return TextSize::Large;
    return TextSize::Medium;
}

void writeEndpoint(nlohmann::json& j, const char* prefix, const ConnectorEndpoint& ep) {
    const std::string p(prefix);
    j[p + "Id"] = ep.objectId ? nlohmann::json(*ep.objectId) : nlohmann::json(nullptr);
    j[p + "Port"] = ep.port ? nlohmann::json(portNameString(*ep.port)) : nlohmann::json(nullptr);
    j[p + "Point"] = ep.point ? pointToJson(*ep.point) : nlohmann::json(nullptr);
}

ConnectorEndpoint readEndpoint(const nlohmann::json& j, const char* prefix) {
    const std::string p(prefix);
    const std::string idKey = p + "Id";
    const std::string portKey = p + "Port";
    const std::string pointKey = p + "Point";
    if (j.contains(idKey) && j[idKey].is_string()) {
        // A bound endpoint without a port resolves to the object's center.
        ConnectorEndpoint ep;
        ep.objectId = j[idKey].get<std::string>();
        if (j.contains(portKey) && j[portKey].is_string()) ep.port = portNameFromString(j[portKey].get<std::string>());
        return ep;
    }
    if (j.contains(pointKey)) {
        if (const auto point = pointFrom(j[pointKey])) return ConnectorEndpoint::freeAt(*point);
    }
    return ConnectorEndpoint{};
}

} // namespace

nlohmann::json pointToJson(const Point& p) {
    return nlohmann::json{{"x", p.x}, {"y", p.y}};
}

nlohmann::json objectToJson(const BoardObject& obj) {
    nlohmann::json j;
    j["id"] = obj.id;
    j["type"] = objectKindName(obj.kind());
    j["x"] = obj.x;
    j["y"] = obj.y;
    j["width"] = obj.width;
    j["height"] = obj.height;
    j["rotation"] = obj.rotation;
    j["createdBy"] = obj.createdBy;
    j["parentFrameId"] = obj.parentFrameId ? nlohmann::json(*obj.parentFrameId) : nlohmann::json(nullptr);

    switch (obj.kind()) {
        case ObjectKind::Sticky: {
            const auto& d = std::get<StickyData>(obj.payload);
            j["text"] = d.text;
            j["color"] = d.color;
            break;
        }
        case ObjectKind::Shape: {
            const auto& d = std::get<ShapeData>(obj.payload);
            j["shapeKind"] = shapeKindName(d.shapeKind);
            j["color"] = d.color;
            j["strokeColor"] = d.strokeColor;
            break;
        }
        case ObjectKind::Text: {
            const auto& d = std::get<TextData>(obj.payload);
            j["content"] = d.content;
            j["color"] = d.color;
            j["style"] = {{"bold", d.style.bold}, {"italic", d.style.italic}, {"size", textSizeName(d.style.size)}};
            break;
        }
        case ObjectKind::Connector: {
            const auto& d = std::get<ConnectorData>(obj.payload);
            writeEndpoint(j, "from", d.from);
            writeEndpoint(j, "to", d.to);
            j["style"] = connectorStyleName(d.style);
            j["points"] = nlohmann::json::array();
            for (const auto& p : d.points) j["points"].push_back(pointToJson(p));
            break;
        }
        case ObjectKind::Frame: {
            const auto& d = std::get<FrameData>(obj.payload);
            j["title"] = d.title;
            j["color"] = d.color;
            j["children"] = d.children;
            break;
        }
        case ObjectKind::Table: {
            const auto& d = std::get<TableData>(obj.payload);
            j["title"] = d.title;
            j["color"] = d.color;
            j["columns"] = d.columns;
            j["rows"] = d.rows;
            j["columnWidths"] = d.columnWidths;
            j["rowHeights"] = d.rowHeights;
            j["cells"] = d.cells;
            break;
        }
    }
    return j;
}

BoardObject objectFromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw SerializationError("board object must be a JSON object");
    if (!j.contains("id") || !j["id"].is_string()) throw SerializationError("board object is missing an id");
    if (!j.contains("type") || !j["type"].is_string()) throw SerializationError("board object is missing a type");

    const std::string type = j["type"].get<std::string>();
    const auto kind = objectKindFromName(type);
    if (!kind) throw SerializationError("unknown board object type: " + type);

    BoardObject obj;
    obj.id = j["id"].get<std::string>();
    obj.x = numberOr(j, "x", 0.0);
    obj.y = numberOr(j, "y", 0.0);
    obj.width = numberOr(j, "width", 0.0);
    obj.height = numberOr(j, "height", 0.0);
    obj.rotation = numberOr(j, "rotation", 0.0);
    obj.createdBy = stringOr(j, "createdBy", "");
    if (j.contains("parentFrameId") && j["parentFrameId"].is_string()) {
        obj.parentFrameId = j["parentFrameId"].get<std::string>();
    }
    obj.payload = defaultPayload(*kind);

    switch (*kind) {
        case ObjectKind::Sticky: {
            auto& d = std::get<StickyData>(obj.payload);
            d.text = stringOr(j, "text", d.text);
            d.color = stringOr(j, "color", d.color);
            break;
        }
        case ObjectKind::Shape: {
            auto& d = std::get<ShapeData>(obj.payload);
            // Legacy records carry the shape kind in `type`.
            const std::string shapeKind = stringOr(j, "shapeKind", type);
            d.shapeKind = shapeKind == "ellipse" ? ShapeKind::Ellipse : ShapeKind::Rectangle;
            d.color = stringOr(j, "color", d.color);
            d.strokeColor = stringOr(j, "strokeColor", d.strokeColor);
            break;
        }
        case ObjectKind::Text: {
            auto& d = std::get<TextData>(obj.payload);
            d.content = stringOr(j, "content", d.content);
            d.color = stringOr(j, "color", d.color);
            if (j.contains("style") && j["style"].is_object()) {
                const auto& s = j["style"];
                d.style.bold = boolOr(s, "bold", false);
                d.style.italic = boolOr(s, "italic", false);
                d.style.size = textSizeFrom(stringOr(s, "size", "medium"));
            }
            break;
        }
        case ObjectKind::Connector: {
            auto& d = std::get<ConnectorData>(obj.payload);
            d.from = readEndpoint(j, "from");
            d.to = readEndpoint(j, "to");
            d.style = stringOr(j, "style", "arrow") == "line" ? ConnectorStyle::Line : ConnectorStyle::Arrow;
            if (j.contains("points") && j["points"].is_array()) {
                for (const auto& p : j["points"]) {
                    if (const auto point = pointFrom(p)) d.points.push_back(*point);
                }
            }
            break;
        }
        case ObjectKind::Frame: {
            auto& d = std::get<FrameData>(obj.payload);
            d.title = stringOr(j, "title", d.title);
            d.color = stringOr(j, "color", d.color);
            d.children = stringList(j, "children");
            break;
        }
        case ObjectKind::Table: {
            auto& d = std::get<TableData>(obj.payload);
            d.title = stringOr(j, "title", d.title);
            d.color = stringOr(j, "color", d.color);
            if (j.contains("columns") && j["columns"].is_array()) {
                d.columns = stringList(j, "columns");
                d.columnWidths.clear();
            }
            if (j.contains("rows") && j["rows"].is_array()) {
                d.rows = stringList(j, "rows");
                d.rowHeights.clear();
            }
            readMap(j, "columnWidths", d.columnWidths);
            readMap(j, "rowHeights", d.rowHeights);
            readMap(j, "cells", d.cells);
            break;
        }
    }
    return obj;
}

std::string clipboardToString(const ClipboardPayload& payload) {
    nlohmann::json j;
    j["kind"] = kClipboardKind;
    j["objects"] = nlohmann::json::array();
    for (const auto& obj : payload.objects) j["objects"].push_back(objectToJson(obj));
    return j.dump();
}

ClipboardPayload clipboardFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw SerializationError(std::string("clipboard is not valid JSON: ") + e.what());
    }
    if (!j.is_object() || stringOr(j, "kind", "") != kClipboardKind) {
        throw SerializationError("clipboard does not hold board objects");
    }
    if (!j.contains("objects") || !j["objects"].is_array()) {
        throw SerializationError("clipboard is missing its object list");
    }

    ClipboardPayload payload;
    for (const auto& item : j["objects"]) {
        payload.objects.push_back(objectFromJson(item));
    }
    return payload;
}

} // namespace board
