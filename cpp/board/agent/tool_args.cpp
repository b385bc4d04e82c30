#include "board/agent/tool_args.h"
#include "board/core/board_constants.h"
#include "board/core/string_utils.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <unordered_map>

namespace board {
namespace agent {

namespace {

using nlohmann::json;
using constants::COORD_LIMIT;

const json& field(const json& args, const char* key) {
    static const json kNull;
    if (!args.is_object()) return kNull;
    const auto it = args.find(key);
    return it == args.end() ? kNull : *it;
}

json coordOrNull(const json& value) {
    if (!value.is_number()) return nullptr;
    return clampNumber(value, -COORD_LIMIT, COORD_LIMIT, 0.0);
}

json stringOrNull(const json& value) {
    if (!value.is_string()) return nullptr;
    return value.get<std::string>();
}

json pointOrNull(const json& value) {
    if (!value.is_object()) return nullptr;
    return json{
        {"x", clampNumber(field(value, "x"), -COORD_LIMIT, COORD_LIMIT, 0.0)},
        {"y", clampNumber(field(value, "y"), -COORD_LIMIT, COORD_LIMIT, 0.0)},
    };
}

json portOrNull(const json& value) {
    if (!value.is_string()) return nullptr;
    const auto port = portNameFromString(toLowerAscii(value.get<std::string>()));
    if (!port) return nullptr;
    return portNameString(*port);
}

bool truthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) {
        const double n = value.get<double>();
        return n != 0.0 && !std::isnan(n);
    }
    if (value.is_string()) return !value.get<std::string>().empty();
    return value.is_object() || value.is_array();
}

std::string enumOr(const json& value, const std::vector<std::string>& allowed, const std::string& fallback) {
    if (!value.is_string()) return fallback;
    const std::string s = value.get<std::string>();
    return std::find(allowed.begin(), allowed.end(), s) != allowed.end() ? s : fallback;
}

json stringArray(const json& value, std::size_t maxItems) {
    json out = json::array();
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (out.size() >= maxItems) break;
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

bool isHexColor(const json& value) {
    if (!value.is_string()) return false;
    const std::string s = value.get<std::string>();
    if (s.size() != 7 || s[0] != '#') return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

json createStickyNote(const json& a) {
    return json{
        {"text", clampText(field(a, "text"), constants::MAX_TEXT_LENGTH)},
        {"x", coordOrNull(field(a, "x"))},
        {"y", coordOrNull(field(a, "y"))},
        {"width", clampNumber(field(a, "width"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_STICKY_SIZE)},
        {"height", clampNumber(field(a, "height"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_STICKY_SIZE)},
        {"color", sanitizeColor(field(a, "color"), "yellow")},
    };
}

json createShape(const json& a) {
    const std::string type = enumOr(field(a, "type"), {"rectangle", "ellipse"}, "rectangle");
    return json{
        {"type", type},
        {"x", coordOrNull(field(a, "x"))},
        {"y", coordOrNull(field(a, "y"))},
        {"width", clampNumber(field(a, "width"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_SHAPE_WIDTH)},
        {"height", clampNumber(field(a, "height"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_SHAPE_HEIGHT)},
        {"color", sanitizeColor(field(a, "color"), type == "ellipse" ? "teal" : "blue")},
    };
}

json createFrame(const json& a) {
    std::string title = clampText(field(a, "title"), constants::MAX_TITLE_LENGTH, "Frame");
    if (title.empty()) title = "Frame";
    return json{
        {"title", title},
        {"x", coordOrNull(field(a, "x"))},
        {"y", coordOrNull(field(a, "y"))},
        {"width", clampNumber(field(a, "width"), constants::MIN_FRAME_SIZE, constants::MAX_FRAME_SIZE, constants::DEFAULT_FRAME_WIDTH)},
        {"height", clampNumber(field(a, "height"), constants::MIN_FRAME_SIZE, constants::MAX_FRAME_SIZE, constants::DEFAULT_FRAME_HEIGHT)},
    };
}

json createConnector(const json& a) {
    return json{
        {"fromId", stringOrNull(field(a, "fromId"))},
        {"toId", stringOrNull(field(a, "toId"))},
        {"fromPort", portOrNull(field(a, "fromPort"))},
        {"toPort", portOrNull(field(a, "toPort"))},
        {"fromPoint", pointOrNull(field(a, "fromPoint"))},
        {"toPoint", pointOrNull(field(a, "toPoint"))},
        {"style", enumOr(field(a, "style"), {"line", "arrow"}, "arrow")},
    };
}

json createTable(const json& a) {
    json headers = json::array();
    const json& rawHeaders = field(a, "headers");
    if (rawHeaders.is_array()) {
        for (const auto& h : rawHeaders) {
            if (headers.size() >= static_cast<std::size_t>(constants::MAX_TABLE_COLUMNS)) break;
            if (h.is_string()) headers.push_back(truncateUtf8(h.get<std::string>(), constants::MAX_TABLE_TITLE_LENGTH));
        }
    }

    json data = json::array();
    std::size_t widest = 0;
    const json& rawData = field(a, "data");
    if (rawData.is_array()) {
        for (const auto& row : rawData) {
            if (data.size() >= static_cast<std::size_t>(constants::MAX_TABLE_ROWS)) break;
            json cells = json::array();
            if (row.is_array()) {
                for (const auto& cell : row) {
                    if (cells.size() >= static_cast<std::size_t>(constants::MAX_TABLE_COLUMNS)) break;
                    cells.push_back(clampText(cell, constants::MAX_CELL_LENGTH));
                }
            }
            widest = std::max(widest, cells.size());
            data.push_back(std::move(cells));
        }
    }

    int numColumns = static_cast<int>(clampNumber(field(a, "numColumns"), 1, constants::MAX_TABLE_COLUMNS, 3));
    if (!headers.empty()) {
        numColumns = static_cast<int>(headers.size());
    } else if (widest > 0) {
        numColumns = static_cast<int>(widest);
    }

    int numRows = static_cast<int>(clampNumber(field(a, "numRows"), 1, constants::MAX_TABLE_ROWS, 3));
    const std::size_t contentRows = data.size() + (headers.empty() ? 0 : 1);
    if (contentRows > 0) {
        numRows = static_cast<int>(std::min<std::size_t>(contentRows, constants::MAX_TABLE_ROWS));
    }

    std::string title = clampText(field(a, "title"), constants::MAX_TABLE_TITLE_LENGTH, "Table");
    if (title.empty()) title = "Table";
    return json{
        {"title", title},
        {"headers", headers},
        {"data", data},
        {"numColumns", numColumns},
        {"numRows", numRows},
        {"x", coordOrNull(field(a, "x"))},
        {"y", coordOrNull(field(a, "y"))},
        {"color", isHexColor(field(a, "color")) ? field(a, "color").get<std::string>() : std::string("#e2e8f0")},
    };
}

json createText(const json& a) {
    return json{
        {"content", clampText(field(a, "content"), constants::MAX_CONTENT_LENGTH)},
        {"x", coordOrNull(field(a, "x"))},
        {"y", coordOrNull(field(a, "y"))},
        {"width", clampNumber(field(a, "width"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_TEXT_WIDTH)},
        {"height", clampNumber(field(a, "height"), constants::MIN_OBJECT_SIZE, constants::MAX_OBJECT_SIZE, constants::DEFAULT_TEXT_HEIGHT)},
        {"fontSize", enumOr(field(a, "fontSize"), {"small", "medium", "large"}, "medium")},
        {"bold", truthy(field(a, "bold"))},
        {"italic", truthy(field(a, "italic"))},
        {"color", sanitizeColor(field(a, "color"), "black")},
    };
}

json moveObject(const json& a) {
    return json{
        {"objectId", stringOrNull(field(a, "objectId"))},
        {"x", clampNumber(field(a, "x"), -COORD_LIMIT, COORD_LIMIT, 0.0)},
        {"y", clampNumber(field(a, "y"), -COORD_LIMIT, COORD_LIMIT, 0.0)},
    };
}

json resizeObject(const json& a) {
    return json{
        {"objectId", stringOrNull(field(a, "objectId"))},
        {"width", clampNumber(field(a, "width"), constants::MIN_OBJECT_SIZE, constants::MAX_RESIZE_SIZE, 120.0)},
        {"height", clampNumber(field(a, "height"), constants::MIN_OBJECT_SIZE, constants::MAX_RESIZE_SIZE, 80.0)},
    };
}

json arrangeObjectsInGrid(const json& a) {
    const json& columns = field(a, "columns");
    const json& originX = field(a, "originX");
    const json& originY = field(a, "originY");
    return json{
        {"objectIds", stringArray(field(a, "objectIds"), constants::MAX_GRID_IDS)},
        {"columns", columns.is_number() ? json(std::floor(clampNumber(columns, 1, 24, 3))) : json(nullptr)},
        {"gapX", clampNumber(field(a, "gapX"), 0, 1000, constants::LAYOUT_GAP)},
        {"gapY", clampNumber(field(a, "gapY"), 0, 1000, constants::LAYOUT_GAP)},
        {"originX", coordOrNull(originX)},
        {"originY", coordOrNull(originY)},
    };
}

json updateText(const json& a) {
    return json{
        {"objectId", stringOrNull(field(a, "objectId"))},
        {"newText", clampText(field(a, "newText"), constants::MAX_CONTENT_LENGTH)},
    };
}

json changeColor(const json& a) {
    return json{
        {"objectId", stringOrNull(field(a, "objectId"))},
        {"color", sanitizeColor(field(a, "color"), "black")},
    };
}

json rotateObject(const json& a) {
    const json& angle = field(a, "angleDegrees");
    return json{
        {"objectId", stringOrNull(field(a, "objectId"))},
        {"angleDegrees", normalizeAngle(angle.is_number() ? angle.get<double>() : 0.0)},
    };
}

json deleteObject(const json& a) {
    return json{{"objectId", stringOrNull(field(a, "objectId"))}};
}

json getBoardState(const json&) {
    return json::object();
}

json createObjects(const json& a) {
    json items = json::array();
    const json& raw = field(a, "items");
    if (!raw.is_array()) return json{{"items", items}};
    for (const auto& item : raw) {
        if (items.size() >= static_cast<std::size_t>(constants::MAX_BATCH_ITEMS)) break;
        const json& type = field(item, "type");
        const std::string tool = type.is_string() ? createToolForType(toLowerAscii(type.get<std::string>())) : std::string();
        if (tool.empty()) {
            items.push_back(json{{"tool", nullptr}, {"type", type.is_string() ? type : json(nullptr)}});
            continue;
        }
        items.push_back(json{{"tool", tool}, {"args", validateToolArgs(tool, item)}});
    }
    return json{{"items", items}};
}

json updateObjects(const json& a) {
    json updates = json::array();
    const json& raw = field(a, "updates");
    if (!raw.is_array()) return json{{"updates", updates}};
    for (const auto& item : raw) {
        if (updates.size() >= static_cast<std::size_t>(constants::MAX_BATCH_ITEMS)) break;
        const json& width = field(item, "width");
        const json& height = field(item, "height");
        const json& rotation = field(item, "rotation");
        const json& text = field(item, "text");
        const json& color = field(item, "color");
        updates.push_back(json{
            {"objectId", stringOrNull(field(item, "objectId"))},
            {"x", coordOrNull(field(item, "x"))},
            {"y", coordOrNull(field(item, "y"))},
            {"width", width.is_number() ? json(clampNumber(width, constants::MIN_OBJECT_SIZE, constants::MAX_RESIZE_SIZE, 120.0)) : json(nullptr)},
            {"height", height.is_number() ? json(clampNumber(height, constants::MIN_OBJECT_SIZE, constants::MAX_RESIZE_SIZE, 80.0)) : json(nullptr)},
            {"rotation", rotation.is_number() ? json(normalizeAngle(rotation.get<double>())) : json(nullptr)},
            {"text", text.is_string() ? json(clampText(text, constants::MAX_CONTENT_LENGTH)) : json(nullptr)},
            {"color", color.is_null() ? json(nullptr) : json(sanitizeColor(color, "black"))},
        });
    }
    return json{{"updates", updates}};
}

json deleteObjects(const json& a) {
    return json{{"objectIds", stringArray(field(a, "objectIds"), constants::MAX_GRID_IDS)}};
}

using Validator = std::function<json(const json&)>;

const std::unordered_map<std::string, Validator>& validators() {
    static const std::unordered_map<std::string, Validator> table = {
        {"createStickyNote", createStickyNote},
        {"createShape", createShape},
        {"createFrame", createFrame},
        {"createConnector", createConnector},
        {"createText", createText},
        {"createTable", createTable},
        {"moveObject", moveObject},
        {"resizeObject", resizeObject},
        {"rotateObject", rotateObject},
        {"updateText", updateText},
        {"changeColor", changeColor},
        {"deleteObject", deleteObject},
        {"arrangeObjectsInGrid", arrangeObjectsInGrid},
        {"createObjects", createObjects},
        {"updateObjects", updateObjects},
        {"deleteObjects", deleteObjects},
        {"getBoardState", getBoardState},
    };
    return table;
}

} // namespace

const std::vector<std::string>& paletteNames() {
    static const std::vector<std::string> names = {
        "yellow", "blue", "green", "pink", "purple", "orange", "red", "teal", "black",
    };
    return names;
}

const std::vector<std::string>& toolNames() {
    static const std::vector<std::string> names = {
        "createStickyNote", "createShape", "createFrame", "createConnector", "createText", "createTable",
        "moveObject", "resizeObject", "rotateObject", "updateText", "changeColor", "deleteObject",
        "arrangeObjectsInGrid", "createObjects", "updateObjects", "deleteObjects", "getBoardState",
    };
    return names;
}

bool isKnownTool(const std::string& name) {
    return validators().count(name) > 0;
}

double clampNumber(const nlohmann::json& value, double min, double max, double fallback) {
    if (!value.is_number()) return fallback;
    const double n = value.get<double>();
    if (std::isnan(n)) return fallback;
    if (n < min) return min;
    if (n > max) return max;
    return n;
}

std::string sanitizeColor(const nlohmann::json& value, const std::string& fallback) {
    if (!value.is_string()) return fallback;
    const std::string s = value.get<std::string>();
    const auto& palette = paletteNames();
    return std::find(palette.begin(), palette.end(), s) != palette.end() ? s : fallback;
}

std::string clampText(const nlohmann::json& value, std::size_t maxCodepoints, const std::string& fallback) {
    if (!value.is_string()) return fallback;
    return truncateUtf8(value.get<std::string>(), maxCodepoints);
}

Point normalizeViewportCenter(const nlohmann::json& value) {
    if (!value.is_object()) return Point{0.0, 0.0};
    return Point{
        clampNumber(field(value, "x"), -COORD_LIMIT, COORD_LIMIT, 0.0),
        clampNumber(field(value, "y"), -COORD_LIMIT, COORD_LIMIT, 0.0),
    };
}

nlohmann::json validateToolArgs(const std::string& toolName, const nlohmann::json& raw) {
    const auto& table = validators();
    const auto it = table.find(toolName);
    if (it == table.end()) return json::object();
    return it->second(raw.is_object() ? raw : json::object());
}

std::string createToolForType(const std::string& type) {
    if (type == "sticky" || type == "sticky_note" || type == "stickynote" || type == "note") return "createStickyNote";
    if (type == "shape" || type == "rectangle" || type == "ellipse") return "createShape";
    if (type == "frame") return "createFrame";
    if (type == "connector") return "createConnector";
    if (type == "text") return "createText";
    if (type == "table") return "createTable";
    return "";
}

} // namespace agent
} // namespace board
