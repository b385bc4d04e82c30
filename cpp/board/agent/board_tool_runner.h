#pragma once

#include "board/agent/frame_layout.h"
#include "board/core/id_source.h"
#include "board/document/document.h"
#include "board/geometry/geometry.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace board {
namespace agent {

class UnknownToolError : public std::runtime_error {
public:
    explicit UnknownToolError(const std::string& toolName)
        : std::runtime_error("Unsupported tool: " + toolName), toolName_(toolName) {}

    const std::string& toolName() const noexcept { return toolName_; }

private:
    std::string toolName_;
};

struct ToolRunnerOptions {
    // Raw {x, y}; normalized (clamped, defaulting to the origin) by the runner.
    nlohmann::json viewportCenter;
    // Written to createdBy; a fresh "ai:<id>" when empty.
    std::string actorId;
    IdSource ids;
};

struct ToolCallEntry {
    std::string toolName;
    nlohmann::json args;   // validated
    nlohmann::json result;
};

struct ApplyResult {
    std::vector<std::string> createdIds;
    std::vector<std::string> updatedIds;
    std::vector<std::string> deletedIds;
    std::vector<ToolCallEntry> toolCalls;
};

// Insertion-ordered id set.
class OrderedIdSet {
public:
    bool insert(const std::string& id);
    bool erase(const std::string& id);
    bool contains(const std::string& id) const { return index_.count(id) > 0; }
    const std::vector<std::string>& ids() const noexcept { return ids_; }
    std::size_t size() const noexcept { return ids_.size(); }
    bool empty() const noexcept { return ids_.empty(); }

private:
    std::vector<std::string> ids_;
    std::unordered_set<std::string> index_;
};

/**
 * Offline mirror of a board document driven by an automated agent.
 *
 * The constructor copies the document's objects and z-order; tools mutate
 * only that copy and keep its frame containment current. applyToDoc()
 * commits the created/updated/deleted diff to the live document in one
 * Agent transaction; updated objects contribute only the fields the tools
 * changed, and updates to objects deleted on the live board are dropped. Destroying a runner without
 * applying leaves the document untouched.
 */
class BoardToolRunner {
public:
    explicit BoardToolRunner(Document& doc, ToolRunnerOptions options = {});

    // Validates `args`, runs the tool and logs the call. Throws
    // UnknownToolError for names outside toolNames().
    nlohmann::json invoke(const std::string& toolName, const nlohmann::json& args = nlohmann::json::object());

    nlohmann::json getCompactBoardState() const;

    ApplyResult applyToDoc();

    const BoardObject* object(const std::string& id) const;
    const std::vector<std::string>& order() const noexcept { return order_; }
    const std::string& actorId() const noexcept { return actorId_; }
    Point viewportCenter() const noexcept { return viewportCenter_; }

    const OrderedIdSet& createdIds() const noexcept { return created_; }
    const OrderedIdSet& updatedIds() const noexcept { return updated_; }
    const OrderedIdSet& deletedIds() const noexcept { return deleted_; }
    const std::vector<ToolCallEntry>& toolCalls() const noexcept { return toolCalls_; }

private:
    using Tool = nlohmann::json (BoardToolRunner::*)(const nlohmann::json&);
    static const std::unordered_map<std::string, Tool>& tools();

    // Tools receive validated arguments.
    nlohmann::json createStickyNote(const nlohmann::json& args);
    nlohmann::json createShape(const nlohmann::json& args);
    nlohmann::json createFrame(const nlohmann::json& args);
    nlohmann::json createConnector(const nlohmann::json& args);
    nlohmann::json createText(const nlohmann::json& args);
    nlohmann::json createTable(const nlohmann::json& args);
    nlohmann::json moveObject(const nlohmann::json& args);
    nlohmann::json resizeObject(const nlohmann::json& args);
    nlohmann::json rotateObject(const nlohmann::json& args);
    nlohmann::json updateText(const nlohmann::json& args);
    nlohmann::json changeColor(const nlohmann::json& args);
    nlohmann::json deleteObject(const nlohmann::json& args);
    nlohmann::json arrangeObjectsInGrid(const nlohmann::json& args);
    nlohmann::json createObjects(const nlohmann::json& args);
    nlohmann::json updateObjects(const nlohmann::json& args);
    nlohmann::json deleteObjects(const nlohmann::json& args);
    nlohmann::json getBoardState(const nlohmann::json& args);

    Point nextPlacement(double width, double height);
    Point placementFor(const nlohmann::json& args, double width, double height);
    BoardObject makeBase(ObjectKind kind, Point at, double width, double height);
    std::string storeCreated(BoardObject obj);
    void storeUpdated(const BoardObject& obj);
    void touchUpdated(const std::string& id);
    bool removeObject(const std::string& id);
    // Moves `id` and its frame contents; returns every moved id.
    std::vector<std::string> moveWithDescendants(const std::string& id, double x, double y);
    void syncMirror(const std::vector<std::string>& ids);
    BoardObject* find(const std::string& id);
    ObjectLookup mirrorLookup() const;

    Document& doc_;
    ObjectMap objects_;
    ObjectMap snapshot_;  // objects_ as copied at construction
    std::vector<std::string> order_;
    std::string actorId_;
    Point viewportCenter_;
    IdSource ids_;
    int placementCount_ = 0;

    OrderedIdSet created_;
    OrderedIdSet updated_;
    OrderedIdSet deleted_;
    std::vector<ToolCallEntry> toolCalls_;
};

} // namespace agent
} // namespace board
