#pragma once

#include "board/connector/connector_resolver.h"
#include "board/core/id_source.h"
#include "board/document/document.h"
#include "board/entity/containment.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace board {

struct ObjectStoreOptions {
    // Written to createdBy on objects this store creates or pastes.
    std::string actorName = "local";
    IdSource ids;
};

// Self-contained copy of a selection; cross-references point only inside it.
struct ClipboardPayload {
    std::vector<BoardObject> objects;
};

enum class PasteMode : std::uint8_t {
    Absolute = 0, // center the selection on the given point
    Relative = 1, // offset every object by the given delta
};

/**
 * Canonical CRUD over the board document. Every mutating call runs as one
 * transaction tagged with the store's current origin and re-syncs frame
 * containment before the transaction commits.
 *
 * Calls naming a missing id or an unsupported variant are ignored and leave
 * the reason in lastError().
 */
class ObjectStore {
public:
    explicit ObjectStore(Document& doc, ObjectStoreOptions options = {});

    Document& document() noexcept { return doc_; }
    const Document& document() const noexcept { return doc_; }

    TransactionOrigin origin() const noexcept { return origin_; }
    void setOrigin(TransactionOrigin origin) noexcept { origin_ = origin; }
    // Run `fn` with the origin temporarily switched.
    void withOrigin(TransactionOrigin origin, const std::function<void()>& fn);

    BoardError lastError() const noexcept { return lastError_; }

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------
    const BoardObject* get(const std::string& id) const;

    // Frames first, then everything else; each group in z-order. Pointers
    // stay valid until the next mutation.
    std::vector<const BoardObject*> getAll() const;

    std::optional<Bounds> getSelectionBounds(const std::vector<std::string>& ids) const;
    std::optional<AttachTarget> getAttachableAtPoint(double x, double y, const std::vector<std::string>& excludeIds = {}) const;

    // Topmost object under (x, y); connectors hit within a small tolerance of their path.
    std::optional<std::string> objectAtPoint(double x, double y) const;

    ObjectLookup lookup() const;

    // ------------------------------------------------------------------
    // Core mutations
    // ------------------------------------------------------------------
    std::string create(ObjectKind kind, double x, double y, double width, double height, const ObjectPatch& extra = {});
    void createFromSnapshot(const BoardObject& snapshot);
    bool update(const std::string& id, const ObjectPatch& patch);
    void move(const std::vector<std::string>& ids, double dx, double dy);
    void moveTo(const std::string& id, double x, double y);
    bool resize(const std::string& id, double x, double y, double width, double height);
    void rotate(const std::vector<std::string>& ids, double deltaDeg, std::optional<Point> pivot = std::nullopt);
    void deleteObjects(const std::vector<std::string>& ids);
    void deleteObject(const std::string& id) { deleteObjects({id}); }
    void bringToFront(const std::string& id);

    ClipboardPayload serializeSelection(const std::vector<std::string>& ids) const;
    std::vector<std::string> pasteSerialized(const ClipboardPayload& payload, Point placement, PasteMode mode = PasteMode::Absolute);
    std::vector<std::string> duplicate(const std::vector<std::string>& ids, Point offset = Point{20.0, 20.0});

    // ------------------------------------------------------------------
    // Content edits
    // ------------------------------------------------------------------
    bool updateText(const std::string& id, const std::string& text);
    bool updateTextStyle(const std::string& id, const TextStyle& style);
    bool updateColor(const std::string& id, const std::string& color);
    bool updateConnectorEndpoint(const std::string& id, ConnectorSide side, const ConnectorEndpoint& endpoint);
    std::string startConnector(double x, double y);

    // Tables
    bool updateTableCell(const std::string& id, const std::string& rowId, const std::string& colId, const std::string& text);
    bool updateTableRowHeight(const std::string& id, const std::string& rowId, double height);
    bool addTableRow(const std::string& id);
    bool deleteTableRow(const std::string& id, const std::string& rowId);
    bool addTableColumn(const std::string& id);
    bool deleteTableColumn(const std::string& id, const std::string& colId);

private:
    void mutate(const std::function<void()>& fn);
    // Looks up `id`, recording NotFound when missing.
    const BoardObject* require(const std::string& id) const;
    const BoardObject* requireKind(const std::string& id, ObjectKind kind) const;
    bool fail(BoardError error, const char* op, const std::string& id) const;
    void writeTable(const BoardObject& obj, TableData table);
    std::vector<std::string> expandWithDescendants(const std::vector<std::string>& ids) const;

    Document& doc_;
    ContainmentSynchronizer containment_;
    std::string actorName_;
    IdSource ids_;
    TransactionOrigin origin_ = TransactionOrigin::Baseline;
    mutable BoardError lastError_ = BoardError::Ok;
};

} // namespace board
