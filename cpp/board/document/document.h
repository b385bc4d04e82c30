#pragma once

#include "board/document/document_types.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace board {

// In-process replicated board document: an object map keyed by id, one
// global z-order list, and atomic transactions that produce change records.
//
// Mutations made outside transact() are wrapped in their own Baseline
// transaction. Nested transact() calls join the outermost one.
class Document {
public:
    using Listener = std::function<void(const DocTransaction&)>;
    using ListenerHandle = std::size_t;

    explicit Document(std::uint32_t clientId = 1);

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    std::uint32_t clientId() const noexcept { return clientId_; }
    std::uint64_t clock() const noexcept { return clock_; }

    void transact(TransactionOrigin origin, const std::function<void()>& fn);
    bool inTransaction() const noexcept { return pending_.active; }
    TransactionOrigin currentOrigin() const noexcept { return pending_.record.origin; }

    // Object map
    const BoardObject* get(const std::string& id) const;
    bool contains(const std::string& id) const { return objects_.count(id) > 0; }
    void set(const BoardObject& obj);
    bool erase(const std::string& id);
    const std::unordered_map<std::string, BoardObject>& objects() const noexcept { return objects_; }
    std::size_t size() const noexcept { return objects_.size(); }

    // Z-order
    const std::vector<std::string>& order() const noexcept { return order_; }
    std::optional<std::size_t> indexOf(const std::string& id) const;
    void pushOrder(const std::string& id);
    void insertOrder(const std::string& id, std::size_t index);
    bool removeOrder(const std::string& id);

    ListenerHandle addListener(Listener listener);
    void removeListener(ListenerHandle handle);

    // Merge a transaction committed by another replica. Each leaf field merges
    // last-writer-wins by stamp, a deletion beats concurrent field edits, and
    // z-order edits apply idempotently.
    void applyRemote(const DocTransaction& update);

    // Apply the inverse (revert) or forward (replay) effect of a recorded
    // transaction. Joins the open transaction, else opens a History one.
    // Updates restore only the fields the record changed, so later edits to
    // other fields survive.
    void revert(const DocTransaction& record);
    void replay(const DocTransaction& record);

private:
    void begin(TransactionOrigin origin);
    void commit();
    void markChange(const std::string& id);
    void applyRecord(const std::string& id, const std::optional<BoardObject>& value);
    void applyFields(const std::string& id, const BoardObject& from, const BoardObject& to);
    Stamp fieldStamp(const std::string& id, const std::string& key) const;

    std::uint32_t clientId_;
    std::uint64_t clock_ = 0;
    std::unordered_map<std::string, BoardObject> objects_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Stamp> stamps_;  // last create or erase
    std::unordered_map<std::string, std::unordered_map<std::string, Stamp>> fieldStamps_;
    PendingTransaction pending_;

    std::vector<std::pair<ListenerHandle, Listener>> listeners_;
    ListenerHandle nextListener_ = 1;
};

} // namespace board
