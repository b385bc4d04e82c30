#pragma once

#include "board/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace board {

// Tag identifying the activity that produced a transaction. Undo grouping
// keys off it; Remote and History transactions are never recorded as steps.
enum class TransactionOrigin : std::uint8_t {
    Baseline = 0,
    Gesture  = 1,
    Drag     = 2,
    TextEdit = 3,
    Agent    = 4,
    Remote   = 5,
    History  = 6,
};

const char* transactionOriginName(TransactionOrigin origin) noexcept;

// Lamport timestamp used for last-writer-wins merge of object records.
struct Stamp {
    std::uint64_t clock = 0;
    std::uint32_t clientId = 0;
};

inline bool operator<(const Stamp& a, const Stamp& b) {
    if (a.clock != b.clock) return a.clock < b.clock;
    return a.clientId < b.clientId;
}

// One object record change inside a transaction. Absent before means the
// object was created; absent after means it was erased.
struct EntityChange {
    std::string id;
    std::optional<BoardObject> before;
    std::optional<BoardObject> after;
};

enum class OrderOpKind : std::uint8_t {
    Insert = 0,
    Remove = 1,
};

// Z-order edit. `index` is where the id was inserted or removed from.
struct OrderOp {
    OrderOpKind kind;
    std::string id;
    std::size_t index;
};

// The document's native history record for one committed transaction.
struct DocTransaction {
    TransactionOrigin origin = TransactionOrigin::Baseline;
    Stamp stamp;
    std::vector<EntityChange> changes;
    std::vector<OrderOp> orderOps;

    bool empty() const noexcept { return changes.empty() && orderOps.empty(); }
};

// Accumulator for the transaction currently open on a document.
struct PendingTransaction {
    bool active = false;
    int depth = 0;
    DocTransaction record;
    std::optional<Stamp> stampOverride;
    std::unordered_map<std::string, std::size_t> changeIndex;
};

} // namespace board
