#include "board/document/document.h"
#include "board/core/logging.h"
#include "board/core/object_fields.h"

#include <algorithm>

namespace board {

const char* transactionOriginName(TransactionOrigin origin) noexcept {
    switch (origin) {
        case TransactionOrigin::Baseline: return "baseline";
        case TransactionOrigin::Gesture: return "gesture";
        case TransactionOrigin::Drag: return "drag";
        case TransactionOrigin::TextEdit: return "text-edit";
        case TransactionOrigin::Agent: return "agent";
        case TransactionOrigin::Remote: return "remote";
        case TransactionOrigin::History: return "history";
    }
    return "unknown";
}

Document::Document(std::uint32_t clientId) : clientId_(clientId) {}

void Document::transact(TransactionOrigin origin, const std::function<void()>& fn) {
    if (pending_.active) {
        // Nested call joins the open transaction and keeps its origin.
        ++pending_.depth;
        try {
            fn();
        } catch (...) {
            --pending_.depth;
            throw;
        }
        --pending_.depth;
        return;
    }

    begin(origin);
    try {
        fn();
    } catch (...) {
        // Roll back everything written so far; nothing is observable.
        const DocTransaction partial = pending_.record;
        pending_.record.changes.clear();
        pending_.record.orderOps.clear();
        pending_.changeIndex.clear();
        revert(partial);
        pending_ = PendingTransaction{};
        throw;
    }
    commit();
}

void Document::begin(TransactionOrigin origin) {
    pending_ = PendingTransaction{};
    pending_.active = true;
    pending_.depth = 1;
    pending_.record.origin = origin;
}

void Document::commit() {
    DocTransaction record = std::move(pending_.record);
    pending_ = PendingTransaction{};

    auto& changes = record.changes;
    for (auto& change : changes) {
        const auto it = objects_.find(change.id);
        if (it != objects_.end()) {
            change.after = it->second;
        } else {
            change.after.reset();
        }
    }
    changes.erase(std::remove_if(changes.begin(), changes.end(), [](const EntityChange& c) {
        if (c.before.has_value() != c.after.has_value()) return false;
        return !c.before.has_value() || *c.before == *c.after;
    }), changes.end());

    if (record.empty()) return;

    if (record.origin == TransactionOrigin::Remote) {
        clock_ = std::max(clock_, record.stamp.clock);
    } else {
        record.stamp = Stamp{++clock_, clientId_};
    }
    for (const auto& change : record.changes) {
        if (change.before && change.after) {
            auto& fields = fieldStamps_[change.id];
            for (const auto& ref : changedFields(*change.before, *change.after)) {
                fields[fieldKey(ref)] = record.stamp;
            }
        } else {
            stamps_[change.id] = record.stamp;
            fieldStamps_.erase(change.id);
        }
    }

    // Copy so listeners may add or remove listeners while being notified.
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        entry.second(record);
    }
}

void Document::markChange(const std::string& id) {
    auto [it, inserted] = pending_.changeIndex.emplace(id, pending_.record.changes.size());
    if (!inserted) return;
    EntityChange change;
    change.id = id;
    const auto found = objects_.find(id);
    if (found != objects_.end()) change.before = found->second;
    pending_.record.changes.push_back(std::move(change));
}

const BoardObject* Document::get(const std::string& id) const {
    const auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : &it->second;
}

void Document::set(const BoardObject& obj) {
    if (!pending_.active) {
        transact(TransactionOrigin::Baseline, [&]() { set(obj); });
        return;
    }
    markChange(obj.id);
    objects_[obj.id] = obj;
}

bool Document::erase(const std::string& id) {
    if (!pending_.active) {
        bool erased = false;
        transact(TransactionOrigin::Baseline, [&]() { erased = erase(id); });
        return erased;
    }
    if (objects_.count(id) == 0) return false;
    markChange(id);
    objects_.erase(id);
    return true;
}

std::optional<std::size_t> Document::indexOf(const std::string& id) const {
    const auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - order_.begin());
}

void Document::pushOrder(const std::string& id) {
    insertOrder(id, order_.size());
}

void Document::insertOrder(const std::string& id, std::size_t index) {
    if (!pending_.active) {
        transact(TransactionOrigin::Baseline, [&]() { insertOrder(id, index); });
        return;
    }
    index = std::min(index, order_.size());
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(index), id);
    pending_.record.orderOps.push_back(OrderOp{OrderOpKind::Insert, id, index});
}

bool Document::removeOrder(const std::string& id) {
    if (!pending_.active) {
        bool removed = false;
        transact(TransactionOrigin::Baseline, [&]() { removed = removeOrder(id); });
        return removed;
    }
    const auto index = indexOf(id);
    if (!index) return false;
    order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(*index));
    pending_.record.orderOps.push_back(OrderOp{OrderOpKind::Remove, id, *index});
    return true;
}

Document::ListenerHandle Document::addListener(Listener listener) {
    const ListenerHandle handle = nextListener_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

void Document::removeListener(ListenerHandle handle) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [handle](const std::pair<ListenerHandle, Listener>& entry) { return entry.first == handle; }),
        listeners_.end());
}

void Document::applyRecord(const std::string& id, const std::optional<BoardObject>& value) {
    if (value) {
        set(*value);
    } else {
        erase(id);
    }
}

Stamp Document::fieldStamp(const std::string& id, const std::string& key) const {
    const auto fields = fieldStamps_.find(id);
    if (fields != fieldStamps_.end()) {
        const auto it = fields->second.find(key);
        if (it != fields->second.end()) return it->second;
    }
    const auto known = stamps_.find(id);
    return known == stamps_.end() ? Stamp{} : known->second;
}

void Document::applyRemote(const DocTransaction& update) {
    transact(TransactionOrigin::Remote, [&]() {
        pending_.record.stamp = update.stamp;
        for (const auto& change : update.changes) {
            const auto known = stamps_.find(change.id);
            const bool seen = known != stamps_.end();
            const BoardObject* local = get(change.id);

            if (!change.after) {
                if (seen && !(known->second < update.stamp)) {
                    BOARD_LOG_DEBUG("remote erase of %s lost to local clock %llu",
                        change.id.c_str(), static_cast<unsigned long long>(known->second.clock));
                    continue;
                }
                erase(change.id);
                stamps_[change.id] = update.stamp;
                fieldStamps_.erase(change.id);
                continue;
            }

            if (!local) {
                if (change.before && seen) {
                    BOARD_LOG_DEBUG("remote update to %s dropped: erased locally", change.id.c_str());
                    continue;
                }
                if (seen && !(known->second < update.stamp)) {
                    BOARD_LOG_DEBUG("remote create of %s lost to local clock %llu",
                        change.id.c_str(), static_cast<unsigned long long>(known->second.clock));
                    continue;
                }
                set(*change.after);
                stamps_[change.id] = update.stamp;
                fieldStamps_.erase(change.id);
                continue;
            }

            // Merge field by field against the local record.
            BoardObject merged = *local;
            auto& fields = fieldStamps_[change.id];
            const auto candidates = changedFields(change.before ? *change.before : *local, *change.after);
            for (const auto& ref : candidates) {
                const std::string key = fieldKey(ref);
                if (!(fieldStamp(change.id, key) < update.stamp)) {
                    BOARD_LOG_DEBUG("remote %s of %s lost to a newer local write", key.c_str(), change.id.c_str());
                    continue;
                }
                if (copyField(merged, *change.after, ref)) {
                    // Accepted without an observable change still moves the stamp forward.
                    fields[key] = update.stamp;
                }
            }
            set(merged);
        }
        for (const auto& op : update.orderOps) {
            const bool present = indexOf(op.id).has_value();
            if (op.kind == OrderOpKind::Insert && !present) {
                insertOrder(op.id, op.index);
            } else if (op.kind == OrderOpKind::Remove && present) {
                removeOrder(op.id);
            }
        }
    });
    clock_ = std::max(clock_, update.stamp.clock);
}

void Document::applyFields(const std::string& id, const BoardObject& from, const BoardObject& to) {
    const BoardObject* current = get(id);
    if (!current) {
        BOARD_LOG_DEBUG("history skips %s: erased since it was recorded", id.c_str());
        return;
    }
    BoardObject next = *current;
    for (const auto& ref : changedFields(from, to)) {
        copyField(next, to, ref);
    }
    set(next);
}

void Document::revert(const DocTransaction& record) {
    transact(TransactionOrigin::History, [&]() {
        for (auto it = record.changes.rbegin(); it != record.changes.rend(); ++it) {
            if (it->before && it->after) {
                applyFields(it->id, *it->after, *it->before);
            } else {
                applyRecord(it->id, it->before);
            }
        }
        for (auto it = record.orderOps.rbegin(); it != record.orderOps.rend(); ++it) {
            const bool present = indexOf(it->id).has_value();
            if (it->kind == OrderOpKind::Insert && present) {
                removeOrder(it->id);
            } else if (it->kind == OrderOpKind::Remove && !present) {
                insertOrder(it->id, it->index);
            }
        }
    });
}

void Document::replay(const DocTransaction& record) {
    transact(TransactionOrigin::History, [&]() {
        for (const auto& change : record.changes) {
            if (change.before && change.after) {
                applyFields(change.id, *change.before, *change.after);
            } else {
                applyRecord(change.id, change.after);
            }
        }
        for (const auto& op : record.orderOps) {
            const bool present = indexOf(op.id).has_value();
            if (op.kind == OrderOpKind::Insert && !present) {
                insertOrder(op.id, op.index);
            } else if (op.kind == OrderOpKind::Remove && present) {
                removeOrder(op.id);
            }
        }
    });
}

} // namespace board
