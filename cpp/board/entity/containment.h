#pragma once

#include "board/document/document.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace board {

// Object records plus z-order that containment reads and rewrites.
class ObjectSpace {
public:
    virtual ~ObjectSpace() = default;

    virtual const BoardObject* get(const std::string& id) const = 0;
    virtual const std::vector<std::string>& order() const = 0;
    virtual void set(const BoardObject& obj) = 0;

    // Runs `fn` as one atomic edit where the space supports it.
    virtual void batch(const std::function<void()>& fn) { fn(); }
};

// The live document; a batch is one transaction.
class DocumentObjectSpace : public ObjectSpace {
public:
    explicit DocumentObjectSpace(Document& doc) : doc_(doc) {}

    const BoardObject* get(const std::string& id) const override { return doc_.get(id); }
    const std::vector<std::string>& order() const override { return doc_.order(); }
    void set(const BoardObject& obj) override { doc_.set(obj); }
    void batch(const std::function<void()>& fn) override { doc_.transact(TransactionOrigin::Baseline, fn); }

private:
    Document& doc_;
};

// A detached copy of the board, e.g. the agent runner's mirror.
class MapObjectSpace : public ObjectSpace {
public:
    MapObjectSpace(std::unordered_map<std::string, BoardObject>& objects, const std::vector<std::string>& order)
        : objects_(objects), order_(order) {}

    const BoardObject* get(const std::string& id) const override {
        const auto it = objects_.find(id);
        return it == objects_.end() ? nullptr : &it->second;
    }
    const std::vector<std::string>& order() const override { return order_; }
    void set(const BoardObject& obj) override { objects_[obj.id] = obj; }

private:
    std::unordered_map<std::string, BoardObject>& objects_;
    const std::vector<std::string>& order_;
};

// Keeps parentFrameId and frame children lists consistent with geometry.
// An object belongs to the smallest-area frame enclosing all four of its
// rotated corners. Frames never nest inside their own descendants.
class ContainmentSynchronizer {
public:
    explicit ContainmentSynchronizer(Document& doc);
    explicit ContainmentSynchronizer(ObjectSpace& space);

    // Re-evaluate `id` and, for frames, everything inside or parented to it.
    // Returns the number of objects whose parent changed.
    std::size_t sync(const std::string& id);
    std::size_t sync(const std::vector<std::string>& ids);

    // Full pass over every object in z-order.
    std::size_t syncAll();

    // Smallest enclosing frame for `obj` under the current document state.
    std::optional<std::string> findContainer(const BoardObject& obj) const;

    // Transitive children of `frameId` (not including the frame itself).
    std::vector<std::string> descendants(const std::string& frameId) const;

private:
    bool reparent(const BoardObject& obj, const std::optional<std::string>& next);
    void removeChild(const std::string& frameId, const std::string& childId);
    void addChild(const std::string& frameId, const std::string& childId);

    std::unique_ptr<ObjectSpace> ownedSpace_;
    ObjectSpace& space_;
};

} // namespace board
