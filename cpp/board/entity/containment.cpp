#include "board/entity/containment.h"
#include "board/core/logging.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <deque>

namespace board {

ContainmentSynchronizer::ContainmentSynchronizer(Document& doc)
    : ownedSpace_(std::make_unique<DocumentObjectSpace>(doc)), space_(*ownedSpace_) {}

ContainmentSynchronizer::ContainmentSynchronizer(ObjectSpace& space) : space_(space) {}

std::vector<std::string> ContainmentSynchronizer::descendants(const std::string& frameId) const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen{frameId};
    std::deque<std::string> pending{frameId};
    while (!pending.empty()) {
        const std::string current = pending.front();
        pending.pop_front();
        const BoardObject* obj = space_.get(current);
        if (!obj) continue;
        const FrameData* frame = obj->frame();
        if (!frame) continue;
        for (const auto& childId : frame->children) {
            if (!seen.insert(childId).second) continue;
            out.push_back(childId);
            pending.push_back(childId);
        }
    }
    return out;
}

std::optional<std::string> ContainmentSynchronizer::findContainer(const BoardObject& obj) const {
    std::unordered_set<std::string> excluded;
    if (obj.isFrame()) {
        const auto desc = descendants(obj.id);
        excluded.insert(desc.begin(), desc.end());
    }

    const BoardObject* best = nullptr;
    for (const auto& candidateId : space_.order()) {
        if (candidateId == obj.id) continue;
        const BoardObject* candidate = space_.get(candidateId);
        if (!candidate || !candidate->isFrame()) continue;
        if (excluded.count(candidateId)) {
            if (objectContainsObject(*candidate, obj)) {
                BOARD_LOG_DEBUG("frame %s skipped as container of its ancestor %s", candidateId.c_str(), obj.id.c_str());
            }
            continue;
        }
        if (!objectContainsObject(*candidate, obj)) continue;
        if (!best || area(*candidate) < area(*best)) best = candidate;
    }
    if (!best) return std::nullopt;
    return best->id;
}

void ContainmentSynchronizer::removeChild(const std::string& frameId, const std::string& childId) {
    const BoardObject* current = space_.get(frameId);
    if (!current || !current->isFrame()) return;
    BoardObject frame = *current;
    auto& children = frame.frame()->children;
    const auto it = std::find(children.begin(), children.end(), childId);
    if (it == children.end()) return;
    children.erase(it);
    space_.set(frame);
}

void ContainmentSynchronizer::addChild(const std::string& frameId, const std::string& childId) {
    const BoardObject* current = space_.get(frameId);
    if (!current || !current->isFrame()) return;
    BoardObject frame = *current;
    auto& children = frame.frame()->children;
    if (std::find(children.begin(), children.end(), childId) != children.end()) return;
    children.push_back(childId);
    space_.set(frame);
}

bool ContainmentSynchronizer::reparent(const BoardObject& obj, const std::optional<std::string>& next) {
    const std::optional<std::string> previous = obj.parentFrameId;
    if (previous == next) {
        // Parent unchanged; still repair a missing children entry.
        if (next) addChild(*next, obj.id);
        return false;
    }

    if (previous) removeChild(*previous, obj.id);
    if (next) addChild(*next, obj.id);

    BoardObject updated = *space_.get(obj.id);
    updated.parentFrameId = next;
    space_.set(updated);
    BOARD_LOG_DEBUG("%s reparented to %s", obj.id.c_str(), next ? next->c_str() : "(none)");
    return true;
}

std::size_t ContainmentSynchronizer::sync(const std::string& id) {
    return sync(std::vector<std::string>{id});
}

std::size_t ContainmentSynchronizer::sync(const std::vector<std::string>& ids) {
    std::size_t changed = 0;
    space_.batch([&]() {
        std::deque<std::string> worklist(ids.begin(), ids.end());
        std::unordered_set<std::string> visited;

        while (!worklist.empty()) {
            const std::string id = worklist.front();
            worklist.pop_front();
            if (!visited.insert(id).second) continue;

            const BoardObject* obj = space_.get(id);
            if (!obj || obj->isConnector()) continue;

            const BoardObject snapshot = *obj;
            if (reparent(snapshot, findContainer(snapshot))) ++changed;

            if (!snapshot.isFrame()) continue;
            // Re-read: reparenting may have rewritten the frame itself.
            const BoardObject* frame = space_.get(id);
            if (!frame) continue;
            for (const auto& otherId : space_.order()) {
                if (otherId == id || visited.count(otherId)) continue;
                const BoardObject* other = space_.get(otherId);
                if (!other || other->isConnector()) continue;
                const bool parented = other->parentFrameId && *other->parentFrameId == id;
                if (parented || objectContainsObject(*frame, *other)) {
                    worklist.push_back(otherId);
                }
            }
        }
    });
    return changed;
}

std::size_t ContainmentSynchronizer::syncAll() {
    return sync(space_.order());
}

} // namespace board
