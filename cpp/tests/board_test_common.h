#pragma once

#include <gtest/gtest.h>
#include "board/document/document.h"
#include "board/entity/object_store.h"

#include <string>
#include <vector>

namespace board_test {
inline constexpr double kEps = 1e-9;
inline constexpr double kAngleEps = 1e-6;

inline board::ObjectStoreOptions sequentialOptions(const std::string& prefix = "o") {
    board::ObjectStoreOptions options;
    options.ids = board::IdSource::sequential(prefix);
    return options;
}

inline board::ObjectPatch framePayload(const std::string& title) {
    board::FrameData data;
    data.title = title;
    board::ObjectPatch patch;
    patch.payload = data;
    return patch;
}

inline board::ObjectPatch connectorPayload(const board::ConnectorEndpoint& from, const board::ConnectorEndpoint& to) {
    board::ConnectorData data;
    data.from = from;
    data.to = to;
    board::ObjectPatch patch;
    patch.payload = data;
    return patch;
}

inline std::vector<std::string> childrenOf(const board::ObjectStore& store, const std::string& frameId) {
    const board::BoardObject* obj = store.get(frameId);
    if (!obj || !obj->frame()) return {};
    return obj->frame()->children;
}

inline bool containsId(const std::vector<std::string>& ids, const std::string& id) {
    for (const auto& candidate : ids) {
        if (candidate == id) return true;
    }
    return false;
}

// Every parent link is mirrored by exactly one children entry and vice versa.
inline void expectContainmentConsistent(const board::Document& doc) {
    for (const auto& [id, obj] : doc.objects()) {
        if (obj.parentFrameId) {
            const board::BoardObject* parent = doc.get(*obj.parentFrameId);
            ASSERT_NE(parent, nullptr) << id << " has a dangling parent";
            ASSERT_TRUE(parent->isFrame());
            int hits = 0;
            for (const auto& child : parent->frame()->children) {
                if (child == id) ++hits;
            }
            EXPECT_EQ(hits, 1) << id << " missing from " << *obj.parentFrameId;
        }
        if (const board::FrameData* frame = obj.frame()) {
            for (const auto& child : frame->children) {
                const board::BoardObject* c = doc.get(child);
                ASSERT_NE(c, nullptr) << id << " lists missing child " << child;
                ASSERT_TRUE(c->parentFrameId.has_value());
                EXPECT_EQ(*c->parentFrameId, id);
            }
        }
    }
}
} // namespace board_test
