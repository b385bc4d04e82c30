#include "board/agent/frame_layout.h"
#include "board/core/board_constants.h"
#include "board/core/logging.h"
#include "board/core/string_utils.h"
#include "board/geometry/geometry.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace board {
namespace agent {

namespace {

struct CategorySet {
    std::vector<std::string> titles; // canonical order, lower case
    std::size_t columns;
};

const std::vector<CategorySet>& categorySets() {
    static const std::vector<CategorySet> sets = {
        {{"strengths", "weaknesses", "opportunities", "threats"}, 2},
        {{"went well", "to improve", "action items"}, 3},
    };
    return sets;
}

const std::vector<std::string>& templateKeywords() {
    static const std::vector<std::string> words = {
        "analysis", "swot", "retro", "board", "map", "journey", "matrix", "canvas", "overview", "plan",
    };
    return words;
}

std::string normalizedTitle(const BoardObject& obj) {
    const FrameData* frame = obj.frame();
    return frame ? toLowerAscii(trimAscii(frame->title)) : std::string();
}

bool overlaps(const Bounds& a, const Bounds& b) {
    return a.x < b.x + b.width && b.x < a.x + a.width
        && a.y < b.y + b.height && b.y < a.y + a.height;
}

std::vector<BoardObject*> liveFrames(ObjectMap& objects, const std::vector<std::string>& ids) {
    std::vector<BoardObject*> out;
    for (const auto& id : ids) {
        const auto it = objects.find(id);
        if (it != objects.end() && it->second.isFrame()) out.push_back(&it->second);
    }
    return out;
}

} // namespace

bool isTemplateTitle(const std::string& title) {
    const std::string lower = toLowerAscii(title);
    for (const auto& word : templateKeywords()) {
        if (lower.find(word) != std::string::npos) return true;
    }
    return false;
}

bool isCategoryTitle(const std::string& title) {
    const std::string lower = toLowerAscii(trimAscii(title));
    for (const auto& set : categorySets()) {
        if (std::find(set.titles.begin(), set.titles.end(), lower) != set.titles.end()) return true;
    }
    return false;
}

std::vector<std::string> relayoutCategoryFrames(ObjectMap& objects, const std::vector<std::string>& createdFrameIds) {
    std::vector<std::string> changed;
    const auto frames = liveFrames(objects, createdFrameIds);

    for (const auto& set : categorySets()) {
        // One frame per category, in canonical order.
        std::vector<BoardObject*> members;
        for (const auto& title : set.titles) {
            for (BoardObject* frame : frames) {
                if (normalizedTitle(*frame) == title) {
                    members.push_back(frame);
                    break;
                }
            }
        }
        if (members.size() < 2) continue;

        bool anyOverlap = false;
        for (std::size_t i = 0; i < members.size() && !anyOverlap; ++i) {
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                if (overlaps(objectAabb(*members[i]), objectAabb(*members[j]))) {
                    anyOverlap = true;
                    break;
                }
            }
        }
        if (!anyOverlap) continue;

        double cellW = 0.0;
        double cellH = 0.0;
        double sumX = 0.0;
        double sumY = 0.0;
        for (const BoardObject* frame : members) {
            cellW = std::max(cellW, frame->width);
            cellH = std::max(cellH, frame->height);
            const Point c = objectCenter(*frame);
            sumX += c.x;
            sumY += c.y;
        }
        const double n = static_cast<double>(members.size());
        const Point centroid{sumX / n, sumY / n};

        const std::size_t cols = std::min(set.columns, members.size());
        const std::size_t rows = (members.size() + cols - 1) / cols;
        const double gap = constants::LAYOUT_GAP;
        const double gridW = static_cast<double>(cols) * cellW + static_cast<double>(cols - 1) * gap;
        const double gridH = static_cast<double>(rows) * cellH + static_cast<double>(rows - 1) * gap;
        const double originX = std::round(centroid.x - gridW / 2.0);
        const double originY = std::round(centroid.y - gridH / 2.0);

        // Contents follow the smallest member frame that holds them.
        std::unordered_set<std::string> memberIds;
        for (const BoardObject* frame : members) memberIds.insert(frame->id);
        std::unordered_map<std::string, std::string> carriedBy;
        for (const auto& [id, obj] : objects) {
            if (memberIds.count(id) || obj.isConnector()) continue;
            const BoardObject* holder = nullptr;
            for (const BoardObject* frame : members) {
                if (!objectContainsObject(*frame, obj)) continue;
                if (!holder || area(*frame) < area(*holder)) holder = frame;
            }
            // Frames that enclose a member are outer containers, not contents.
            if (holder && obj.isFrame() && area(obj) >= area(*holder)) holder = nullptr;
            if (holder) carriedBy[id] = holder->id;
        }

        std::unordered_map<std::string, Point> delta;
        for (std::size_t i = 0; i < members.size(); ++i) {
            BoardObject* frame = members[i];
            const double x = originX + static_cast<double>(i % cols) * (cellW + gap);
            const double y = originY + static_cast<double>(i / cols) * (cellH + gap);
            delta[frame->id] = Point{x - frame->x, y - frame->y};
            if (frame->x != x || frame->y != y) {
                frame->x = x;
                frame->y = y;
                changed.push_back(frame->id);
            }
        }

        for (const auto& [id, holderId] : carriedBy) {
            const Point d = delta[holderId];
            if (d.x == 0.0 && d.y == 0.0) continue;
            BoardObject& obj = objects.at(id);
            obj.x += d.x;
            obj.y += d.y;
            changed.push_back(id);
        }
        BOARD_LOG_DEBUG("re-laid %zu category frames into a %zux%zu grid", members.size(), cols, rows);
    }
    return changed;
}

std::vector<std::string> wrapOuterFrame(ObjectMap& objects, const std::vector<std::string>& createdFrameIds) {
    const auto frames = liveFrames(objects, createdFrameIds);
    if (frames.size() < static_cast<std::size_t>(constants::OUTER_WRAP_MIN_FRAMES)) return {};

    BoardObject* outer = nullptr;
    for (BoardObject* frame : frames) {
        const FrameData* data = frame->frame();
        if (isCategoryTitle(data->title) || !isTemplateTitle(data->title)) continue;
        if (!outer || area(*frame) > area(*outer)) outer = frame;
    }
    if (!outer) return {};

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    for (const BoardObject* frame : frames) {
        if (frame == outer) continue;
        const Bounds b = objectAabb(*frame);
        minX = std::min(minX, b.x);
        minY = std::min(minY, b.y);
        maxX = std::max(maxX, b.x + b.width);
        maxY = std::max(maxY, b.y + b.height);
    }

    const double pad = constants::LAYOUT_PADDING;
    const double x = minX - pad;
    const double y = minY - (constants::FRAME_TITLE_HEIGHT + pad);
    const double width = maxX + pad - x;
    const double height = maxY + pad - y;

    if (outer->x == x && outer->y == y && outer->width == width && outer->height == height && outer->rotation == 0.0) {
        return {};
    }
    outer->x = x;
    outer->y = y;
    outer->width = width;
    outer->height = height;
    outer->rotation = 0.0;
    BOARD_LOG_DEBUG("outer frame %s wrapped to %.0fx%.0f at (%.0f, %.0f)", outer->id.c_str(), width, height, x, y);
    return {outer->id};
}

std::vector<std::string> normalizeCreatedFrames(ObjectMap& objects, const std::vector<std::string>& createdFrameIds) {
    std::vector<std::string> changed = relayoutCategoryFrames(objects, createdFrameIds);
    for (auto& id : wrapOuterFrame(objects, createdFrameIds)) {
        if (std::find(changed.begin(), changed.end(), id) == changed.end()) changed.push_back(std::move(id));
    }
    return changed;
}

} // namespace agent
} // namespace board
