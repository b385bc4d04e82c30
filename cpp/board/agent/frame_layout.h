#pragma once

#include "board/core/types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace board {
namespace agent {

using ObjectMap = std::unordered_map<std::string, BoardObject>;

/**
 * Frames titled after one fixed category set (Strengths / Weaknesses /
 * Opportunities / Threats, or the retro columns) that overlap each other are
 * re-laid into a non-overlapping grid around their common centroid. Objects
 * sitting inside a moved frame move with it.
 *
 * Returns every id whose record changed.
 */
std::vector<std::string> relayoutCategoryFrames(ObjectMap& objects, const std::vector<std::string>& createdFrameIds);

/**
 * With at least four new frames, the template-titled frame ("... Analysis",
 * "Retro Board", ...) is resized to wrap all the other new frames plus the
 * layout padding, reserving its own title bar at the top.
 *
 * Returns the outer frame id when it changed.
 */
std::vector<std::string> wrapOuterFrame(ObjectMap& objects, const std::vector<std::string>& createdFrameIds);

// Both passes in order: category grid first so the wrap sees final positions.
std::vector<std::string> normalizeCreatedFrames(ObjectMap& objects, const std::vector<std::string>& createdFrameIds);

// Exposed for tests.
bool isTemplateTitle(const std::string& title);
bool isCategoryTitle(const std::string& title);

} // namespace agent
} // namespace board
