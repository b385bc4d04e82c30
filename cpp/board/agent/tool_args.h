#pragma once

#include "board/core/types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace board {
namespace agent {

// Palette tokens accepted by color fields.
const std::vector<std::string>& paletteNames();

// Names of every tool the runner accepts.
const std::vector<std::string>& toolNames();
bool isKnownTool(const std::string& name);

// Non-numbers (and NaN) yield `fallback`; numbers clamp into [min, max].
double clampNumber(const nlohmann::json& value, double min, double max, double fallback);

// Palette token or `fallback`.
std::string sanitizeColor(const nlohmann::json& value, const std::string& fallback = "black");

// Strings truncate to `maxCodepoints`; non-strings yield `fallback`.
std::string clampText(const nlohmann::json& value, std::size_t maxCodepoints, const std::string& fallback = "");

Point normalizeViewportCenter(const nlohmann::json& value);

/**
 * Sanitizes raw tool arguments. Every field of the result is present and
 * well-typed; optional coordinates are null when not given. Invalid input
 * never raises. Unknown tool names yield an empty object.
 */
nlohmann::json validateToolArgs(const std::string& toolName, const nlohmann::json& raw);

// Maps a createObjects item type ("sticky", "shape", "frame", ...) to the
// create tool that builds it, or "" when the type is not creatable.
std::string createToolForType(const std::string& type);

} // namespace agent
} // namespace board
