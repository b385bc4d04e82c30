#pragma once

#include "board/geometry/geometry.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace board {

struct ConnectorEndpoints {
    std::optional<Point> start;
    std::optional<Point> end;
};

// Port hit returned by attach queries.
struct AttachTarget {
    std::string objectId;
    PortName port;
    Point position;
};

// Bound endpoints resolve to the named port of the live object; anything
// else falls back to the stored free point (nullopt when there is none).
std::optional<Point> resolveEndpoint(const ConnectorEndpoint& endpoint, const ObjectLookup& lookup);

ConnectorEndpoints resolveConnectorEndpoints(const BoardObject& connector, const ObjectLookup& lookup);

// Geometric fallback used when a bound endpoint has no port.
Point objectFallbackPoint(const BoardObject& obj) noexcept;

bool connectorReferences(const BoardObject& connector, const std::string& objectId);

/**
 * Rewrites every endpoint of `connector` bound to an id in `removed` into a
 * free point at its last resolved position. The lookup must still see the
 * removed objects. Returns true when the connector changed.
 */
bool freezeRemovedEndpoints(BoardObject& connector, const std::unordered_set<std::string>& removed, const ObjectLookup& lookup);

/**
 * Topmost non-connector object (walking `order` back to front) whose nearest
 * port lies within `radius` of (x, y).
 */
std::optional<AttachTarget> findAttachTarget(
    double x, double y,
    const std::vector<std::string>& order,
    const ObjectLookup& lookup,
    const std::unordered_set<std::string>& excludeIds,
    double radius);

// Distance from (x, y) to the connector path (resolved ends through its
// waypoints), or nullopt when an end cannot be resolved.
std::optional<double> connectorDistance(const BoardObject& connector, double x, double y, const ObjectLookup& lookup);

} // namespace board
