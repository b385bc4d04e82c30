#include "board/connector/connector_resolver.h"
#include "board/core/logging.h"

#include <algorithm>
#include <limits>

namespace board {

Point objectFallbackPoint(const BoardObject& obj) noexcept {
    return objectCenter(obj);
}

std::optional<Point> resolveEndpoint(const ConnectorEndpoint& endpoint, const ObjectLookup& lookup) {
    if (endpoint.objectId && lookup) {
        const BoardObject* target = lookup(*endpoint.objectId);
        if (target && !target->isConnector()) {
            if (endpoint.port) return portPosition(*target, *endpoint.port);
            return objectFallbackPoint(*target);
        }
    }
    return endpoint.point;
}

ConnectorEndpoints resolveConnectorEndpoints(const BoardObject& connector, const ObjectLookup& lookup) {
    ConnectorEndpoints out;
    const ConnectorData* data = connector.connector();
    if (!data) return out;
    out.start = resolveEndpoint(data->from, lookup);
    out.end = resolveEndpoint(data->to, lookup);
    return out;
}

bool connectorReferences(const BoardObject& connector, const std::string& objectId) {
    const ConnectorData* data = connector.connector();
    if (!data) return false;
    return (data->from.objectId && *data->from.objectId == objectId)
        || (data->to.objectId && *data->to.objectId == objectId);
}

bool freezeRemovedEndpoints(BoardObject& connector, const std::unordered_set<std::string>& removed, const ObjectLookup& lookup) {
    ConnectorData* data = connector.connector();
    if (!data) return false;

    bool changed = false;
    for (ConnectorSide side : {ConnectorSide::From, ConnectorSide::To}) {
        ConnectorEndpoint& ep = data->endpoint(side);
        if (!ep.objectId || removed.count(*ep.objectId) == 0) continue;
        const std::optional<Point> last = resolveEndpoint(ep, lookup);
        BOARD_LOG_DEBUG("connector %s detached from %s", connector.id.c_str(), ep.objectId->c_str());
        // An endpoint that never resolved keeps no point at all.
        ep = last ? ConnectorEndpoint::freeAt(*last) : ConnectorEndpoint{};
        changed = true;
    }
    return changed;
}

std::optional<AttachTarget> findAttachTarget(
    double x, double y,
    const std::vector<std::string>& order,
    const ObjectLookup& lookup,
    const std::unordered_set<std::string>& excludeIds,
    double radius) {
    const double radiusSq = radius * radius;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (excludeIds.count(*it)) continue;
        const BoardObject* obj = lookup(*it);
        if (!obj || obj->isConnector()) continue;
        const Port port = closestPort(*obj, x, y);
        const double dx = port.position.x - x;
        const double dy = port.position.y - y;
        if (dx * dx + dy * dy <= radiusSq) {
            return AttachTarget{obj->id, port.name, port.position};
        }
    }
    return std::nullopt;
}

std::optional<double> connectorDistance(const BoardObject& connector, double x, double y, const ObjectLookup& lookup) {
    const ConnectorEndpoints ends = resolveConnectorEndpoints(connector, lookup);
    if (!ends.start || !ends.end) return std::nullopt;
    const ConnectorData* data = connector.connector();
    // Waypoints split the path into consecutive segments.
    Point prev = *ends.start;
    double best = std::numeric_limits<double>::infinity();
    if (data) {
        for (const Point& p : data->points) {
            best = std::min(best, distancePointToSegment(x, y, prev.x, prev.y, p.x, p.y));
            prev = p;
        }
    }
    best = std::min(best, distancePointToSegment(x, y, prev.x, prev.y, ends.end->x, ends.end->y));
    return best;
}

} // namespace board
