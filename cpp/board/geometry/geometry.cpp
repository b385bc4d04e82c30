#include "board/geometry/geometry.h"
#include "board/connector/connector_resolver.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace board {

namespace {
    constexpr double kPi = 3.14159265358979323846;

    bool insideLocalBox(const Point& local, const BoardObject& obj) noexcept {
        return local.x >= obj.x && local.x <= obj.x + obj.width
            && local.y >= obj.y && local.y <= obj.y + obj.height;
    }
}

double degToRad(double deg) noexcept {
    return deg * kPi / 180.0;
}

double normalizeAngle(double deg) noexcept {
    if (!std::isfinite(deg)) return 0.0;
    double a = std::fmod(deg, 360.0);
    if (a < 0.0) a += 360.0;
    // fmod of tiny negatives can round up to exactly 360.
    if (a >= 360.0) a -= 360.0;
    return a;
}

Point objectCenter(const BoardObject& obj) noexcept {
    return Point{obj.x + obj.width * 0.5, obj.y + obj.height * 0.5};
}

Point rotatePoint(double px, double py, double cx, double cy, double angleDeg) noexcept {
    const double a = degToRad(angleDeg);
    const double cosA = std::cos(a);
    const double sinA = std::sin(a);
    const double dx = px - cx;
    const double dy = py - cy;
    return Point{cx + dx * cosA - dy * sinA, cy + dx * sinA + dy * cosA};
}

Point inverseRotatePoint(double px, double py, double cx, double cy, double angleDeg) noexcept {
    return rotatePoint(px, py, cx, cy, -angleDeg);
}

std::array<Point, 4> objectCorners(const BoardObject& obj) noexcept {
    std::array<Point, 4> pts = {
        Point{obj.x, obj.y},
        Point{obj.x + obj.width, obj.y},
        Point{obj.x + obj.width, obj.y + obj.height},
        Point{obj.x, obj.y + obj.height},
    };
    if (obj.rotation == 0.0) return pts;
    const Point c = objectCenter(obj);
    for (auto& p : pts) {
        p = rotatePoint(p.x, p.y, c.x, c.y, obj.rotation);
    }
    return pts;
}

Bounds objectAabb(const BoardObject& obj) noexcept {
    const auto corners = objectCorners(obj);
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    for (const auto& p : corners) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }
    return Bounds{minX, minY, maxX - minX, maxY - minY};
}

std::optional<Bounds> selectionBounds(const std::vector<const BoardObject*>& objects, const ObjectLookup& lookup) {
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const BoardObject* obj : objects) {
        if (!obj) continue;
        if (obj->isConnector()) {
            if (!lookup) continue;
            const ConnectorEndpoints ends = resolveConnectorEndpoints(*obj, lookup);
            if (!ends.start || !ends.end) continue;
            minX = std::min({minX, ends.start->x, ends.end->x});
            minY = std::min({minY, ends.start->y, ends.end->y});
            maxX = std::max({maxX, ends.start->x, ends.end->x});
            maxY = std::max({maxY, ends.start->y, ends.end->y});
            any = true;
            continue;
        }
        const Bounds box = objectAabb(*obj);
        minX = std::min(minX, box.x);
        minY = std::min(minY, box.y);
        maxX = std::max(maxX, box.x + box.width);
        maxY = std::max(maxY, box.y + box.height);
        any = true;
    }

    if (!any) return std::nullopt;
    return Bounds{minX, minY, maxX - minX, maxY - minY};
}

Point boundsCenter(const Bounds& b) noexcept {
    return Point{b.x + b.width * 0.5, b.y + b.height * 0.5};
}

double area(const BoardObject& obj) noexcept {
    return obj.width * obj.height;
}

bool pointInRotatedRect(double px, double py, const BoardObject& obj) noexcept {
    const Point c = objectCenter(obj);
    const Point local = inverseRotatePoint(px, py, c.x, c.y, obj.rotation);
    return insideLocalBox(local, obj);
}

bool pointInObject(double px, double py, const BoardObject& obj) noexcept {
    switch (obj.kind()) {
        case ObjectKind::Connector:
            return false;
        case ObjectKind::Shape: {
            const auto& shape = std::get<ShapeData>(obj.payload);
            const Point c = objectCenter(obj);
            const Point local = inverseRotatePoint(px, py, c.x, c.y, obj.rotation);
            if (shape.shapeKind != ShapeKind::Ellipse) return insideLocalBox(local, obj);
            const double rx = obj.width * 0.5;
            const double ry = obj.height * 0.5;
            if (rx <= 0.0 || ry <= 0.0) return false;
            const double nx = (local.x - c.x) / rx;
            const double ny = (local.y - c.y) / ry;
            return nx * nx + ny * ny <= 1.0;
        }
        case ObjectKind::Sticky:
        case ObjectKind::Text:
        case ObjectKind::Frame:
        case ObjectKind::Table:
            return pointInRotatedRect(px, py, obj);
    }
    return false;
}

bool objectContainsObject(const BoardObject& container, const BoardObject& child) noexcept {
    const auto corners = objectCorners(child);
    for (const auto& p : corners) {
        if (!pointInRotatedRect(p.x, p.y, container)) return false;
    }
    return true;
}

double distancePointToSegment(double px, double py, double ax, double ay, double bx, double by) noexcept {
    const double dx = bx - ax;
    const double dy = by - ay;
    const double l2 = dx * dx + dy * dy;
    if (l2 == 0.0) return std::hypot(px - ax, py - ay);
    double t = ((px - ax) * dx + (py - ay) * dy) / l2;
    t = std::max(0.0, std::min(1.0, t));
    return std::hypot(px - (ax + t * dx), py - (ay + t * dy));
}

PortList portList(const BoardObject& obj) noexcept {
    const double x = obj.x;
    const double y = obj.y;
    const double w = obj.width;
    const double h = obj.height;
    PortList ports = {
        Port{PortName::N, Point{x + w / 2, y}},
        Port{PortName::E, Point{x + w, y + h / 2}},
        Port{PortName::S, Point{x + w / 2, y + h}},
        Port{PortName::W, Point{x, y + h / 2}},
        Port{PortName::NW, Point{x, y}},
        Port{PortName::NE, Point{x + w, y}},
        Port{PortName::SE, Point{x + w, y + h}},
        Port{PortName::SW, Point{x, y + h}},
    };
    if (obj.rotation == 0.0) return ports;
    const Point c = objectCenter(obj);
    for (auto& port : ports) {
        port.position = rotatePoint(port.position.x, port.position.y, c.x, c.y, obj.rotation);
    }
    return ports;
}

Point portPosition(const BoardObject& obj, PortName port) noexcept {
    return portList(obj)[static_cast<std::size_t>(port)].position;
}

Port closestPort(const BoardObject& obj, double px, double py) noexcept {
    const PortList ports = portList(obj);
    Port best = ports[0];
    double bestDist = std::numeric_limits<double>::infinity();
    for (const auto& port : ports) {
        const double dx = px - port.position.x;
        const double dy = py - port.position.y;
        const double d = dx * dx + dy * dy;
        if (d < bestDist) {
            bestDist = d;
            best = port;
        }
    }
    return best;
}

} // namespace board
