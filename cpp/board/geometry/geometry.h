#pragma once

#include "board/core/types.h"

#include <array>
#include <functional>
#include <optional>
#include <vector>

namespace board {

struct Port {
    PortName name;
    Point position;
};

using PortList = std::array<Port, kPortCount>;

// Resolves an object id to its current record, or nullptr.
using ObjectLookup = std::function<const BoardObject*(const std::string&)>;

double degToRad(double deg) noexcept;

// Wraps any finite angle into [0, 360). Non-finite input maps to 0.
double normalizeAngle(double deg) noexcept;

Point objectCenter(const BoardObject& obj) noexcept;

// Rotate (px, py) about (cx, cy) by angleDeg, clockwise in screen space (y down).
Point rotatePoint(double px, double py, double cx, double cy, double angleDeg) noexcept;
Point inverseRotatePoint(double px, double py, double cx, double cy, double angleDeg) noexcept;

// Corners in order top-left, top-right, bottom-right, bottom-left after rotation.
std::array<Point, 4> objectCorners(const BoardObject& obj) noexcept;

// Axis-aligned bounds of the rotated object.
Bounds objectAabb(const BoardObject& obj) noexcept;

// Union of the AABBs of `objects`. Connectors contribute their resolved
// endpoints when `lookup` is provided and are skipped otherwise.
std::optional<Bounds> selectionBounds(const std::vector<const BoardObject*>& objects, const ObjectLookup& lookup = nullptr);

Point boundsCenter(const Bounds& b) noexcept;
double area(const BoardObject& obj) noexcept;

bool pointInRotatedRect(double px, double py, const BoardObject& obj) noexcept;

// Shape-aware hit test (ellipse shapes use the ellipse equation). Connectors never hit.
bool pointInObject(double px, double py, const BoardObject& obj) noexcept;

// True when all four rotated corners of `child` lie inside `container`.
bool objectContainsObject(const BoardObject& container, const BoardObject& child) noexcept;

double distancePointToSegment(double px, double py, double ax, double ay, double bx, double by) noexcept;

// The 8 ports, computed on the unrotated box and rotated about the center.
PortList portList(const BoardObject& obj) noexcept;
Point portPosition(const BoardObject& obj, PortName port) noexcept;
Port closestPort(const BoardObject& obj, double px, double py) noexcept;

} // namespace board
