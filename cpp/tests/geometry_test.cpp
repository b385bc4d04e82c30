#include <gtest/gtest.h>
#include "board/geometry/geometry.h"
#include "tests/board_test_common.h"

#include <cmath>
#include <limits>

using namespace board;
using board_test::kAngleEps;

namespace {
BoardObject box(double x, double y, double w, double h, double rotation = 0.0, ObjectKind kind = ObjectKind::Sticky) {
    BoardObject obj;
    obj.id = "b";
    obj.x = x;
    obj.y = y;
    obj.width = w;
    obj.height = h;
    obj.rotation = rotation;
    obj.payload = defaultPayload(kind);
    return obj;
}
} // namespace

TEST(GeometryTest, NormalizeAngleWrapsIntoRange) {
    EXPECT_DOUBLE_EQ(normalizeAngle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(360.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(725.0), 5.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(std::numeric_limits<double>::infinity()), 0.0);
}

TEST(GeometryTest, RotatePointIsClockwiseInScreenSpace) {
    const Point p = rotatePoint(10.0, 0.0, 0.0, 0.0, 90.0);
    EXPECT_NEAR(p.x, 0.0, kAngleEps);
    EXPECT_NEAR(p.y, 10.0, kAngleEps);

    const Point back = inverseRotatePoint(p.x, p.y, 0.0, 0.0, 90.0);
    EXPECT_NEAR(back.x, 10.0, kAngleEps);
    EXPECT_NEAR(back.y, 0.0, kAngleEps);
}

TEST(GeometryTest, AabbOfRotatedSquareGrows) {
    const Bounds b = objectAabb(box(0.0, 0.0, 100.0, 100.0, 45.0));
    const double half = 50.0 * std::sqrt(2.0);
    EXPECT_NEAR(b.x, 50.0 - half, kAngleEps);
    EXPECT_NEAR(b.y, 50.0 - half, kAngleEps);
    EXPECT_NEAR(b.width, 2.0 * half, kAngleEps);
    EXPECT_NEAR(b.height, 2.0 * half, kAngleEps);
}

TEST(GeometryTest, ContainmentRequiresAllRotatedCorners) {
    const BoardObject frame = box(0.0, 0.0, 200.0, 200.0, 0.0, ObjectKind::Frame);
    EXPECT_TRUE(objectContainsObject(frame, box(50.0, 50.0, 100.0, 100.0)));
    // Edges count as inside.
    EXPECT_TRUE(objectContainsObject(frame, box(0.0, 0.0, 200.0, 200.0)));
    EXPECT_FALSE(objectContainsObject(frame, box(150.0, 50.0, 100.0, 100.0)));
    // Rotation pushes the corners of a tight fit outside.
    EXPECT_FALSE(objectContainsObject(frame, box(10.0, 10.0, 180.0, 180.0, 45.0)));
}

TEST(GeometryTest, EllipseHitTestExcludesCorners) {
    BoardObject ellipse = box(0.0, 0.0, 100.0, 50.0, 0.0, ObjectKind::Shape);
    std::get<ShapeData>(ellipse.payload).shapeKind = ShapeKind::Ellipse;
    EXPECT_TRUE(pointInObject(50.0, 25.0, ellipse));
    EXPECT_TRUE(pointInObject(99.0, 25.0, ellipse));
    EXPECT_FALSE(pointInObject(2.0, 2.0, ellipse));

    const BoardObject rect = box(0.0, 0.0, 100.0, 50.0, 0.0, ObjectKind::Shape);
    EXPECT_TRUE(pointInObject(2.0, 2.0, rect));
}

TEST(GeometryTest, ConnectorsNeverHitAsBoxes) {
    const BoardObject conn = box(0.0, 0.0, 100.0, 100.0, 0.0, ObjectKind::Connector);
    EXPECT_FALSE(pointInObject(50.0, 50.0, conn));
}

TEST(GeometryTest, PortsFollowRotation) {
    const BoardObject obj = box(0.0, 0.0, 100.0, 50.0);
    EXPECT_EQ(portPosition(obj, PortName::N), (Point{50.0, 0.0}));
    EXPECT_EQ(portPosition(obj, PortName::E), (Point{100.0, 25.0}));
    EXPECT_EQ(portPosition(obj, PortName::SW), (Point{0.0, 50.0}));

    const BoardObject turned = box(0.0, 0.0, 100.0, 50.0, 90.0);
    const Point e = portPosition(turned, PortName::E);
    EXPECT_NEAR(e.x, 50.0, kAngleEps);
    EXPECT_NEAR(e.y, 75.0, kAngleEps);
}

TEST(GeometryTest, ClosestPortPicksNearest) {
    const BoardObject obj = box(0.0, 0.0, 100.0, 100.0);
    EXPECT_EQ(closestPort(obj, 120.0, 52.0).name, PortName::E);
    EXPECT_EQ(closestPort(obj, -5.0, -5.0).name, PortName::NW);
    EXPECT_EQ(closestPort(obj, 50.0, 140.0).name, PortName::S);
}

TEST(GeometryTest, SelectionBoundsSkipsConnectorsWithoutLookup) {
    const BoardObject a = box(0.0, 0.0, 10.0, 10.0);
    BoardObject conn = box(0.0, 0.0, 0.0, 0.0, 0.0, ObjectKind::Connector);
    conn.connector()->from = ConnectorEndpoint::freeAt(Point{-50.0, -50.0});
    conn.connector()->to = ConnectorEndpoint::freeAt(Point{5.0, 5.0});

    const auto plain = selectionBounds({&a, &conn});
    ASSERT_TRUE(plain.has_value());
    EXPECT_DOUBLE_EQ(plain->x, 0.0);

    const ObjectLookup none = [](const std::string&) -> const BoardObject* { return nullptr; };
    const auto withEnds = selectionBounds({&a, &conn}, none);
    ASSERT_TRUE(withEnds.has_value());
    EXPECT_DOUBLE_EQ(withEnds->x, -50.0);
    EXPECT_DOUBLE_EQ(withEnds->width, 60.0);

    EXPECT_FALSE(selectionBounds({}).has_value());
}

TEST(GeometryTest, SegmentDistanceClampsToEnds) {
    EXPECT_DOUBLE_EQ(distancePointToSegment(5.0, 3.0, 0.0, 0.0, 10.0, 0.0), 3.0);
    EXPECT_DOUBLE_EQ(distancePointToSegment(-3.0, 4.0, 0.0, 0.0, 10.0, 0.0), 5.0);
    EXPECT_DOUBLE_EQ(distancePointToSegment(3.0, 4.0, 0.0, 0.0, 0.0, 0.0), 5.0);
}
