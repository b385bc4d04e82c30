#include <gtest/gtest.h>
#include "board/connector/connector_resolver.h"
#include "tests/board_test_common.h"

#include <unordered_map>

using namespace board;

namespace {
class ResolverFixture : public ::testing::Test {
protected:
    void SetUp() override {
        add("a", ObjectKind::Sticky, 0.0, 0.0, 100.0, 100.0);
        add("b", ObjectKind::Shape, 300.0, 0.0, 100.0, 100.0);
    }

    BoardObject& add(const std::string& id, ObjectKind kind, double x, double y, double w, double h) {
        BoardObject obj;
        obj.id = id;
        obj.x = x;
        obj.y = y;
        obj.width = w;
        obj.height = h;
        obj.payload = defaultPayload(kind);
        order.push_back(id);
        return objects[id] = obj;
    }

    BoardObject& connector(const std::string& id, const ConnectorEndpoint& from, const ConnectorEndpoint& to) {
        BoardObject& obj = add(id, ObjectKind::Connector, 0.0, 0.0, 0.0, 0.0);
        obj.connector()->from = from;
        obj.connector()->to = to;
        return obj;
    }

    ObjectLookup lookup() const {
        return [this](const std::string& id) -> const BoardObject* {
            const auto it = objects.find(id);
            return it == objects.end() ? nullptr : &it->second;
        };
    }

    std::unordered_map<std::string, BoardObject> objects;
    std::vector<std::string> order;
};
} // namespace

TEST_F(ResolverFixture, BoundEndpointsFollowPorts) {
    const BoardObject& c = connector("c", ConnectorEndpoint::bound("a", PortName::E), ConnectorEndpoint::bound("b", PortName::W));
    const ConnectorEndpoints ends = resolveConnectorEndpoints(c, lookup());
    ASSERT_TRUE(ends.start && ends.end);
    EXPECT_EQ(*ends.start, (Point{100.0, 50.0}));
    EXPECT_EQ(*ends.end, (Point{300.0, 50.0}));

    objects["b"].y = 200.0;
    EXPECT_EQ(*resolveConnectorEndpoints(objects["c"], lookup()).end, (Point{300.0, 250.0}));
}

TEST_F(ResolverFixture, MissingTargetFallsBackToFreePoint) {
    ConnectorEndpoint ep = ConnectorEndpoint::bound("gone", PortName::N);
    EXPECT_FALSE(resolveEndpoint(ep, lookup()).has_value());
    ep.point = Point{7.0, 8.0};
    EXPECT_EQ(*resolveEndpoint(ep, lookup()), (Point{7.0, 8.0}));
}

TEST_F(ResolverFixture, BoundWithoutPortUsesCenter) {
    ConnectorEndpoint ep;
    ep.objectId = "a";
    EXPECT_EQ(*resolveEndpoint(ep, lookup()), (Point{50.0, 50.0}));
}

TEST_F(ResolverFixture, FreezeKeepsLastResolvedPoint) {
    BoardObject c = connector("c", ConnectorEndpoint::bound("a", PortName::E), ConnectorEndpoint::bound("b", PortName::W));
    EXPECT_TRUE(freezeRemovedEndpoints(c, {"a"}, lookup()));

    const ConnectorData& data = *c.connector();
    EXPECT_FALSE(data.from.isBound());
    EXPECT_FALSE(data.from.port.has_value());
    ASSERT_TRUE(data.from.point.has_value());
    EXPECT_EQ(*data.from.point, (Point{100.0, 50.0}));
    EXPECT_TRUE(data.to.isBound());

    EXPECT_FALSE(freezeRemovedEndpoints(c, {"a"}, lookup()));
}

TEST_F(ResolverFixture, ReferencesChecksBothEnds) {
    const BoardObject& c = connector("c", ConnectorEndpoint::freeAt(Point{0.0, 0.0}), ConnectorEndpoint::bound("b", PortName::N));
    EXPECT_TRUE(connectorReferences(c, "b"));
    EXPECT_FALSE(connectorReferences(c, "a"));
}

TEST_F(ResolverFixture, AttachTargetPrefersTopmost) {
    add("over", ObjectKind::Sticky, 0.0, 0.0, 100.0, 100.0);
    const auto hit = findAttachTarget(105.0, 52.0, order, lookup(), {}, 20.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "over");
    EXPECT_EQ(hit->port, PortName::E);

    const auto excluded = findAttachTarget(105.0, 52.0, order, lookup(), {"over"}, 20.0);
    ASSERT_TRUE(excluded.has_value());
    EXPECT_EQ(excluded->objectId, "a");

    EXPECT_FALSE(findAttachTarget(200.0, 50.0, order, lookup(), {}, 20.0).has_value());
}

TEST_F(ResolverFixture, DistanceFollowsWaypoints) {
    BoardObject& c = connector("c", ConnectorEndpoint::freeAt(Point{0.0, 0.0}), ConnectorEndpoint::freeAt(Point{100.0, 100.0}));
    c.connector()->points.push_back(Point{100.0, 0.0});

    const auto onBend = connectorDistance(c, 100.0, 50.0, lookup());
    ASSERT_TRUE(onBend.has_value());
    EXPECT_DOUBLE_EQ(*onBend, 0.0);
    EXPECT_DOUBLE_EQ(*connectorDistance(c, 50.0, 10.0, lookup()), 10.0);
}
