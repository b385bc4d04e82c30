#include <gtest/gtest.h>
#include "board/serialization/object_json.h"
#include "tests/board_test_common.h"

using namespace board;
using namespace board_test;

TEST(ObjectJsonTest, ConnectorEndpointsKeepTheirForm) {
    BoardObject conn;
    conn.id = "c";
    ConnectorData data;
    data.from = ConnectorEndpoint::bound("a", PortName::SE);
    data.to = ConnectorEndpoint::freeAt(Point{4.0, 5.0});
    data.style = ConnectorStyle::Line;
    data.points = {Point{1.0, 2.0}};
    conn.payload = data;

    const nlohmann::json j = objectToJson(conn);
    EXPECT_EQ(j["type"], "connector");
    EXPECT_EQ(j["fromId"], "a");
    EXPECT_EQ(j["fromPort"], "se");
    EXPECT_TRUE(j["fromPoint"].is_null());
    EXPECT_TRUE(j["toId"].is_null());
    EXPECT_EQ(j["toPoint"]["x"], 4.0);

    const BoardObject back = objectFromJson(j);
    EXPECT_EQ(back, conn);
}

TEST(ObjectJsonTest, TableRoundTrips) {
    BoardObject table;
    table.id = "t";
    table.width = 240.0;
    table.height = 60.0;
    TableData data;
    data.columns = {"c1", "c2"};
    data.rows = {"r1"};
    data.columnWidths = {{"c1", 120.0}, {"c2", 120.0}};
    data.rowHeights = {{"r1", 32.0}};
    data.cells = {{"r1:c2", "x"}};
    table.payload = data;

    EXPECT_EQ(objectFromJson(objectToJson(table)), table);
}

TEST(ObjectJsonTest, MissingFieldsUseDefaults) {
    const BoardObject obj = objectFromJson(nlohmann::json{{"id", "s"}, {"type", "sticky"}});
    EXPECT_EQ(obj.kind(), ObjectKind::Sticky);
    EXPECT_EQ(std::get<StickyData>(obj.payload).color, "yellow");
    EXPECT_FALSE(obj.parentFrameId.has_value());
}

TEST(ObjectJsonTest, LegacyShapeTypes) {
    const BoardObject obj = objectFromJson(nlohmann::json{{"id", "e"}, {"type", "ellipse"}});
    ASSERT_EQ(obj.kind(), ObjectKind::Shape);
    EXPECT_EQ(std::get<ShapeData>(obj.payload).shapeKind, ShapeKind::Ellipse);
}

TEST(ObjectJsonTest, MalformedRecordsThrow) {
    EXPECT_THROW(objectFromJson(nlohmann::json::array()), SerializationError);
    EXPECT_THROW(objectFromJson(nlohmann::json{{"type", "sticky"}}), SerializationError);
    EXPECT_THROW(objectFromJson(nlohmann::json{{"id", "x"}}), SerializationError);
    EXPECT_THROW(objectFromJson(nlohmann::json{{"id", "x"}, {"type", "hexagon"}}), SerializationError);
}

TEST(ObjectJsonTest, ClipboardTextPastesIntoAnotherBoard) {
    Document source;
    ObjectStore sourceStore(source, sequentialOptions("s"));
    const std::string f = sourceStore.create(ObjectKind::Frame, 0.0, 0.0, 400.0, 300.0, framePayload("Ideas"));
    const std::string a = sourceStore.create(ObjectKind::Sticky, 20.0, 20.0, 100.0, 100.0);

    const std::string text = clipboardToString(sourceStore.serializeSelection({f, a}));

    Document target;
    ObjectStore targetStore(target, sequentialOptions("t"));
    const auto pasted = targetStore.pasteSerialized(clipboardFromString(text), Point{0.0, 0.0}, PasteMode::Relative);
    ASSERT_EQ(pasted.size(), 2u);
    const BoardObject* frame = targetStore.get(pasted[0]);
    ASSERT_NE(frame, nullptr);
    ASSERT_TRUE(frame->isFrame());
    EXPECT_EQ(frame->frame()->title, "Ideas");
    EXPECT_EQ(frame->frame()->children, (std::vector<std::string>{pasted[1]}));
    expectContainmentConsistent(target);
}

TEST(ObjectJsonTest, PastedClipboardIsNormalized) {
    const std::string text = R"({"kind":"board-clipboard","objects":[)"
                             R"({"id":"s1","type":"sticky","x":0,"y":0,"width":1,"height":2,"rotation":-90}]})";
    Document doc;
    ObjectStore store(doc, sequentialOptions("p"));
    const auto pasted = store.pasteSerialized(clipboardFromString(text), Point{100.0, 100.0});
    ASSERT_EQ(pasted.size(), 1u);

    const BoardObject* obj = store.get(pasted[0]);
    ASSERT_NE(obj, nullptr);
    EXPECT_DOUBLE_EQ(obj->width, 24.0);
    EXPECT_DOUBLE_EQ(obj->height, 24.0);
    EXPECT_NEAR(obj->rotation, 270.0, kAngleEps);
}

TEST(ObjectJsonTest, ClipboardRejectsForeignText) {
    EXPECT_THROW(clipboardFromString("not json"), SerializationError);
    EXPECT_THROW(clipboardFromString("{\"kind\":\"other\",\"objects\":[]}"), SerializationError);
}
