#include <gtest/gtest.h>
#include "board/document/document.h"
#include "tests/board_test_common.h"

#include <stdexcept>
#include <vector>

using namespace board;

namespace {
BoardObject sticky(const std::string& id, double x, double y) {
    BoardObject obj;
    obj.id = id;
    obj.x = x;
    obj.y = y;
    obj.width = 100.0;
    obj.height = 100.0;
    obj.payload = StickyData{};
    return obj;
}

// Forwards every committed local transaction from `from` into `to`.
Document::ListenerHandle mirrorInto(Document& from, Document& to) {
    return from.addListener([&to](const DocTransaction& record) {
        if (record.origin == TransactionOrigin::Remote) return;
        to.applyRemote(record);
    });
}

// Two replicas holding sticky "a" from one shared write at clock 1. Local
// commits are captured, not delivered, until exchange().
struct ReplicaPair {
    Document left{1};
    Document right{2};
    std::vector<DocTransaction> fromLeft;
    std::vector<DocTransaction> fromRight;

    ReplicaPair() {
        const DocTransaction seed{TransactionOrigin::Baseline, Stamp{1, 1}, {EntityChange{"a", std::nullopt, sticky("a", 0.0, 0.0)}}, {OrderOp{OrderOpKind::Insert, "a", 0}}};
        left.applyRemote(seed);
        right.applyRemote(seed);
        left.addListener([this](const DocTransaction& r) { fromLeft.push_back(r); });
        right.addListener([this](const DocTransaction& r) { fromRight.push_back(r); });
    }

    void exchange() {
        for (const auto& r : fromRight) left.applyRemote(r);
        for (const auto& r : fromLeft) right.applyRemote(r);
        fromLeft.clear();
        fromRight.clear();
    }
};
} // namespace

TEST(DocumentTest, TransactionCommitsOneRecord) {
    Document doc;
    std::vector<DocTransaction> records;
    doc.addListener([&](const DocTransaction& r) { records.push_back(r); });

    doc.transact(TransactionOrigin::Gesture, [&]() {
        doc.set(sticky("a", 0.0, 0.0));
        doc.pushOrder("a");
        doc.set(sticky("b", 10.0, 0.0));
        doc.pushOrder("b");
    });

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].origin, TransactionOrigin::Gesture);
    EXPECT_EQ(records[0].changes.size(), 2u);
    EXPECT_EQ(records[0].orderOps.size(), 2u);
    EXPECT_EQ(doc.order(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(doc.clock(), 1u);
}

TEST(DocumentTest, MutationOutsideTransactionIsBaseline) {
    Document doc;
    std::vector<TransactionOrigin> origins;
    doc.addListener([&](const DocTransaction& r) { origins.push_back(r.origin); });

    doc.set(sticky("a", 0.0, 0.0));
    doc.pushOrder("a");

    ASSERT_EQ(origins.size(), 2u);
    EXPECT_EQ(origins[0], TransactionOrigin::Baseline);
    EXPECT_EQ(origins[1], TransactionOrigin::Baseline);
}

TEST(DocumentTest, NestedTransactJoinsOuter) {
    Document doc;
    std::vector<DocTransaction> records;
    doc.addListener([&](const DocTransaction& r) { records.push_back(r); });

    doc.transact(TransactionOrigin::Drag, [&]() {
        doc.set(sticky("a", 0.0, 0.0));
        doc.transact(TransactionOrigin::Baseline, [&]() {
            EXPECT_EQ(doc.currentOrigin(), TransactionOrigin::Drag);
            doc.set(sticky("b", 0.0, 0.0));
        });
    });

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].origin, TransactionOrigin::Drag);
    EXPECT_EQ(records[0].changes.size(), 2u);
}

TEST(DocumentTest, NoOpTransactionIsNotObservable) {
    Document doc;
    doc.set(sticky("a", 0.0, 0.0));
    int calls = 0;
    doc.addListener([&](const DocTransaction&) { ++calls; });

    doc.transact(TransactionOrigin::Gesture, [&]() {
        BoardObject same = *doc.get("a");
        doc.set(same);
    });
    doc.transact(TransactionOrigin::Gesture, [&]() {
        BoardObject moved = *doc.get("a");
        moved.x = 50.0;
        doc.set(moved);
        moved.x = 0.0;
        doc.set(moved);
    });

    EXPECT_EQ(calls, 0);
}

TEST(DocumentTest, ThrowRollsBackAndRethrows) {
    Document doc;
    doc.set(sticky("a", 0.0, 0.0));
    doc.pushOrder("a");
    int calls = 0;
    doc.addListener([&](const DocTransaction&) { ++calls; });

    EXPECT_THROW(doc.transact(TransactionOrigin::Gesture, [&]() {
        BoardObject moved = *doc.get("a");
        moved.x = 500.0;
        doc.set(moved);
        doc.set(sticky("b", 0.0, 0.0));
        doc.pushOrder("b");
        doc.removeOrder("a");
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(doc.inTransaction());
    ASSERT_NE(doc.get("a"), nullptr);
    EXPECT_DOUBLE_EQ(doc.get("a")->x, 0.0);
    EXPECT_EQ(doc.get("b"), nullptr);
    EXPECT_EQ(doc.order(), (std::vector<std::string>{"a"}));
}

TEST(DocumentTest, RevertThenReplayRestoresState) {
    Document doc;
    DocTransaction last;
    doc.addListener([&](const DocTransaction& r) { last = r; });

    doc.transact(TransactionOrigin::Gesture, [&]() {
        doc.set(sticky("a", 5.0, 5.0));
        doc.pushOrder("a");
    });
    const DocTransaction created = last;

    doc.revert(created);
    EXPECT_EQ(doc.get("a"), nullptr);
    EXPECT_TRUE(doc.order().empty());

    doc.replay(created);
    ASSERT_NE(doc.get("a"), nullptr);
    EXPECT_EQ(doc.order(), (std::vector<std::string>{"a"}));

    // Replay is idempotent for the z-order.
    doc.replay(created);
    EXPECT_EQ(doc.order().size(), 1u);
}

TEST(DocumentTest, ReplicasConvergeUnderLastWriterWins) {
    Document left(1);
    Document right(2);
    mirrorInto(left, right);
    mirrorInto(right, left);

    left.transact(TransactionOrigin::Baseline, [&]() {
        left.set(sticky("a", 0.0, 0.0));
        left.pushOrder("a");
    });
    ASSERT_NE(right.get("a"), nullptr);

    // Concurrent edits: capture both records before either is delivered.
    Document leftShadow(1);
    Document rightShadow(2);
    std::vector<DocTransaction> fromLeft;
    std::vector<DocTransaction> fromRight;
    leftShadow.addListener([&](const DocTransaction& r) { fromLeft.push_back(r); });
    rightShadow.addListener([&](const DocTransaction& r) { fromRight.push_back(r); });
    leftShadow.applyRemote(DocTransaction{TransactionOrigin::Baseline, Stamp{1, 1}, {EntityChange{"a", std::nullopt, sticky("a", 0.0, 0.0)}}, {}});
    rightShadow.applyRemote(DocTransaction{TransactionOrigin::Baseline, Stamp{1, 1}, {EntityChange{"a", std::nullopt, sticky("a", 0.0, 0.0)}}, {}});
    fromLeft.clear();
    fromRight.clear();

    leftShadow.set(sticky("a", 100.0, 0.0));
    rightShadow.set(sticky("a", 0.0, 200.0));
    ASSERT_EQ(fromLeft.size(), 1u);
    ASSERT_EQ(fromRight.size(), 1u);

    // Different fields of one object: both edits survive on both sides.
    leftShadow.applyRemote(fromRight[0]);
    rightShadow.applyRemote(fromLeft[0]);
    ASSERT_NE(leftShadow.get("a"), nullptr);
    ASSERT_NE(rightShadow.get("a"), nullptr);
    EXPECT_EQ(*leftShadow.get("a"), *rightShadow.get("a"));
    EXPECT_DOUBLE_EQ(leftShadow.get("a")->x, 100.0);
    EXPECT_DOUBLE_EQ(leftShadow.get("a")->y, 200.0);
}

TEST(DocumentTest, SameFieldConflictGoesToHigherClient) {
    ReplicaPair pair;
    pair.left.set(sticky("a", 100.0, 0.0));
    pair.right.set(sticky("a", 200.0, 0.0));
    pair.exchange();

    EXPECT_EQ(*pair.left.get("a"), *pair.right.get("a"));
    EXPECT_DOUBLE_EQ(pair.left.get("a")->x, 200.0);
}

TEST(DocumentTest, ConcurrentTextAndMoveBothSurvive) {
    ReplicaPair pair;
    BoardObject moved = *pair.left.get("a");
    moved.x = 300.0;
    pair.left.set(moved);
    BoardObject edited = *pair.right.get("a");
    std::get<StickyData>(edited.payload).text = "remote text";
    pair.right.set(edited);
    pair.exchange();

    for (const Document* doc : {&pair.left, &pair.right}) {
        ASSERT_NE(doc->get("a"), nullptr);
        EXPECT_DOUBLE_EQ(doc->get("a")->x, 300.0);
        EXPECT_EQ(std::get<StickyData>(doc->get("a")->payload).text, "remote text");
    }
}

TEST(DocumentTest, DeletionBeatsConcurrentFieldEdit) {
    ReplicaPair pair;
    pair.left.transact(TransactionOrigin::Gesture, [&]() {
        pair.left.erase("a");
        pair.left.removeOrder("a");
    });
    BoardObject edited = *pair.right.get("a");
    std::get<StickyData>(edited.payload).color = "green";
    pair.right.set(edited);
    pair.exchange();

    EXPECT_EQ(pair.left.get("a"), nullptr);
    EXPECT_EQ(pair.right.get("a"), nullptr);
    EXPECT_TRUE(pair.left.order().empty());
    EXPECT_TRUE(pair.right.order().empty());
}

TEST(DocumentTest, RevertRestoresOnlyRecordedFields) {
    Document doc;
    doc.set(sticky("a", 0.0, 0.0));
    DocTransaction last;
    doc.addListener([&](const DocTransaction& r) { last = r; });

    doc.set(sticky("a", 300.0, 0.0));
    const DocTransaction moved = last;
    BoardObject edited = *doc.get("a");
    std::get<StickyData>(edited.payload).text = "later";
    doc.set(edited);

    doc.revert(moved);
    EXPECT_DOUBLE_EQ(doc.get("a")->x, 0.0);
    EXPECT_EQ(std::get<StickyData>(doc.get("a")->payload).text, "later");

    doc.replay(moved);
    EXPECT_DOUBLE_EQ(doc.get("a")->x, 300.0);
    EXPECT_EQ(std::get<StickyData>(doc.get("a")->payload).text, "later");
}

TEST(DocumentTest, RemoteOrderEditsAreIdempotent) {
    Document doc;
    DocTransaction insert{TransactionOrigin::Baseline, Stamp{3, 9}, {EntityChange{"x", std::nullopt, sticky("x", 0.0, 0.0)}}, {OrderOp{OrderOpKind::Insert, "x", 0}}};
    doc.applyRemote(insert);
    doc.applyRemote(insert);
    EXPECT_EQ(doc.order(), (std::vector<std::string>{"x"}));
    EXPECT_GE(doc.clock(), 3u);

    DocTransaction remove{TransactionOrigin::Baseline, Stamp{4, 9}, {EntityChange{"x", sticky("x", 0.0, 0.0), std::nullopt}}, {OrderOp{OrderOpKind::Remove, "x", 0}}};
    doc.applyRemote(remove);
    doc.applyRemote(remove);
    EXPECT_TRUE(doc.order().empty());
    EXPECT_EQ(doc.get("x"), nullptr);
}

TEST(DocumentTest, StaleRemoteWriteLoses) {
    Document doc(5);
    doc.set(sticky("a", 0.0, 0.0));
    doc.set(sticky("a", 10.0, 0.0)); // clock 2

    doc.applyRemote(DocTransaction{TransactionOrigin::Baseline, Stamp{1, 9}, {EntityChange{"a", std::nullopt, sticky("a", 99.0, 0.0)}}, {}});
    EXPECT_DOUBLE_EQ(doc.get("a")->x, 10.0);
}
