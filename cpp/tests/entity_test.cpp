#include "tests/karta_test_common.h"
#include "karta/entity/clipboard.h"
#include "karta/entity/group_resolver.h"
#include "karta/entity/selection_manager.h"
#include "karta/entity/z_order.h"
#include "karta/history/history_manager.h"
#include "karta/store/id_allocator.h"

#include <algorithm>

using namespace karta_test;

class EntityTest : public ::testing::Test {
protected:
    EntityTest()
        : store(StoreOptions{"s1", 50.0}, clock.fn()),
          history(store),
          selection(store),
          ids("s1"),
          groups(store, history, selection, ids),
          clipboard(store, history, selection, ids),
          zOrder(store, history) {}

    std::int32_t z(const ObjectId& id) const { return store.get(id)->zIndex; }

    ManualClock clock;
    ReplicatedStore store;
    HistoryManager history;
    SelectionManager selection;
    IdAllocator ids;
    GroupResolver groups;
    Clipboard clipboard;
    ZOrderController zOrder;
};

// =============================================================================
// Selection
// =============================================================================

TEST_F(EntityTest, SelectionIsInDrawOrderAndIgnoresUnknownIds) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10, 2));
    ASSERT_TRUE(addRect(store, "b", 0, 0, 10, 10, 1));
    selection.setSelection({"a", "b", "nope"});
    EXPECT_EQ(selection.getSelectedIds(), (std::vector<ObjectId>{"b", "a"}));

    selection.setSelection({"a"}, SelectionMode::Toggle);
    EXPECT_EQ(selection.getSelectedIds(), (std::vector<ObjectId>{"b"}));
    selection.setSelection({"a"}, SelectionMode::Add);
    selection.setSelection({"b"}, SelectionMode::Remove);
    EXPECT_EQ(selection.getSelectedIds(), (std::vector<ObjectId>{"a"}));
}

TEST_F(EntityTest, SelectionPrunesRemovedObjects) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    selection.setSelection({"a"});
    ASSERT_TRUE(store.mergeRemoteDelete("a", Stamp{100, "other"}));
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(EntityTest, AlignLeftUsesRotatedBounds) {
    ASSERT_TRUE(addRect(store, "a", 10, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 50, 50, 20, 10, 1));
    selection.setSelection({"a", "b"});

    ASSERT_TRUE(selection.alignSelection(AlignMode::Left, history));
    EXPECT_FLOAT_EQ(store.get("a")->x, 10.0f);
    EXPECT_FLOAT_EQ(store.get("b")->x, 10.0f);
    EXPECT_EQ(history.getHistorySize(), 1u);
}

TEST_F(EntityTest, DistributeEvensOutGaps) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 15, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 90, 0, 10, 10, 2));
    selection.setSelection({"a", "b", "c"});

    ASSERT_TRUE(selection.distributeSelection(DistributeAxis::Horizontal, history));
    EXPECT_FLOAT_EQ(store.get("a")->x, 0.0f);
    EXPECT_FLOAT_EQ(store.get("b")->x, 45.0f);
    EXPECT_FLOAT_EQ(store.get("c")->x, 90.0f);

    selection.setSelection({"a", "b"});
    EXPECT_FALSE(selection.distributeSelection(DistributeAxis::Horizontal, history));
}

// =============================================================================
// Z order
// =============================================================================

TEST_F(EntityTest, ReorderShiftsTheObjectsInBetween) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10, 0));
    ASSERT_TRUE(addRect(store, "b", 0, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 0, 0, 10, 10, 2));

    ASSERT_TRUE(zOrder.reorderObject("a", 2));
    EXPECT_EQ(z("a"), 2);
    EXPECT_EQ(z("b"), 0);
    EXPECT_EQ(z("c"), 1);

    EXPECT_FALSE(zOrder.reorderObject("a", 2));
    EXPECT_EQ(history.getHistorySize(), 1u);
}

TEST_F(EntityTest, FrontBackForwardBackward) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10, 0));
    ASSERT_TRUE(addRect(store, "b", 0, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 0, 0, 10, 10, 2));

    ASSERT_TRUE(zOrder.bringToFront({"a"}));
    EXPECT_GT(z("a"), z("c"));

    ASSERT_TRUE(zOrder.sendToBack({"c"}));
    EXPECT_LT(z("c"), z("b"));

    // Order is now c, b, a.
    ASSERT_TRUE(zOrder.bringForward({"c"}));
    EXPECT_GT(z("c"), z("b"));
    EXPECT_LT(z("c"), z("a"));

    ASSERT_TRUE(zOrder.sendBackward({"a"}));
    EXPECT_LT(z("a"), z("c"));
    EXPECT_FALSE(zOrder.sendBackward({"b"}));
}

TEST_F(EntityTest, ForwardBackwardAcrossZIndexGaps) {
    ObjectMap objects{{"a", rect("a", 0, 0, 10, 10, 0)}, {"b", rect("b", 0, 0, 10, 10, 2)}};
    auto updates = calculateBringForward(objects, {"a"});
    ASSERT_EQ(updates.size(), 2u);
    for (const ObjectUpdate& u : updates) {
        ASSERT_TRUE(u.patch.has(ObjectField::ZIndex));
        EXPECT_EQ(u.patch.values.zIndex, u.id == "a" ? 2 : 0);
    }

    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 0, 0, 10, 10, 2));
    ASSERT_TRUE(addRect(store, "b", 0, 0, 10, 10, 3));
    ASSERT_TRUE(addRect(store, "d", 0, 0, 10, 10, 7));

    ASSERT_TRUE(zOrder.bringForward({"a", "b"}));
    EXPECT_LT(z("c"), z("a"));
    EXPECT_LT(z("a"), z("d"));
    EXPECT_LT(z("d"), z("b"));

    ASSERT_TRUE(zOrder.sendBackward({"b"}));
    EXPECT_LT(z("b"), z("d"));
    EXPECT_GT(z("b"), z("a"));
    EXPECT_FALSE(zOrder.bringForward({"d"}));
}

// =============================================================================
// Groups
// =============================================================================

TEST_F(EntityTest, GroupAndUngroupRoundTrip) {
    ASSERT_TRUE(addRect(store, "a", 10, 20, 30, 30));
    ASSERT_TRUE(addRect(store, "b", 100, 60, 20, 20, 1));
    selection.setSelection({"a", "b"});

    const std::optional<ObjectId> gid = groups.groupSelection();
    ASSERT_TRUE(gid.has_value());
    const SceneObject* group = store.get(*gid);
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->kind, ObjectKind::Group);
    EXPECT_FLOAT_EQ(group->x, 10.0f);
    EXPECT_FLOAT_EQ(group->y, 20.0f);
    EXPECT_FLOAT_EQ(group->width, 110.0f);
    EXPECT_FLOAT_EQ(group->height, 60.0f);
    EXPECT_EQ(group->children(), (std::vector<ObjectId>{"a", "b"}));

    // Children are stored relative to the group, absolute position unchanged.
    EXPECT_FLOAT_EQ(store.get("b")->x, 90.0f);
    const Point2 abs = GroupResolver::getAbsolutePosition(*store.get("b"), store.objects());
    EXPECT_FLOAT_EQ(abs.x, 100.0f);
    EXPECT_FLOAT_EQ(abs.y, 60.0f);
    EXPECT_EQ(selection.getSelectedIds(), (std::vector<ObjectId>{*gid}));

    ASSERT_TRUE(groups.ungroupSelection());
    EXPECT_FALSE(store.contains(*gid));
    EXPECT_FLOAT_EQ(store.get("b")->x, 100.0f);
    EXPECT_FALSE(store.get("b")->isChild());
    EXPECT_EQ(selection.size(), 2u);

    ASSERT_TRUE(history.undo());
    EXPECT_TRUE(store.contains(*gid));
    ASSERT_TRUE(history.undo());
    EXPECT_FALSE(store.contains(*gid));
    EXPECT_FLOAT_EQ(store.get("b")->x, 100.0f);
}

TEST_F(EntityTest, GroupingNeedsTwoObjectsWithOneParent) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    selection.setSelection({"a"});
    EXPECT_FALSE(groups.groupSelection().has_value());

    ASSERT_TRUE(addRect(store, "b", 20, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 40, 0, 10, 10, 2));
    selection.setSelection({"a", "b"});
    ASSERT_TRUE(groups.groupSelection().has_value());

    // One child of the new group plus one top-level object.
    selection.setSelection({"a", "c"});
    EXPECT_FALSE(groups.groupSelection().has_value());
}

TEST_F(EntityTest, NestedGroupKeepsParentChildList) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 20, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 40, 0, 10, 10, 2));
    selection.setSelection({"a", "b", "c"});
    const ObjectId outer = *groups.groupSelection();

    selection.setSelection({"a", "b"});
    const ObjectId inner = *groups.groupSelection();

    EXPECT_EQ(store.get(outer)->children(), (std::vector<ObjectId>{inner, "c"}));
    EXPECT_EQ(*store.get(inner)->parentId(), outer);
    EXPECT_EQ(*store.get("a")->parentId(), inner);

    const Point2 abs = GroupResolver::getAbsolutePosition(*store.get("b"), store.objects());
    EXPECT_FLOAT_EQ(abs.x, 20.0f);
}

TEST_F(EntityTest, ParentCycleResolvesToOwnCoordinates) {
    SceneObject g1 = makeObject(ObjectKind::Group, "g1", 10, 10, 10, 10, 0);
    SceneObject g2 = makeObject(ObjectKind::Group, "g2", 20, 20, 10, 10, 1);
    GroupResolver::setParent(g1, ObjectId("g2"));
    GroupResolver::setParent(g2, ObjectId("g1"));
    GroupResolver::setChildren(g1, {"g2"});
    GroupResolver::setChildren(g2, {"g1"});
    ObjectMap objects{{"g1", g1}, {"g2", g2}};

    const Point2 p = GroupResolver::getAbsolutePosition(objects.at("g1"), objects);
    EXPECT_FLOAT_EQ(p.x, 10.0f);
    EXPECT_FLOAT_EQ(p.y, 10.0f);

    const std::vector<ObjectId> descendants = GroupResolver::collectDescendants("g1", objects);
    EXPECT_EQ(descendants, (std::vector<ObjectId>{"g2"}));
}

TEST_F(EntityTest, MissingParentIsIgnored) {
    SceneObject orphan = rect("o", 5, 5, 10, 10);
    GroupResolver::setParent(orphan, ObjectId("gone"));
    ObjectMap objects{{"o", orphan}};
    const Point2 p = GroupResolver::getAbsolutePosition(objects.at("o"), objects);
    EXPECT_FLOAT_EQ(p.x, 5.0f);
}

TEST_F(EntityTest, DeleteTakesDescendantsAndDetachesFromParent) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 20, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(store, "c", 40, 0, 10, 10, 2));
    selection.setSelection({"a", "b", "c"});
    const ObjectId outer = *groups.groupSelection();
    selection.setSelection({"a", "b"});
    const ObjectId inner = *groups.groupSelection();

    const std::size_t before = history.getHistorySize();
    ASSERT_TRUE(groups.deleteObjects({inner}));
    EXPECT_FALSE(store.contains(inner));
    EXPECT_FALSE(store.contains("a"));
    EXPECT_FALSE(store.contains("b"));
    EXPECT_EQ(store.get(outer)->children(), (std::vector<ObjectId>{"c"}));
    EXPECT_EQ(history.getHistorySize(), before + 1);

    EXPECT_FALSE(groups.deleteObjects({"nope"}));
}

TEST_F(EntityTest, GroupEditExitsWhenGroupIsDeleted) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 20, 0, 10, 10, 1));
    selection.setSelection({"a", "b"});
    const ObjectId gid = *groups.groupSelection();

    EXPECT_FALSE(groups.enterGroupEdit("a"));
    ASSERT_TRUE(groups.enterGroupEdit(gid));
    selection.selectAll(groups.editingGroupId());
    EXPECT_EQ(selection.getSelectedIds(), (std::vector<ObjectId>{"a", "b"}));

    ASSERT_TRUE(groups.deleteObjects({gid}));
    EXPECT_FALSE(groups.editingGroupId().has_value());
}

// =============================================================================
// Clipboard
// =============================================================================

TEST_F(EntityTest, PasteCascadesAndSelectsCopies) {
    ASSERT_TRUE(addRect(store, "a", 10, 10, 20, 20));
    ASSERT_TRUE(clipboard.copy({"a"}));

    const std::vector<ObjectId> first = clipboard.paste();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_NE(first[0], "a");
    EXPECT_FLOAT_EQ(store.get(first[0])->x, 20.0f);
    EXPECT_EQ(selection.getSelectedIds(), first);

    const std::vector<ObjectId> second = clipboard.paste();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_FLOAT_EQ(store.get(second[0])->x, 30.0f);
    EXPECT_GT(store.get(second[0])->zIndex, store.get(first[0])->zIndex);
    EXPECT_EQ(clipboard.getPasteCount(), 2u);
}

TEST_F(EntityTest, CopyOfChildIsStoredAtAbsolutePosition) {
    ASSERT_TRUE(addRect(store, "a", 100, 100, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 200, 100, 10, 10, 1));
    selection.setSelection({"a", "b"});
    ASSERT_TRUE(groups.groupSelection().has_value());

    ASSERT_TRUE(clipboard.copy({"b"}));
    ASSERT_EQ(clipboard.getItems().size(), 1u);
    EXPECT_FLOAT_EQ(clipboard.getItems()[0].x, 200.0f);
    EXPECT_FALSE(clipboard.getItems()[0].isChild());
}

TEST_F(EntityTest, DuplicateGroupRemapsHierarchy) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(store, "b", 20, 0, 10, 10, 1));
    selection.setSelection({"a", "b"});
    const ObjectId gid = *groups.groupSelection();
    const std::size_t before = store.size();

    const std::vector<ObjectId> copies = clipboard.duplicate({gid});
    ASSERT_EQ(copies.size(), 1u);
    EXPECT_EQ(store.size(), before + 3);

    const SceneObject* copy = store.get(copies[0]);
    ASSERT_NE(copy, nullptr);
    EXPECT_FLOAT_EQ(copy->x, store.get(gid)->x);
    ASSERT_EQ(copy->children().size(), 2u);
    for (const ObjectId& child : copy->children()) {
        EXPECT_NE(child, "a");
        EXPECT_NE(child, "b");
        ASSERT_TRUE(store.get(child)->parentId().has_value());
        EXPECT_EQ(*store.get(child)->parentId(), copies[0]);
    }
}

TEST_F(EntityTest, FailedCopyKeepsPreviousContents) {
    ASSERT_TRUE(addRect(store, "a", 0, 0, 10, 10));
    ASSERT_TRUE(clipboard.copy({"a"}));
    EXPECT_FALSE(clipboard.copy({"missing"}));
    EXPECT_TRUE(clipboard.hasItems());
    EXPECT_EQ(clipboard.getItems()[0].id, "a");
}
