#include "tests/karta_test_common.h"

#include <cmath>

using namespace karta_test;

class DrawingToolsTest : public EditorFixture {};

// =============================================================================
// Shapes
// =============================================================================

TEST_F(DrawingToolsTest, RectangleCommitSelectsAndReturnsToSelect) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 200, 150);

    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->kind, ObjectKind::Rectangle);
    EXPECT_FLOAT_EQ(obj->x, 100.0f);
    EXPECT_FLOAT_EQ(obj->y, 100.0f);
    EXPECT_FLOAT_EQ(obj->width, 100.0f);
    EXPECT_FLOAT_EQ(obj->height, 50.0f);

    EXPECT_EQ(editor.selection().getSelectedIds(), (std::vector<ObjectId>{obj->id}));
    EXPECT_EQ(editor.activeTool(), ToolType::Select);
    EXPECT_EQ(editor.history().getHistorySize(), 1u);

    ASSERT_TRUE(editor.undo());
    EXPECT_EQ(editor.store().size(), 0u);
}

TEST_F(DrawingToolsTest, DragTowardsOriginNormalises) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(200, 150, 100, 100);
    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    EXPECT_FLOAT_EQ(obj->x, 100.0f);
    EXPECT_FLOAT_EQ(obj->width, 100.0f);
}

TEST_F(DrawingToolsTest, TinyDragLeavesNothingBehind) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 105, 104);

    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_FALSE(editor.history().canUndo());
    EXPECT_EQ(editor.activeTool(), ToolType::Rectangle);
}

TEST_F(DrawingToolsTest, OneLongSideIsEnough) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 105, 160);
    ASSERT_NE(only(), nullptr);
    EXPECT_FLOAT_EQ(only()->width, 5.0f);
}

TEST_F(DrawingToolsTest, EscapeCancelsMidDrag) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Ellipse));
    editor.mouseDown(100, 100, 0, 0);
    editor.mouseMove(180, 180, 0, 0);
    EXPECT_EQ(editor.store().size(), 1u);

    EXPECT_TRUE(editor.keyDown(key("Escape")).handled);
    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_FALSE(editor.history().canUndo());

    // The release after a cancel does nothing.
    editor.mouseUp(180, 180, 0, 0);
    EXPECT_EQ(editor.store().size(), 0u);
}

TEST_F(DrawingToolsTest, ShiftConstrainsToSquare) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 200, 150, kShift);
    ASSERT_NE(only(), nullptr);
    EXPECT_FLOAT_EQ(only()->width, 100.0f);
    EXPECT_FLOAT_EQ(only()->height, 100.0f);
}

TEST_F(DrawingToolsTest, AltSwapsRectangleAndEllipse) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 200, 150, kAlt);
    ASSERT_NE(only(), nullptr);
    EXPECT_EQ(only()->kind, ObjectKind::Ellipse);
}

TEST_F(DrawingToolsTest, AltKeyDuringDragSwapsPreview) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Ellipse));
    editor.mouseDown(100, 100, 0, 0);
    editor.mouseMove(160, 160, 0, 0);
    editor.keyDown(key("Alt"));
    ASSERT_NE(only(), nullptr);
    EXPECT_EQ(only()->kind, ObjectKind::Rectangle);

    editor.keyUp(key("Alt"));
    EXPECT_EQ(only()->kind, ObjectKind::Ellipse);
    editor.mouseUp(160, 160, 0, 0);
}

TEST_F(DrawingToolsTest, ShapesSnapToObjectEdges) {
    editor.grid().snapToObjects = true;
    ASSERT_TRUE(addRect(editor.store(), "anchor", 300, 300, 50, 50));

    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    drag(100, 100, 297, 200);

    const SceneObject* drawn = nullptr;
    for (const auto& [id, obj] : editor.store().objects()) {
        if (id != "anchor") drawn = &obj;
    }
    ASSERT_NE(drawn, nullptr);
    EXPECT_FLOAT_EQ(drawn->x + drawn->width, 300.0f);
}

TEST_F(DrawingToolsTest, FrameGetsDefaultName) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Frame));
    drag(0, 0, 300, 200);
    ASSERT_NE(only(), nullptr);
    EXPECT_EQ(only()->kind, ObjectKind::Frame);
    EXPECT_EQ(only()->name, "Frame");
}

// =============================================================================
// Lines and paths
// =============================================================================

TEST_F(DrawingToolsTest, LineEndpointsAreRelative) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Arrow));
    drag(200, 100, 100, 150);

    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->kind, ObjectKind::Arrow);
    EXPECT_FLOAT_EQ(obj->x, 100.0f);
    EXPECT_FLOAT_EQ(obj->y, 100.0f);
    EXPECT_FLOAT_EQ(obj->x1, 100.0f);
    EXPECT_FLOAT_EQ(obj->y1, 0.0f);
    EXPECT_FLOAT_EQ(obj->x2, 0.0f);
    EXPECT_FLOAT_EQ(obj->y2, 50.0f);
}

TEST_F(DrawingToolsTest, ShortLineIsDiscarded) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Line));
    drag(100, 100, 105, 105);
    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_FALSE(editor.history().canUndo());
}

TEST_F(DrawingToolsTest, ShiftSnapsLineTo45Degrees) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Line));
    drag(100, 100, 200, 190, kShift);

    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    const float dx = obj->x2 - obj->x1;
    const float dy = obj->y2 - obj->y1;
    EXPECT_NEAR(dx, dy, 1e-3f);
    EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), std::sqrt(100.0f * 100.0f + 90.0f * 90.0f), 1e-2f);
}

TEST_F(DrawingToolsTest, PenRecordsEveryPointer) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Pen));
    drag(10, 10, 50, 30);

    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->kind, ObjectKind::Path);
    ASSERT_EQ(obj->points.size(), 3u);
    EXPECT_FLOAT_EQ(obj->x, 10.0f);
    EXPECT_FLOAT_EQ(obj->points.back().x, 40.0f);
    EXPECT_FLOAT_EQ(obj->points.back().y, 20.0f);
    EXPECT_EQ(editor.activeTool(), ToolType::Select);
}

TEST_F(DrawingToolsTest, PenClickWithoutMovingIsDropped) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Pen));
    click(10, 10);
    EXPECT_EQ(editor.store().size(), 0u);
}

// =============================================================================
// Text and hand
// =============================================================================

TEST_F(DrawingToolsTest, TextToolStartsEditing) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Text));
    click(50, 60);

    const SceneObject* obj = only();
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->kind, ObjectKind::Text);
    EXPECT_FLOAT_EQ(obj->x, 50.0f);
    EXPECT_EQ(editor.activeTool(), ToolType::Select);
    EXPECT_TRUE(editor.inlineEditor().isEditing());

    ASSERT_TRUE(editor.textInput("Hello"));
    EXPECT_EQ(only()->text, "Hello");
    ASSERT_TRUE(editor.commitTextEdit());
    EXPECT_EQ(editor.history().getHistorySize(), 1u);
}

TEST_F(DrawingToolsTest, ClickRightAfterCreatingTextIsSwallowed) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Text));
    click(50, 60);
    click(400, 400);
    EXPECT_TRUE(editor.inlineEditor().isEditing());
    EXPECT_EQ(editor.store().size(), 1u);
}

TEST_F(DrawingToolsTest, EmptyNewTextIsRemovedOnCommit) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Text));
    click(50, 60);
    clock.advance(constants::kEditStartGuardMs);

    EXPECT_TRUE(editor.keyDown(key("Enter", kMeta)).handled);
    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_FALSE(editor.history().canUndo());
}

TEST_F(DrawingToolsTest, HandPansViewport) {
    ASSERT_TRUE(editor.setActiveTool(ToolType::Hand));
    EXPECT_EQ(editor.cursor(), Cursor::Grab);

    editor.mouseDown(100, 100, 0, 0);
    EXPECT_EQ(editor.cursor(), Cursor::Grabbing);
    editor.mouseMove(150, 120, 0, 0);
    editor.mouseUp(150, 120, 0, 0);

    EXPECT_FLOAT_EQ(editor.viewport().x, 50.0f);
    EXPECT_FLOAT_EQ(editor.viewport().y, 20.0f);
    EXPECT_EQ(editor.store().size(), 0u);
}
