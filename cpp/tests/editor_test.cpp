#include "tests/karta_test_common.h"

using namespace karta_test;

class EditorTest : public EditorFixture {
protected:
    const SceneObject& get(const ObjectId& id) { return *editor.store().get(id); }
};

// =============================================================================
// Document shortcuts
// =============================================================================

TEST_F(EditorTest, DeleteRemovesSelectionAsOneStep) {
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(editor.store(), "b", 20, 0, 10, 10));
    editor.selection().setSelection({"a", "b"});

    EXPECT_TRUE(editor.keyDown(key("Delete")).handled);
    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_TRUE(editor.selection().isEmpty());
    EXPECT_EQ(editor.history().getHistorySize(), 1u);

    EXPECT_TRUE(editor.keyDown(key("z", kMeta)).handled);
    EXPECT_EQ(editor.store().size(), 2u);
    EXPECT_TRUE(editor.keyDown(key("Z", kMeta | kShift)).handled);
    EXPECT_EQ(editor.store().size(), 0u);
    EXPECT_TRUE(editor.keyDown(key("z", kCtrl)).handled);
    EXPECT_TRUE(editor.keyDown(key("y", kCtrl)).handled);
    EXPECT_EQ(editor.store().size(), 0u);
}

TEST_F(EditorTest, DeleteSkipsLockedObjects) {
    SceneObject locked = rect("l", 0, 0, 10, 10);
    locked.locked = true;
    ASSERT_TRUE(addObject(editor.store(), locked));
    ASSERT_TRUE(addRect(editor.store(), "a", 20, 0, 10, 10));

    editor.selection().setSelection({"l"});
    EXPECT_FALSE(editor.keyDown(key("Backspace")).handled);
    EXPECT_TRUE(editor.store().contains("l"));

    editor.selection().setSelection({"l", "a"});
    EXPECT_TRUE(editor.keyDown(key("Backspace")).handled);
    EXPECT_TRUE(editor.store().contains("l"));
    EXPECT_FALSE(editor.store().contains("a"));
}

TEST_F(EditorTest, CopyPasteAndDuplicate) {
    ASSERT_TRUE(addRect(editor.store(), "a", 10, 10, 20, 20));
    editor.selection().setSelection({"a"});

    EXPECT_TRUE(editor.keyDown(key("c", kCtrl)).handled);
    EXPECT_TRUE(editor.keyDown(key("v", kCtrl)).handled);
    ASSERT_EQ(editor.store().size(), 2u);
    const ObjectId pasted = editor.selection().getSelectedIds().front();
    EXPECT_NE(pasted, "a");
    EXPECT_FLOAT_EQ(get(pasted).x, 20.0f);

    EXPECT_TRUE(editor.keyDown(key("d", kMeta)).handled);
    ASSERT_EQ(editor.store().size(), 3u);
    const ObjectId dup = editor.selection().getSelectedIds().front();
    EXPECT_NE(dup, pasted);
    EXPECT_FLOAT_EQ(get(dup).x, 20.0f);
    EXPECT_EQ(editor.history().getHistorySize(), 2u);
}

TEST_F(EditorTest, NudgeRepeatExtendsOneUndoStep) {
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10));
    editor.selection().setSelection({"a"});

    EXPECT_TRUE(editor.keyDown(key("ArrowRight")).handled);
    EXPECT_TRUE(editor.keyDown(key("ArrowRight", 0, true)).handled);
    EXPECT_TRUE(editor.keyDown(key("ArrowRight", 0, true)).handled);
    EXPECT_FLOAT_EQ(get("a").x, 3.0f);
    EXPECT_EQ(editor.history().getHistorySize(), 1u);

    EXPECT_TRUE(editor.keyDown(key("ArrowDown", kShift)).handled);
    EXPECT_FLOAT_EQ(get("a").y, 10.0f);
    EXPECT_EQ(editor.history().getHistorySize(), 2u);

    ASSERT_TRUE(editor.undo());
    ASSERT_TRUE(editor.undo());
    EXPECT_FLOAT_EQ(get("a").x, 0.0f);
}

TEST_F(EditorTest, NudgePublishesImmediately) {
    RecordingChannel channel;
    editor.setChannel(&channel);
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10));
    editor.store().flush();
    channel.clear();

    editor.selection().setSelection({"a"});
    ASSERT_TRUE(editor.keyDown(key("ArrowLeft")).handled);
    ASSERT_EQ(channel.deltas.size(), 1u);
    EXPECT_EQ(channel.deltas[0].id, "a");
}

TEST_F(EditorTest, GroupShortcuts) {
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(editor.store(), "b", 20, 0, 10, 10, 1));
    EXPECT_TRUE(editor.keyDown(key("a", kCtrl)).handled);
    EXPECT_EQ(editor.selection().size(), 2u);

    EXPECT_TRUE(editor.keyDown(key("g", kCtrl)).handled);
    ASSERT_EQ(editor.selection().size(), 1u);
    EXPECT_EQ(get(editor.selection().getSelectedIds().front()).kind, ObjectKind::Group);

    EXPECT_TRUE(editor.keyDown(key("G", kCtrl | kShift)).handled);
    EXPECT_EQ(editor.selection().getSelectedIds(), (std::vector<ObjectId>{"a", "b"}));
    EXPECT_EQ(editor.store().size(), 2u);
}

TEST_F(EditorTest, BracketKeysReorder) {
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10, 0));
    ASSERT_TRUE(addRect(editor.store(), "b", 0, 0, 10, 10, 1));
    ASSERT_TRUE(addRect(editor.store(), "c", 0, 0, 10, 10, 2));
    editor.selection().setSelection({"a"});

    EXPECT_TRUE(editor.keyDown(key("]")).handled);
    EXPECT_GT(get("a").zIndex, get("b").zIndex);
    EXPECT_LT(get("a").zIndex, get("c").zIndex);

    EXPECT_TRUE(editor.keyDown(key("]", kCtrl)).handled);
    EXPECT_GT(get("a").zIndex, get("c").zIndex);

    EXPECT_TRUE(editor.keyDown(key("[", kMeta)).handled);
    EXPECT_LT(get("a").zIndex, get("b").zIndex);
}

// =============================================================================
// Tools and escape
// =============================================================================

TEST_F(EditorTest, ToolKeys) {
    EXPECT_TRUE(editor.keyDown(key("r")).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Rectangle);
    EXPECT_TRUE(editor.keyDown(key("O")).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Ellipse);
    EXPECT_TRUE(editor.keyDown(key("l")).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Line);
    EXPECT_TRUE(editor.keyDown(key("v")).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Select);

    // Held keys and Alt chords do not switch.
    EXPECT_FALSE(editor.keyDown(key("h", 0, true)).handled);
    EXPECT_FALSE(editor.keyDown(key("h", kAlt)).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Select);
    EXPECT_FALSE(editor.keyDown(key("q")).handled);
}

TEST_F(EditorTest, EscapeUnwindsOneLevelAtATime) {
    ASSERT_TRUE(addRect(editor.store(), "a", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(editor.store(), "b", 20, 0, 10, 10, 1));
    editor.selection().setSelection({"a", "b"});
    ASSERT_TRUE(editor.groupSelection());
    const ObjectId gid = editor.selection().getSelectedIds().front();
    ASSERT_TRUE(editor.groups().enterGroupEdit(gid));
    editor.selection().setSelection({"a"});
    ASSERT_TRUE(editor.setActiveTool(ToolType::Hand));

    EXPECT_TRUE(editor.keyDown(key("Escape")).handled);
    EXPECT_TRUE(editor.selection().isEmpty());
    EXPECT_TRUE(editor.groups().editingGroupId().has_value());

    EXPECT_TRUE(editor.keyDown(key("Escape")).handled);
    EXPECT_FALSE(editor.groups().editingGroupId().has_value());
    EXPECT_EQ(editor.activeTool(), ToolType::Hand);

    EXPECT_TRUE(editor.keyDown(key("Escape")).handled);
    EXPECT_EQ(editor.activeTool(), ToolType::Select);

    EXPECT_FALSE(editor.keyDown(key("Escape")).handled);
}

// =============================================================================
// Inline editing keys
// =============================================================================

TEST_F(EditorTest, KeysGoToTextFieldWhileEditing) {
    SceneObject text = makeObject(ObjectKind::Text, "t", 0, 0, 50, 20, 0);
    text.text = "abc";
    ASSERT_TRUE(addObject(editor.store(), text));
    editor.selection().setSelection({"t"});
    ASSERT_TRUE(editor.inlineEditor().begin("t", EditTarget::Text));

    EXPECT_FALSE(editor.keyDown(key("Delete")).handled);
    EXPECT_FALSE(editor.keyDown(key("r")).handled);
    EXPECT_TRUE(editor.store().contains("t"));
    EXPECT_EQ(editor.activeTool(), ToolType::Select);

    ASSERT_TRUE(editor.textInput("abcd"));
    // Plain Enter is a newline in text.
    EXPECT_FALSE(editor.keyDown(key("Enter")).handled);
    EXPECT_TRUE(editor.inlineEditor().isEditing());
    EXPECT_TRUE(editor.keyDown(key("Enter", kCtrl)).handled);
    EXPECT_FALSE(editor.inlineEditor().isEditing());
    EXPECT_EQ(get("t").text, "abcd");
}

TEST_F(EditorTest, EscapeCancelsInlineEdit) {
    SceneObject frame = makeObject(ObjectKind::Frame, "f", 0, 0, 200, 200, 0);
    ASSERT_TRUE(addObject(editor.store(), frame));
    ASSERT_TRUE(editor.inlineEditor().begin("f", EditTarget::FrameName));
    ASSERT_TRUE(editor.textInput("Renamed"));

    EXPECT_TRUE(editor.keyDown(key("Escape")).handled);
    EXPECT_FALSE(editor.inlineEditor().isEditing());
    EXPECT_EQ(get("f").name, "Frame");
    EXPECT_FALSE(editor.history().canUndo());
}

TEST_F(EditorTest, EnterCommitsFrameNameUnlessShifted) {
    SceneObject frame = makeObject(ObjectKind::Frame, "f", 0, 0, 200, 200, 0);
    ASSERT_TRUE(addObject(editor.store(), frame));
    ASSERT_TRUE(editor.inlineEditor().begin("f", EditTarget::FrameName));
    ASSERT_TRUE(editor.textInput("Board"));

    EXPECT_FALSE(editor.keyDown(key("Enter", kShift)).handled);
    EXPECT_TRUE(editor.inlineEditor().isEditing());
    EXPECT_TRUE(editor.keyDown(key("Enter")).handled);
    EXPECT_FALSE(editor.inlineEditor().isEditing());
    EXPECT_EQ(get("f").name, "Board");
    EXPECT_EQ(editor.history().getHistorySize(), 1u);
}

TEST_F(EditorTest, UndoSettlesOpenEdit) {
    SceneObject text = makeObject(ObjectKind::Text, "t", 0, 0, 50, 20, 0);
    text.text = "one";
    ASSERT_TRUE(addObject(editor.store(), text));
    ASSERT_TRUE(editor.inlineEditor().begin("t", EditTarget::Text));
    ASSERT_TRUE(editor.textInput("two"));

    ASSERT_TRUE(editor.undo());
    EXPECT_FALSE(editor.inlineEditor().isEditing());
    EXPECT_EQ(get("t").text, "one");
}

// =============================================================================
// Viewport
// =============================================================================

TEST_F(EditorTest, ZoomToFitAndSelection) {
    ASSERT_TRUE(addRect(editor.store(), "a", 100, 100, 200, 100));
    editor.zoomToFit();
    EXPECT_FLOAT_EQ(editor.viewport().zoom, 3.5f);
    const Point2 centre = canvasToScreen(editor.viewport(), 200.0f, 150.0f);
    EXPECT_NEAR(centre.x, 400.0f, 1e-3f);
    EXPECT_NEAR(centre.y, 300.0f, 1e-3f);

    EXPECT_FALSE(editor.zoomToSelection());
    editor.selection().setSelection({"a"});
    EXPECT_TRUE(editor.zoomToSelection());

    ASSERT_TRUE(editor.store().remove("a"));
    editor.zoomToFit();
    EXPECT_FLOAT_EQ(editor.viewport().zoom, 1.0f);
    EXPECT_FLOAT_EQ(editor.viewport().x, 0.0f);
}

TEST_F(EditorTest, ZoomAtKeepsPointerAnchored) {
    const Point2 before = screenToCanvas(editor.viewport(), 300.0f, 200.0f);
    editor.zoomAt(300.0f, 200.0f, 2.0f);
    const Point2 after = screenToCanvas(editor.viewport(), 300.0f, 200.0f);
    EXPECT_NEAR(before.x, after.x, 1e-4f);
    EXPECT_NEAR(before.y, after.y, 1e-4f);

    editor.setZoomPreset(50.0f);
    EXPECT_FLOAT_EQ(editor.viewport().zoom, constants::kMaxZoom);
}

// =============================================================================
// Replication while interacting
// =============================================================================

TEST_F(EditorTest, RemoteDeleteDuringDragIsHarmless) {
    ASSERT_TRUE(addRect(editor.store(), "a", 100, 100, 50, 50));
    editor.mouseDown(120, 120, 0, 0);
    editor.mouseMove(140, 140, 0, 0);
    ASSERT_TRUE(editor.store().mergeRemoteDelete("a", Stamp{1000, "zed"}));
    editor.mouseMove(160, 160, 0, 0);
    editor.mouseUp(160, 160, 0, 0);

    EXPECT_FALSE(editor.store().contains("a"));
    EXPECT_TRUE(editor.selection().isEmpty());
}

// =============================================================================
// Two peers
// =============================================================================

TEST(EditorPeersTest, DefaultSitesAreDistinctAndDocumentsConverge) {
    ManualClock clock;
    Editor alice(EditorOptions{}, clock.fn());
    Editor bob(EditorOptions{}, clock.fn());
    EXPECT_NE(alice.store().siteId(), bob.store().siteId());

    RecordingChannel toBob;
    RecordingChannel toAlice;
    alice.setChannel(&toBob);
    bob.setChannel(&toAlice);

    for (Editor* editor : {&alice, &bob}) {
        ASSERT_TRUE(editor->setActiveTool(ToolType::Rectangle));
    }
    alice.mouseDown(10, 10, 0, 0);
    alice.mouseMove(60, 60, 0, 0);
    alice.mouseUp(60, 60, 0, 0);
    bob.mouseDown(300, 300, 0, 0);
    bob.mouseMove(350, 350, 0, 0);
    bob.mouseUp(350, 350, 0, 0);
    alice.store().flush();
    bob.store().flush();

    bob.store().mergeRemoteBatch(toBob.deltas);
    alice.store().mergeRemoteBatch(toAlice.deltas);

    ASSERT_EQ(alice.store().size(), 2u);
    ASSERT_EQ(bob.store().size(), 2u);
    for (const auto& [id, obj] : alice.store().objects()) {
        const SceneObject* other = bob.store().get(id);
        ASSERT_NE(other, nullptr);
        EXPECT_FLOAT_EQ(other->x, obj.x);
        EXPECT_FLOAT_EQ(other->y, obj.y);
    }
}

TEST(EditorPeersTest, NewIdsSkipOnesAlreadyInTheDocument) {
    ManualClock clock;
    EditorOptions options;
    options.store.siteId = "s1";
    Editor editor(options, clock.fn());

    ASSERT_TRUE(addRect(editor.store(), "s1-1", 0, 0, 10, 10));
    ASSERT_TRUE(addRect(editor.store(), "s1-2", 20, 0, 10, 10, 1));
    ASSERT_TRUE(editor.store().remove("s1-2"));

    ASSERT_TRUE(editor.setActiveTool(ToolType::Rectangle));
    editor.mouseDown(100, 100, 0, 0);
    editor.mouseMove(150, 150, 0, 0);
    editor.mouseUp(150, 150, 0, 0);

    EXPECT_EQ(editor.store().size(), 2u);
    EXPECT_TRUE(editor.store().contains("s1-3"));
    EXPECT_FLOAT_EQ(editor.store().get("s1-1")->x, 0.0f);
}
