// Copyright 2026 The boardkit Authors
// Tests for: InteractionController drawing, dragging, resizing, rotation,
//            keyboard shortcuts, box selection, layers and inline text editing

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gtest/gtest.h"

#include "core/board_events.h"
#include "geometry/geometry.h"
#include "geometry/handles.h"
#include "history/history_manager.h"
#include "interaction/buffer_text_surface.h"
#include "interaction/interaction_controller.h"
#include "interaction/selection_manager.h"
#include "interaction/snap_engine.h"
#include "scene/rich_text.h"
#include "scene/scene_model.h"

using namespace boardkit::internal;

namespace {

class RecordingObserver : public BoardObserver {
 public:
  void OnToolChanged(Tool tool) override { tools.push_back(tool); }
  std::vector<Tool> tools;
};

Modifiers NoMods() { return Modifiers(); }

Modifiers Shift() {
  Modifiers mods;
  mods.shift = true;
  return mods;
}

Modifiers Ctrl() {
  Modifiers mods;
  mods.ctrl = true;
  return mods;
}

}  // namespace

class InteractionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    controller_.SetTextSurface(&surface_);
    controller_.SetObserver(&observer_);
  }

  void Drag(double x0, double y0, double x1, double y1,
            const Modifiers& mods = Modifiers()) {
    controller_.PointerDown(x0, y0, mods);
    controller_.PointerMove((x0 + x1) / 2, (y0 + y1) / 2, mods);
    controller_.PointerMove(x1, y1, mods);
    controller_.PointerUp(x1, y1, mods);
  }

  // Draw a shape with the shape tool and return its id.
  std::string DrawShape(ShapeType type, double x0, double y0, double x1,
                        double y1) {
    ShapeToolStyle style;
    style.type = type;
    controller_.SetTool(Tool::kShape, &style);
    Drag(x0, y0, x1, y1);
    return selection_.empty() ? std::string() : *selection_.primary();
  }

  SceneModel scene_;
  SelectionManager selection_;
  HistoryManager history_{&scene_};
  Viewport viewport_;
  InteractionController controller_{&scene_, &selection_, &history_,
                                    &viewport_};
  BufferTextSurface surface_;
  RecordingObserver observer_;
};

// ---------------------------------------------------------------------------
// Drawing
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, ShapeToolCreatesSelectsAndDeactivates) {
  std::string id = DrawShape(ShapeType::kRectangle, 100, 100, 300, 250);
  ASSERT_FALSE(id.empty());
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->x, 100);
  EXPECT_DOUBLE_EQ(obj->y, 100);
  EXPECT_DOUBLE_EQ(obj->width, 200);
  EXPECT_DOUBLE_EQ(obj->height, 150);
  EXPECT_EQ(obj->shape()->shape_type, ShapeType::kRectangle);

  EXPECT_TRUE(selection_.IsSingle());
  EXPECT_EQ(controller_.tool(), Tool::kNone);
  ASSERT_EQ(observer_.tools.size(), 1u);
  EXPECT_EQ(observer_.tools[0], Tool::kNone);
  EXPECT_EQ(history_.Stats().undo_count, 1);
  EXPECT_EQ(controller_.state(), InteractionState::kIdle);
  EXPECT_FALSE(controller_.preview().has_value());
}

TEST_F(InteractionTest, DrawNormalisesReverseDrag) {
  std::string id = DrawShape(ShapeType::kCircle, 300, 250, 100, 100);
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->x, 100);
  EXPECT_DOUBLE_EQ(obj->y, 100);
}

TEST_F(InteractionTest, PreviewFollowsPointer) {
  ShapeToolStyle style;
  style.type = ShapeType::kSquare;
  controller_.SetTool(Tool::kShape, &style);
  controller_.PointerDown(10, 10, NoMods());
  controller_.PointerMove(110, 60, NoMods());
  ASSERT_TRUE(controller_.preview().has_value());
  EXPECT_EQ(controller_.state(), InteractionState::kDrawing);
  EXPECT_DOUBLE_EQ(controller_.preview()->object.width, 100);
  EXPECT_DOUBLE_EQ(controller_.preview()->object.height, 50);
  EXPECT_TRUE(scene_.empty());
}

TEST_F(InteractionTest, TinyShapeDragIsDiscarded) {
  ShapeToolStyle style;
  controller_.SetTool(Tool::kShape, &style);
  Drag(100, 100, 106, 106);
  EXPECT_TRUE(scene_.empty());
  EXPECT_FALSE(history_.CanUndo());
  EXPECT_EQ(controller_.tool(), Tool::kShape);
}

TEST_F(InteractionTest, SmallShapeIsClampedToMinimumSize) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 20, 20);
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->width, 50);
  EXPECT_DOUBLE_EQ(obj->height, 50);
}

TEST_F(InteractionTest, TextToolThresholds) {
  controller_.SetTool(Tool::kText);
  Drag(0, 0, 30, 100);  // Width not above 30.
  EXPECT_TRUE(scene_.empty());
  Drag(0, 0, 100, 20);  // Height not above 20.
  EXPECT_TRUE(scene_.empty());
  Drag(0, 0, 100, 60);
  ASSERT_EQ(scene_.size(), 1u);
  const SceneObject* obj = scene_.Find(*selection_.primary());
  EXPECT_EQ(obj->kind(), ObjectKind::kText);
  EXPECT_EQ(PlainText(obj->text()->content),
            InteractionController::kDefaultTextContent);
}

TEST_F(InteractionTest, ArrowKeepsLiteralEndpoints) {
  std::string id = DrawShape(ShapeType::kArrow, 200, 200, 100, 150);
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->x, 200);
  EXPECT_DOUBLE_EQ(obj->y, 200);
  EXPECT_DOUBLE_EQ(obj->shape()->x2, 100);
  EXPECT_DOUBLE_EQ(obj->shape()->y2, 150);
}

TEST_F(InteractionTest, ToolOverObjectDoesNothing) {
  DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  ShapeToolStyle style;
  controller_.SetTool(Tool::kShape, &style);
  EXPECT_TRUE(selection_.empty());
  controller_.PointerDown(50, 50, NoMods());
  EXPECT_EQ(controller_.state(), InteractionState::kIdle);
  EXPECT_TRUE(selection_.empty());
  EXPECT_EQ(scene_.size(), 1u);
}

// ---------------------------------------------------------------------------
// Selection and dragging
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, ClickSelectsAndEmptyClickClears) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  controller_.ClearSelection();
  controller_.PointerDown(50, 50, NoMods());
  controller_.PointerUp(50, 50, NoMods());
  EXPECT_TRUE(selection_.Contains(id));
  EXPECT_FALSE(history_.CanRedo());
  EXPECT_EQ(history_.Stats().undo_count, 1);  // A click is not a move.

  controller_.PointerDown(500, 500, NoMods());
  EXPECT_TRUE(selection_.empty());
}

TEST_F(InteractionTest, DragMovesAndRecordsOneAction) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  Drag(50, 50, 80, 90);
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->x, 30);
  EXPECT_DOUBLE_EQ(obj->y, 40);
  ASSERT_EQ(history_.Stats().undo_count, 2);
  EXPECT_EQ(history_.undo_stack().back().type, ActionType::kMoveMultiple);

  controller_.Undo();
  EXPECT_DOUBLE_EQ(scene_.Find(id)->x, 0);
  EXPECT_DOUBLE_EQ(scene_.Find(id)->y, 0);
}

TEST_F(InteractionTest, DraggingLineMovesBothEndpoints) {
  std::string id = DrawShape(ShapeType::kLine, 0, 0, 100, 50);
  Drag(50, 25, 80, 45);
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->x, 30);
  EXPECT_DOUBLE_EQ(obj->y, 20);
  EXPECT_DOUBLE_EQ(obj->shape()->x2, 130);
  EXPECT_DOUBLE_EQ(obj->shape()->y2, 70);

  controller_.Undo();
  obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->x, 0);
  EXPECT_DOUBLE_EQ(obj->shape()->x2, 100);
  EXPECT_DOUBLE_EQ(obj->shape()->y2, 50);
}

TEST_F(InteractionTest, GroupDragMovesEverySelectedObject) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  controller_.SelectObject(a, true);
  ASSERT_EQ(selection_.size(), 2u);

  Drag(50, 50, 60, 70);
  EXPECT_EQ(selection_.size(), 2u);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 10);
  EXPECT_DOUBLE_EQ(scene_.Find(b)->x, 210);
  EXPECT_DOUBLE_EQ(scene_.Find(b)->y, 20);

  const auto& move =
      std::get<MoveMultipleData>(history_.undo_stack().back().data);
  EXPECT_EQ(move.items.size(), 2u);
}

TEST_F(InteractionTest, ShiftClickTogglesSelection) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  controller_.PointerDown(50, 50, Shift());
  controller_.PointerUp(50, 50, Shift());
  EXPECT_EQ(selection_.size(), 2u);
  controller_.PointerDown(250, 50, Shift());
  controller_.PointerUp(250, 50, Shift());
  EXPECT_FALSE(selection_.Contains(b));
  EXPECT_TRUE(selection_.Contains(a));
}

TEST_F(InteractionTest, SingleDragSnapsToNeighbourEdges) {
  SnapEngine snap(&scene_);
  controller_.SetSnapResolver(&snap);
  controller_.SetSnappingEnabled(true);
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  DrawShape(ShapeType::kRectangle, 300, 0, 400, 100);
  controller_.SelectObject(a, false);

  // Right edge lands at 302, two units from the neighbour's left edge.
  controller_.PointerDown(50, 50, NoMods());
  controller_.PointerMove(252, 250, NoMods());
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 200);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->y, 200);
  ASSERT_EQ(controller_.snap_guides().size(), 1u);
  EXPECT_EQ(controller_.snap_guides()[0].orientation,
            SnapGuide::Orientation::kVertical);
  EXPECT_DOUBLE_EQ(controller_.snap_guides()[0].position, 300);
  controller_.PointerUp(252, 250, NoMods());
  EXPECT_TRUE(controller_.snap_guides().empty());
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 200);

  controller_.SetSnappingEnabled(false);
  Drag(250, 250, 252, 250);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 202);
}

TEST_F(InteractionTest, GroupDragDoesNotSnap) {
  SnapEngine snap(&scene_);
  controller_.SetSnapResolver(&snap);
  controller_.SetSnappingEnabled(true);
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 0, 200, 100, 300);
  DrawShape(ShapeType::kRectangle, 300, 0, 400, 100);
  controller_.SelectObject(a, false);
  controller_.SelectObject(b, true);

  Drag(50, 50, 252, 50);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 202);
  EXPECT_DOUBLE_EQ(scene_.Find(b)->x, 202);
}

TEST_F(InteractionTest, UndoDuringDragRecordsTheMoveFirst) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  DrawShape(ShapeType::kRectangle, 600, 0, 700, 100);
  controller_.SelectObject(a, false);

  controller_.PointerDown(50, 50, NoMods());
  controller_.PointerMove(450, 450, NoMods());
  ASSERT_DOUBLE_EQ(scene_.Find(a)->x, 400);

  EXPECT_TRUE(controller_.Undo());
  EXPECT_EQ(controller_.state(), InteractionState::kIdle);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 0);
  controller_.PointerUp(450, 450, NoMods());
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 0);
  EXPECT_EQ(history_.Stats().undo_count, 2);
  EXPECT_EQ(history_.Stats().redo_count, 1);

  // Replaying history reaches the state the pointer left behind.
  EXPECT_TRUE(controller_.Redo());
  EXPECT_DOUBLE_EQ(scene_.Find(a)->x, 400);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->y, 400);
}

TEST_F(InteractionTest, RedoDuringResizeRecordsTheResize) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 300, 0, 400, 100);
  controller_.Undo();
  ASSERT_TRUE(history_.CanRedo());
  controller_.SelectObject(a, false);

  controller_.PointerDown(100, 100, NoMods());
  controller_.PointerMove(200, 150, NoMods());
  ASSERT_EQ(controller_.state(), InteractionState::kResizing);

  // The resize is pushed first, which empties the redo stack.
  EXPECT_FALSE(controller_.Redo());
  EXPECT_EQ(controller_.state(), InteractionState::kIdle);
  EXPECT_FALSE(scene_.Contains(b));
  EXPECT_EQ(history_.undo_stack().back().type, ActionType::kUpdateObject);
  EXPECT_DOUBLE_EQ(scene_.Find(a)->width, 200);

  controller_.Undo();
  EXPECT_DOUBLE_EQ(scene_.Find(a)->width, 100);
}

TEST_F(InteractionTest, UndoDuringDrawDropsThePreview) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  ShapeToolStyle style;
  controller_.SetTool(Tool::kShape, &style);
  controller_.PointerDown(300, 300, NoMods());
  controller_.PointerMove(400, 400, NoMods());

  EXPECT_TRUE(controller_.Undo());
  EXPECT_FALSE(controller_.preview().has_value());
  EXPECT_FALSE(scene_.Contains(id));
  controller_.PointerUp(400, 400, NoMods());
  EXPECT_TRUE(scene_.empty());
}

// ---------------------------------------------------------------------------
// Resizing
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, NorthWestResizeKeepsSouthEastCornerFixed) {
  std::string id = DrawShape(ShapeType::kRectangle, 100, 100, 200, 200);
  Drag(100, 100, 60, 40);
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->x, 60);
  EXPECT_DOUBLE_EQ(obj->y, 40);
  EXPECT_DOUBLE_EQ(obj->x + obj->width, 200);
  EXPECT_DOUBLE_EQ(obj->y + obj->height, 200);

  // Pushing past the opposite corner clamps at the minimum size.
  Drag(60, 40, 190, 190);
  obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->width, 50);
  EXPECT_DOUBLE_EQ(obj->height, 50);
  EXPECT_DOUBLE_EQ(obj->x, 150);
  EXPECT_DOUBLE_EQ(obj->y, 150);
}

TEST_F(InteractionTest, SouthEastResizeClampsAndUndoes) {
  std::string id = DrawShape(ShapeType::kRectangle, 100, 100, 300, 250);
  Drag(300, 250, 110, 110);
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->width, 50);
  EXPECT_DOUBLE_EQ(obj->height, 50);
  ASSERT_EQ(history_.undo_stack().back().type, ActionType::kUpdateObject);

  controller_.Undo();
  obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->width, 200);
  EXPECT_DOUBLE_EQ(obj->height, 150);
}

TEST_F(InteractionTest, LineEndpointHandleMovesOnlyThatEnd) {
  std::string id = DrawShape(ShapeType::kArrow, 0, 0, 100, 50);
  Drag(100, 50, 150, 120);
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->x, 0);
  EXPECT_DOUBLE_EQ(obj->y, 0);
  EXPECT_DOUBLE_EQ(obj->shape()->x2, 150);
  EXPECT_DOUBLE_EQ(obj->shape()->y2, 120);
}

TEST_F(InteractionTest, PaletteResizeScalesCells) {
  PaletteBody palette;
  palette.grid_cols = 3;
  palette.grid_rows = 2;
  palette.cell_size = 40;
  std::string id = controller_.AddColorPalette(0, 0, palette);
  ASSERT_FALSE(id.empty());
  ASSERT_DOUBLE_EQ(scene_.Find(id)->width, 120);

  Drag(120, 40, 240, 40);  // East handle.
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->palette()->cell_size, 80);
  EXPECT_DOUBLE_EQ(obj->width, 240);
  EXPECT_DOUBLE_EQ(obj->height, 160);
}

TEST_F(InteractionTest, PaletteNorthSouthHandlesKeepCells) {
  PaletteBody palette;
  palette.grid_cols = 3;
  palette.grid_rows = 2;
  palette.cell_size = 40;
  std::string id = controller_.AddColorPalette(0, 0, palette);
  int before = history_.Stats().undo_count;

  Drag(60, 80, 60, 200);  // South handle.
  const SceneObject* obj = scene_.Find(id);
  EXPECT_DOUBLE_EQ(obj->palette()->cell_size, 40);
  EXPECT_DOUBLE_EQ(obj->height, 80);
  EXPECT_DOUBLE_EQ(obj->y, 0);
  EXPECT_EQ(history_.Stats().undo_count, before);
}

TEST_F(InteractionTest, RotatedResizeKeepsOppositeCornerUnderPointer) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 200, 100);
  ASSERT_TRUE(controller_.UpdateObject(
      id, [](SceneObject* obj) { obj->rotation = 90.0; }));
  const SceneObject start = *scene_.Find(id);

  Point nw = ToWorld(start, Point{0, 0});
  Point se = ToWorld(start, Point{200, 100});
  EXPECT_NEAR(nw.x, 150, 1e-9);
  EXPECT_NEAR(nw.y, -50, 1e-9);
  EXPECT_NEAR(se.x, 50, 1e-9);
  EXPECT_NEAR(se.y, 150, 1e-9);

  // Pull the se handle 100 units further along both local axes.
  Point target = ToWorld(start, Point{300, 200});
  Drag(se.x, se.y, target.x, target.y);

  const SceneObject* obj = scene_.Find(id);
  EXPECT_NEAR(obj->width, 300, 1e-9);
  EXPECT_NEAR(obj->height, 200, 1e-9);
  EXPECT_DOUBLE_EQ(obj->rotation, 90.0);

  Point nw_after = ToWorld(*obj, Point{obj->x, obj->y});
  EXPECT_NEAR(nw_after.x, nw.x, 1e-9);
  EXPECT_NEAR(nw_after.y, nw.y, 1e-9);
  Point se_after =
      ToWorld(*obj, Point{obj->x + obj->width, obj->y + obj->height});
  EXPECT_NEAR(se_after.x, target.x, 1e-9);
  EXPECT_NEAR(se_after.y, target.y, 1e-9);

  controller_.Undo();
  EXPECT_DOUBLE_EQ(scene_.Find(id)->width, 200);
  EXPECT_DOUBLE_EQ(scene_.Find(id)->x, start.x);
}

// ---------------------------------------------------------------------------
// Rotation
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, RotationHandleRotatesAroundCentre) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  Drag(50, -30, 130, 50);
  EXPECT_NEAR(scene_.Find(id)->rotation, 90.0, 1e-9);
  EXPECT_EQ(history_.undo_stack().back().type, ActionType::kUpdateObject);

  EXPECT_TRUE(controller_.HandleKey(Key::kR, NoMods()));
  EXPECT_DOUBLE_EQ(scene_.Find(id)->rotation, 0.0);
  controller_.Undo();
  EXPECT_NEAR(scene_.Find(id)->rotation, 90.0, 1e-9);
}

TEST_F(InteractionTest, ResetRotationWithNothingRotated) {
  DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  int before = history_.Stats().undo_count;
  EXPECT_EQ(controller_.ResetRotation(), 0u);
  EXPECT_EQ(history_.Stats().undo_count, before);
}

// ---------------------------------------------------------------------------
// Keyboard
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, DeleteKeyRemovesSelection) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  EXPECT_TRUE(controller_.HandleKey(Key::kDelete, NoMods()));
  EXPECT_FALSE(scene_.Contains(id));
  EXPECT_TRUE(selection_.empty());
  EXPECT_FALSE(controller_.HandleKey(Key::kBackspace, NoMods()));
}

TEST_F(InteractionTest, UndoRedoShortcuts) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  EXPECT_FALSE(controller_.HandleKey(Key::kZ, NoMods()));

  EXPECT_TRUE(controller_.HandleKey(Key::kZ, Ctrl()));
  EXPECT_FALSE(scene_.Contains(id));

  Modifiers ctrl_shift = Ctrl();
  ctrl_shift.shift = true;
  EXPECT_TRUE(controller_.HandleKey(Key::kZ, ctrl_shift));
  EXPECT_TRUE(scene_.Contains(id));

  controller_.HandleKey(Key::kZ, Ctrl());
  EXPECT_TRUE(controller_.HandleKey(Key::kY, Ctrl()));
  EXPECT_TRUE(scene_.Contains(id));
}

TEST_F(InteractionTest, UndoDropsStaleSelection) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  ASSERT_TRUE(selection_.Contains(id));
  controller_.Undo();
  EXPECT_TRUE(selection_.empty());
}

TEST_F(InteractionTest, RKeyNeedsSelectionAndNoCommand) {
  EXPECT_FALSE(controller_.HandleKey(Key::kR, NoMods()));
  DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  EXPECT_FALSE(controller_.HandleKey(Key::kR, Ctrl()));
}

// ---------------------------------------------------------------------------
// Box selection
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, BoxSelectPicksIntersectingObjects) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  std::string c = DrawShape(ShapeType::kRectangle, 600, 600, 700, 700);
  controller_.ClearSelection();

  ASSERT_TRUE(controller_.BeginBoxSelection(50, 50));
  controller_.UpdateBoxSelection(250, 150);
  ASSERT_TRUE(controller_.box_selection_rect().has_value());
  EXPECT_EQ(controller_.EndBoxSelection(NoMods()), 2u);
  EXPECT_TRUE(selection_.Contains(a));
  EXPECT_TRUE(selection_.Contains(b));
  EXPECT_FALSE(selection_.Contains(c));
  EXPECT_FALSE(controller_.box_selection_rect().has_value());
}

TEST_F(InteractionTest, TinyBoxSelectionIsIgnored) {
  DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  controller_.ClearSelection();
  controller_.BeginBoxSelection(10, 10);
  controller_.UpdateBoxSelection(14, 60);
  EXPECT_EQ(controller_.EndBoxSelection(NoMods()), 0u);
  EXPECT_TRUE(selection_.empty());
}

TEST_F(InteractionTest, BoxSelectionWithShiftAdds) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  controller_.SelectObject(a, false);
  controller_.BeginBoxSelection(190, -10);
  controller_.UpdateBoxSelection(320, 120);
  controller_.EndBoxSelection(Shift());
  EXPECT_EQ(selection_.size(), 2u);
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, DeleteSelectedIsOneUndoableAction) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  std::string c = DrawShape(ShapeType::kCircle, 400, 0, 500, 100);
  controller_.SelectAll();
  int z_b = scene_.Find(b)->z_index;

  EXPECT_EQ(controller_.DeleteSelected(), 3u);
  EXPECT_TRUE(scene_.empty());

  controller_.Undo();
  EXPECT_EQ(scene_.size(), 3u);
  EXPECT_EQ(scene_.Find(b)->z_index, z_b);
}

TEST_F(InteractionTest, UpdateObjectClampsAndRecords) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  EXPECT_TRUE(controller_.UpdateObject(
      id, [](SceneObject* obj) { obj->width = 10; }));
  EXPECT_DOUBLE_EQ(scene_.Find(id)->width, 50);
  EXPECT_FALSE(controller_.UpdateObject(
      id, [](SceneObject* obj) { obj->width = 20; }));
  EXPECT_FALSE(controller_.UpdateObject("missing", [](SceneObject*) {}));
}

TEST_F(InteractionTest, HidingDeselectsAndDisablesHitTesting) {
  std::string id = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  EXPECT_TRUE(controller_.SetVisibility(id, false));
  EXPECT_TRUE(selection_.empty());
  EXPECT_EQ(scene_.FindAtPoint(50, 50), nullptr);
  controller_.Undo();
  EXPECT_TRUE(scene_.Find(id)->visible);
}

TEST_F(InteractionTest, LayerCommands) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 150, 150, 50, 50);
  EXPECT_EQ(scene_.FindAtPoint(75, 75)->id, b);

  EXPECT_TRUE(controller_.BringToFront(a));
  EXPECT_EQ(scene_.FindAtPoint(75, 75)->id, a);
  EXPECT_FALSE(controller_.BringToFront(a));

  EXPECT_TRUE(controller_.SendToBack(a));
  EXPECT_EQ(scene_.FindAtPoint(75, 75)->id, b);
  EXPECT_FALSE(controller_.SendToBack(a));

  EXPECT_TRUE(controller_.MoveLayer(a, 1));
  EXPECT_EQ(scene_.FindAtPoint(75, 75)->id, a);
  EXPECT_FALSE(controller_.MoveLayer(a, 1));

  controller_.Undo();
  EXPECT_EQ(scene_.FindAtPoint(75, 75)->id, b);
  EXPECT_EQ(history_.undo_stack().back().type, ActionType::kReorderLayers);
}

TEST_F(InteractionTest, BringToFrontClearsExternalLayers) {
  std::string a = DrawShape(ShapeType::kRectangle, 0, 0, 100, 100);
  std::string b = DrawShape(ShapeType::kRectangle, 200, 0, 300, 100);
  scene_.SetExternalZProvider([]() -> std::optional<int> { return 10; });

  EXPECT_TRUE(controller_.BringToFront(b));
  EXPECT_EQ(scene_.Find(b)->z_index, 11);
  EXPECT_FALSE(controller_.BringToFront(b));
  EXPECT_TRUE(controller_.BringToFront(a));
  EXPECT_EQ(scene_.Find(a)->z_index, 12);
}

TEST_F(InteractionTest, AddTextCreatesDefaultBox) {
  std::string id = controller_.AddText(10, 20);
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->width, 300);
  EXPECT_DOUBLE_EQ(obj->height, 100);
  EXPECT_TRUE(selection_.Contains(id));
  EXPECT_EQ(history_.Stats().undo_count, 1);
}

TEST_F(InteractionTest, AddColorPaletteValidatesGrid) {
  PaletteBody palette;
  palette.grid_cols = 0;
  EXPECT_TRUE(controller_.AddColorPalette(0, 0, palette).empty());

  palette.grid_cols = 2;
  palette.grid_rows = 1;
  palette.cell_size = 5;
  palette.has_wide_cell = true;
  std::string id = controller_.AddColorPalette(0, 0, palette);
  const SceneObject* obj = scene_.Find(id);
  ASSERT_NE(obj, nullptr);
  EXPECT_DOUBLE_EQ(obj->palette()->cell_size, 20);
  EXPECT_DOUBLE_EQ(obj->width, 40);
  EXPECT_DOUBLE_EQ(obj->height, 40);
}

// ---------------------------------------------------------------------------
// Inline text editing
// ---------------------------------------------------------------------------

TEST_F(InteractionTest, DoubleClickOpensSurface) {
  std::string id = controller_.AddText(0, 0);
  EXPECT_FALSE(controller_.DoubleClick(500, 500));
  ASSERT_TRUE(controller_.DoubleClick(20, 20));
  EXPECT_TRUE(controller_.is_editing_text());
  EXPECT_EQ(controller_.editing_id(), id);
  EXPECT_TRUE(surface_.is_open());
  EXPECT_EQ(surface_.object_id(), id);
  EXPECT_TRUE(scene_.Find(id)->text()->is_editing);
  EXPECT_DOUBLE_EQ(surface_.rect().width, 300);
}

TEST_F(InteractionTest, TypingMergesIntoOneRunAndCommitsOnce) {
  std::string id = controller_.AddText(0, 0);
  ASSERT_TRUE(controller_.StartTextEdit(id));
  surface_.Insert("a");
  surface_.Insert("b");
  surface_.Insert("c");
  EXPECT_EQ(history_.Stats().undo_count, 1);  // Nothing pushed mid-edit.

  EXPECT_TRUE(controller_.HandleKey(Key::kEscape, NoMods()));
  EXPECT_FALSE(controller_.is_editing_text());
  EXPECT_FALSE(surface_.is_open());

  const SceneObject* obj = scene_.Find(id);
  ASSERT_EQ(obj->text()->content.size(), 1u);
  EXPECT_EQ(obj->text()->content[0].text, "Double-click to editabc");
  EXPECT_FALSE(obj->text()->is_editing);
  ASSERT_EQ(history_.Stats().undo_count, 2);

  const auto& update =
      std::get<UpdateObjectData>(history_.undo_stack().back().data);
  EXPECT_FALSE(update.changes[0].before.text()->is_editing);
  EXPECT_FALSE(update.changes[0].after.text()->is_editing);
}

TEST_F(InteractionTest, KeysOtherThanEscapeGoToTheSurface) {
  std::string id = controller_.AddText(0, 0);
  controller_.StartTextEdit(id);
  EXPECT_FALSE(controller_.HandleKey(Key::kDelete, NoMods()));
  EXPECT_TRUE(scene_.Contains(id));
}

TEST_F(InteractionTest, UndoCommitsOpenEditFirst) {
  std::string id = controller_.AddText(0, 0);
  controller_.StartTextEdit(id);
  surface_.SetCaret(0);
  surface_.Insert("x");

  EXPECT_TRUE(controller_.Undo());
  EXPECT_FALSE(controller_.is_editing_text());
  EXPECT_EQ(PlainText(scene_.Find(id)->text()->content),
            InteractionController::kDefaultTextContent);
  EXPECT_TRUE(history_.CanRedo());

  controller_.Redo();
  EXPECT_EQ(PlainText(scene_.Find(id)->text()->content),
            "xDouble-click to edit");
}

TEST_F(InteractionTest, EditingAnotherTextCommitsTheFirst) {
  std::string a = controller_.AddText(0, 0);
  std::string b = controller_.AddText(0, 400);
  ASSERT_TRUE(controller_.DoubleClick(20, 20));
  surface_.Insert("!");

  ASSERT_TRUE(controller_.DoubleClick(20, 420));
  EXPECT_EQ(controller_.editing_id(), b);
  EXPECT_EQ(surface_.object_id(), b);
  EXPECT_FALSE(scene_.Find(a)->text()->is_editing);
  EXPECT_TRUE(scene_.Find(b)->text()->is_editing);
  EXPECT_EQ(PlainText(scene_.Find(a)->text()->content),
            "Double-click to edit!");
  EXPECT_EQ(history_.Stats().undo_count, 3);
  ASSERT_TRUE(selection_.IsSingle());
  EXPECT_EQ(*selection_.primary(), b);
}

TEST_F(InteractionTest, UnchangedEditPushesNothing) {
  std::string id = controller_.AddText(0, 0);
  controller_.StartTextEdit(id);
  controller_.CommitTextEdit();
  EXPECT_EQ(history_.Stats().undo_count, 1);
}

TEST_F(InteractionTest, ClickingOutsideCommitsEdit) {
  std::string id = controller_.AddText(0, 0);
  controller_.StartTextEdit(id);
  surface_.Insert("!");
  controller_.PointerDown(20, 20, NoMods());  // Inside: edit stays open.
  EXPECT_TRUE(controller_.is_editing_text());
  controller_.PointerDown(900, 900, NoMods());
  EXPECT_FALSE(controller_.is_editing_text());
  EXPECT_EQ(history_.Stats().undo_count, 2);
}

TEST_F(InteractionTest, ViewportChangeRepositionsSurface) {
  std::string id = controller_.AddText(100, 100);
  controller_.StartTextEdit(id);
  viewport_.SetZoom(2.0);
  controller_.OnViewportChanged();
  EXPECT_DOUBLE_EQ(surface_.rect().scale, 2.0);
  EXPECT_DOUBLE_EQ(surface_.rect().width, 600);
  EXPECT_TRUE(controller_.is_editing_text());
}

TEST_F(InteractionTest, DeletingEditedObjectClosesSurface) {
  std::string id = controller_.AddText(0, 0);
  controller_.StartTextEdit(id);
  scene_.Remove({id});
  EXPECT_FALSE(controller_.is_editing_text());
  EXPECT_FALSE(surface_.is_open());
}

TEST_F(InteractionTest, StateNames) {
  EXPECT_STREQ(InteractionStateName(InteractionState::kIdle), "idle");
  EXPECT_STREQ(InteractionStateName(InteractionState::kBoxSelecting),
               "box_selecting");
}
