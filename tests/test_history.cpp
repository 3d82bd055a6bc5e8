// Copyright 2026 The boardkit Authors
// Tests for: HistoryManager push/undo/redo/truncation, action validation,
//            every action type in both directions

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "gtest/gtest.h"

#include "history/history_action.h"
#include "history/history_manager.h"
#include "scene/scene_model.h"

using namespace boardkit::internal;

namespace {

SceneObject Box(const std::string& id, double x, double y, int z = 0) {
  SceneObject obj;
  obj.id = id;
  obj.x = x;
  obj.y = y;
  obj.width = 100;
  obj.height = 100;
  obj.z_index = z;
  obj.body = ShapeBody{};
  return obj;
}

SceneObject Line(const std::string& id) {
  SceneObject obj;
  obj.id = id;
  obj.x = 0;
  obj.y = 0;
  ShapeBody shape;
  shape.shape_type = ShapeType::kArrow;
  shape.x2 = 100;
  shape.y2 = 50;
  obj.body = shape;
  return obj;
}

}  // namespace

class HistoryTest : public ::testing::Test {
 protected:
  // Apply an add to the scene and record it, as the controller does.
  void AddAndRecord(const SceneObject& obj) {
    scene_.Insert(obj);
    history_.Push(MakeAddObjectAction(obj));
  }

  SceneModel scene_;
  HistoryManager history_{&scene_};
};

// ---------------------------------------------------------------------------
// Stack behaviour
// ---------------------------------------------------------------------------

TEST_F(HistoryTest, EmptyHistory) {
  EXPECT_FALSE(history_.CanUndo());
  EXPECT_FALSE(history_.CanRedo());
  EXPECT_FALSE(history_.Undo());
  EXPECT_FALSE(history_.Redo());
  EXPECT_EQ(history_.Stats().max_history, 50);
}

TEST_F(HistoryTest, PushStampsTimestamp) {
  AddAndRecord(Box("a", 0, 0));
  ASSERT_EQ(history_.undo_stack().size(), 1u);
  EXPECT_GT(history_.undo_stack().back().timestamp, 0);
}

TEST_F(HistoryTest, TruncatesToMaxHistoryKeepingNewest) {
  for (int i = 0; i < 55; ++i) AddAndRecord(Box("o" + std::to_string(i), i, 0));
  ASSERT_EQ(history_.undo_stack().size(), 50u);
  const auto& oldest =
      std::get<AddObjectData>(history_.undo_stack().front().data);
  const auto& newest =
      std::get<AddObjectData>(history_.undo_stack().back().data);
  EXPECT_EQ(oldest.object.id, "o5");
  EXPECT_EQ(newest.object.id, "o54");
}

TEST_F(HistoryTest, LoweringMaxHistoryDropsOldest) {
  for (int i = 0; i < 10; ++i) AddAndRecord(Box("o" + std::to_string(i), i, 0));
  history_.SetMaxHistory(3);
  EXPECT_EQ(history_.Stats().undo_count, 3);
  history_.SetMaxHistory(0);
  EXPECT_EQ(history_.max_history(), 1);
}

TEST_F(HistoryTest, PushAfterUndoClearsRedo) {
  AddAndRecord(Box("a", 0, 0));
  ASSERT_TRUE(history_.Undo());
  EXPECT_TRUE(history_.CanRedo());
  AddAndRecord(Box("b", 0, 0));
  EXPECT_FALSE(history_.CanRedo());
}

TEST_F(HistoryTest, UndoRedoNeverPush) {
  AddAndRecord(Box("a", 0, 0));
  AddAndRecord(Box("b", 0, 0));
  history_.Undo();
  history_.Undo();
  EXPECT_EQ(history_.Stats().undo_count, 0);
  EXPECT_EQ(history_.Stats().redo_count, 2);
  history_.Redo();
  EXPECT_EQ(history_.Stats().undo_count, 1);
  EXPECT_EQ(history_.Stats().redo_count, 1);
}

TEST_F(HistoryTest, PushDuringApplyIsIgnored) {
  class Reentrant : public SceneListener {
   public:
    explicit Reentrant(HistoryManager* h) : history(h) {}
    void OnObjectsChanged() override {
      accepted |= history->Push(MakeAddObjectAction(Box("echo", 0, 0)));
    }
    HistoryManager* history;
    bool accepted = false;
  };

  AddAndRecord(Box("a", 0, 0));
  Reentrant listener(&history_);
  scene_.AddListener(&listener);
  history_.Undo();
  scene_.RemoveListener(&listener);
  EXPECT_FALSE(listener.accepted);
  EXPECT_EQ(history_.Stats().undo_count, 0);
}

TEST_F(HistoryTest, ClearEmptiesBothStacks) {
  AddAndRecord(Box("a", 0, 0));
  AddAndRecord(Box("b", 0, 0));
  history_.Undo();
  history_.Clear();
  EXPECT_FALSE(history_.CanUndo());
  EXPECT_FALSE(history_.CanRedo());
}

// ---------------------------------------------------------------------------
// Action types
// ---------------------------------------------------------------------------

TEST_F(HistoryTest, AddObjectRoundTrip) {
  AddAndRecord(Box("a", 10, 20, 4));
  history_.Undo();
  EXPECT_FALSE(scene_.Contains("a"));
  history_.Redo();
  ASSERT_TRUE(scene_.Contains("a"));
  EXPECT_EQ(scene_.Find("a")->z_index, 4);
  EXPECT_EQ(history_.last_affected_ids(), std::vector<std::string>{"a"});
}

TEST_F(HistoryTest, DeleteThreeObjectsRestoresIdsAndZ) {
  scene_.Insert(Box("a", 0, 0, 1));
  scene_.Insert(Box("b", 200, 0, 2));
  scene_.Insert(Box("c", 400, 0, 3));
  std::vector<SceneObject> snapshots = {*scene_.Find("a"), *scene_.Find("b"),
                                        *scene_.Find("c")};
  scene_.Remove({"a", "b", "c"});
  ASSERT_TRUE(history_.Push(MakeDeleteObjectsAction(snapshots)));
  EXPECT_EQ(history_.Stats().undo_count, 1);

  ASSERT_TRUE(history_.Undo());
  ASSERT_EQ(scene_.size(), 3u);
  EXPECT_EQ(scene_.Find("a")->z_index, 1);
  EXPECT_EQ(scene_.Find("b")->z_index, 2);
  EXPECT_EQ(scene_.Find("c")->z_index, 3);
  EXPECT_EQ(scene_.FindAtPoint(250, 50)->id, "b");

  history_.Redo();
  EXPECT_EQ(scene_.size(), 0u);
}

TEST_F(HistoryTest, UpdateObjectRestoresSnapshots) {
  scene_.Insert(Box("a", 0, 0));
  SceneObject before = *scene_.Find("a");
  SceneObject after = before;
  after.width = 300;
  after.rotation = 45;
  scene_.Replace(after);
  history_.Push(MakeUpdateObjectAction({ObjectChange{"a", before, after}}));

  history_.Undo();
  EXPECT_EQ(*scene_.Find("a"), before);
  history_.Redo();
  EXPECT_EQ(*scene_.Find("a"), after);
}

TEST_F(HistoryTest, UpdateOfDeletedObjectIsSkipped) {
  scene_.Insert(Box("a", 0, 0));
  SceneObject before = *scene_.Find("a");
  SceneObject after = before;
  after.x = 50;
  history_.Push(MakeUpdateObjectAction({ObjectChange{"a", before, after}}));
  scene_.Remove({"a"});
  EXPECT_TRUE(history_.Undo());
  EXPECT_FALSE(scene_.Contains("a"));
}

TEST_F(HistoryTest, MoveMultipleMovesLineEndpoints) {
  scene_.Insert(Box("box", 0, 0));
  scene_.Insert(Line("arrow"));
  MoveItem box_item{"box", 0, 0, 30, 40, std::nullopt, std::nullopt};
  MoveItem line_item{"arrow", 0, 0, 30, 40, Point{100, 50}, Point{130, 90}};
  scene_.Find("box")->x = 30;
  scene_.Find("box")->y = 40;
  history_.Push(MakeMoveMultipleAction({box_item, line_item}));

  history_.Undo();
  EXPECT_DOUBLE_EQ(scene_.Find("box")->x, 0);
  EXPECT_DOUBLE_EQ(scene_.Find("arrow")->shape()->x2, 100);

  history_.Redo();
  const SceneObject* arrow = scene_.Find("arrow");
  EXPECT_DOUBLE_EQ(arrow->x, 30);
  EXPECT_DOUBLE_EQ(arrow->y, 40);
  EXPECT_DOUBLE_EQ(arrow->shape()->x2, 130);
  EXPECT_DOUBLE_EQ(arrow->shape()->y2, 90);
}

TEST_F(HistoryTest, ReorderLayersRestoresZMap) {
  scene_.Insert(Box("a", 0, 0, 0));
  scene_.Insert(Box("b", 0, 0, 1));
  ZOrderMap before = scene_.CaptureZOrder();
  ZOrderMap after = {{"a", 2}, {"b", 1}};
  scene_.ApplyZOrder(after);
  history_.Push(MakeReorderLayersAction(before, after));

  EXPECT_EQ(scene_.FindAtPoint(50, 50)->id, "a");
  history_.Undo();
  EXPECT_EQ(scene_.FindAtPoint(50, 50)->id, "b");
  history_.Redo();
  EXPECT_EQ(scene_.FindAtPoint(50, 50)->id, "a");
}

// ---------------------------------------------------------------------------
// Malformed actions
// ---------------------------------------------------------------------------

TEST(ActionValidationTest, MismatchedTypeThrows) {
  Action action = MakeAddObjectAction(Box("a", 0, 0));
  action.type = ActionType::kReorderLayers;
  EXPECT_THROW(ValidateAction(action), std::invalid_argument);
}

TEST(ActionValidationTest, EmptyPayloadsThrow) {
  EXPECT_THROW(ValidateAction(MakeDeleteObjectsAction({})),
               std::invalid_argument);
  EXPECT_THROW(ValidateAction(MakeUpdateObjectAction({})),
               std::invalid_argument);
  EXPECT_THROW(ValidateAction(MakeMoveMultipleAction({})),
               std::invalid_argument);
  EXPECT_THROW(ValidateAction(MakeReorderLayersAction({}, {})),
               std::invalid_argument);
  EXPECT_THROW(ValidateAction(MakeAddObjectAction(SceneObject())),
               std::invalid_argument);
}

TEST(ActionValidationTest, UpdateSnapshotsMustMatchId) {
  ObjectChange change{"a", Box("a", 0, 0), Box("b", 0, 0)};
  EXPECT_THROW(ValidateAction(MakeUpdateObjectAction({change})),
               std::invalid_argument);
}

TEST(ActionValidationTest, HalfEndpointThrows) {
  MoveItem item{"a", 0, 0, 1, 1, Point{0, 0}, std::nullopt};
  EXPECT_THROW(ValidateAction(MakeMoveMultipleAction({item})),
               std::invalid_argument);
}

TEST_F(HistoryTest, MalformedPushIsDiscarded) {
  EXPECT_FALSE(history_.Push(MakeDeleteObjectsAction({})));
  EXPECT_FALSE(history_.CanUndo());
}

TEST(ActionTypeTest, Names) {
  EXPECT_STREQ(ActionTypeName(ActionType::kAddObject), "add_object");
  EXPECT_STREQ(ActionTypeName(ActionType::kDeleteObjects), "delete_objects");
  EXPECT_STREQ(ActionTypeName(ActionType::kUpdateObject), "update_object");
  EXPECT_STREQ(ActionTypeName(ActionType::kMoveMultiple), "move_multiple");
  EXPECT_STREQ(ActionTypeName(ActionType::kReorderLayers), "reorder_layers");
}
