// Copyright 2026 The boardkit Authors
// Tests for: ScenePainter draw order, selection chrome, rotation nesting,
//            inline-edit glyph suppression

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "interaction/selection_manager.h"
#include "render/render_adapter.h"
#include "render/scene_painter.h"
#include "scene/scene_model.h"

using namespace boardkit::internal;

// ---------------------------------------------------------------------------
// Helper: adapter that records every call as a short string
// ---------------------------------------------------------------------------

class RecordingAdapter : public RenderAdapter {
 public:
  bool BeginFrame(const Viewport& viewport) override {
    calls.push_back("begin");
    zoom = viewport.zoom();
    return begin_result;
  }
  void EndFrame() override { calls.push_back("end"); }
  void PushRotation(const Point& /*pivot*/, double degrees) override {
    calls.push_back("push:" + std::to_string(static_cast<int>(degrees)));
  }
  void PopRotation() override { calls.push_back("pop"); }
  void DrawGrid(double /*grid_size*/) override { calls.push_back("grid"); }
  void DrawShape(const SceneObject& obj, const ShapeBody&) override {
    calls.push_back("shape:" + obj.id);
  }
  void DrawTextBox(const SceneObject& obj, const TextBody&,
                   bool draw_glyphs) override {
    calls.push_back("text:" + obj.id + (draw_glyphs ? "" : ":box"));
  }
  void DrawPalette(const SceneObject& obj, const PaletteBody&) override {
    calls.push_back("palette:" + obj.id);
  }
  void DrawSelectionBox(const Rect&) override { calls.push_back("selbox"); }
  void DrawResizeHandle(const Point&, double radius) override {
    calls.push_back("handle");
    handle_radius = radius;
  }
  void DrawRotationHandle(const Point&, const Point&, double) override {
    calls.push_back("rothandle");
  }
  void DrawSnapGuide(const SnapGuide&) override { calls.push_back("guide"); }
  void DrawBoxSelection(const Rect&) override { calls.push_back("boxsel"); }

  int Count(const std::string& call) const {
    int n = 0;
    for (const std::string& c : calls) n += c == call ? 1 : 0;
    return n;
  }

  std::vector<std::string> calls;
  bool begin_result = true;
  double zoom = 0.0;
  double handle_radius = 0.0;
};

namespace {

SceneObject Box(const std::string& id, int z) {
  SceneObject obj;
  obj.id = id;
  obj.width = 100;
  obj.height = 100;
  obj.z_index = z;
  obj.body = ShapeBody{};
  return obj;
}

}  // namespace

class ScenePainterTest : public ::testing::Test {
 protected:
  PaintFrame Frame() {
    PaintFrame frame;
    frame.scene = &scene_;
    frame.selection = &selection_;
    frame.viewport = &viewport_;
    return frame;
  }

  SceneModel scene_;
  SelectionManager selection_;
  Viewport viewport_;
  RecordingAdapter adapter_;
  ScenePainter painter_{&adapter_};
};

// ---------------------------------------------------------------------------
// Frame structure
// ---------------------------------------------------------------------------

TEST_F(ScenePainterTest, EmptyFrame) {
  ASSERT_TRUE(painter_.Paint(Frame()));
  EXPECT_EQ(adapter_.calls, (std::vector<std::string>{"begin", "end"}));
}

TEST_F(ScenePainterTest, ObjectsInZOrder) {
  scene_.Insert(Box("top", 5));
  scene_.Insert(Box("bottom", 1));
  scene_.Insert(Box("middle", 3));
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.calls,
            (std::vector<std::string>{"begin", "shape:bottom", "shape:middle",
                                      "shape:top", "end"}));
}

TEST_F(ScenePainterTest, HiddenObjectsAreSkipped) {
  SceneObject hidden = Box("hidden", 0);
  hidden.visible = false;
  scene_.Insert(hidden);
  selection_.Select("hidden", false);
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.Count("shape:hidden"), 0);
  EXPECT_EQ(adapter_.Count("selbox"), 0);
}

TEST_F(ScenePainterTest, GridComesFirst) {
  scene_.Insert(Box("a", 0));
  PaintFrame frame = Frame();
  frame.show_grid = true;
  painter_.Paint(frame);
  ASSERT_GE(adapter_.calls.size(), 3u);
  EXPECT_EQ(adapter_.calls[1], "grid");
}

TEST_F(ScenePainterTest, FailedBeginDrawsNothing) {
  scene_.Insert(Box("a", 0));
  adapter_.begin_result = false;
  EXPECT_FALSE(painter_.Paint(Frame()));
  EXPECT_EQ(adapter_.calls, std::vector<std::string>{"begin"});
}

TEST_F(ScenePainterTest, MissingSceneFails) {
  PaintFrame frame = Frame();
  frame.scene = nullptr;
  EXPECT_FALSE(painter_.Paint(frame));
  EXPECT_TRUE(adapter_.calls.empty());
}

TEST_F(ScenePainterTest, OverlaysFollowObjects) {
  scene_.Insert(Box("a", 0));
  SceneObject preview = Box("preview", 0);
  PaintFrame frame = Frame();
  frame.preview = &preview;
  frame.snap_guides.push_back(SnapGuide());
  frame.box_selection = Rect{0, 0, 10, 10};
  painter_.Paint(frame);
  EXPECT_EQ(adapter_.calls,
            (std::vector<std::string>{"begin", "shape:a", "shape:preview",
                                      "guide", "boxsel", "end"}));
}

// ---------------------------------------------------------------------------
// Selection chrome
// ---------------------------------------------------------------------------

TEST_F(ScenePainterTest, SingleSelectionGetsHandles) {
  scene_.Insert(Box("a", 0));
  selection_.Select("a", false);
  viewport_.SetZoom(2.0);
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.Count("selbox"), 1);
  EXPECT_EQ(adapter_.Count("handle"), 8);
  EXPECT_EQ(adapter_.Count("rothandle"), 1);
  EXPECT_DOUBLE_EQ(adapter_.zoom, 2.0);
  EXPECT_DOUBLE_EQ(adapter_.handle_radius, 4.0);
}

TEST_F(ScenePainterTest, MultiSelectionHasNoResizeHandles) {
  scene_.Insert(Box("a", 0));
  scene_.Insert(Box("b", 1));
  selection_.Apply({"a", "b"}, SelectionManager::Mode::kReplace);
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.Count("selbox"), 2);
  EXPECT_EQ(adapter_.Count("handle"), 0);
  EXPECT_EQ(adapter_.Count("rothandle"), 2);
}

TEST_F(ScenePainterTest, LineSelectionShowsEndpointsOnly) {
  SceneObject line;
  line.id = "line";
  ShapeBody shape;
  shape.shape_type = ShapeType::kLine;
  shape.x2 = 100;
  shape.y2 = 0;
  line.body = shape;
  scene_.Insert(line);
  selection_.Select("line", false);
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.Count("selbox"), 0);
  EXPECT_EQ(adapter_.Count("handle"), 2);
}

TEST_F(ScenePainterTest, RotatedObjectIsWrapped) {
  SceneObject obj = Box("a", 0);
  obj.rotation = 45;
  scene_.Insert(obj);
  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.calls,
            (std::vector<std::string>{"begin", "push:45", "shape:a", "pop",
                                      "end"}));
}

// ---------------------------------------------------------------------------
// Text and palettes
// ---------------------------------------------------------------------------

TEST_F(ScenePainterTest, EditedTextDrawsBoxOnly) {
  SceneObject text;
  text.id = "t";
  text.width = 300;
  text.height = 100;
  TextBody body;
  body.content.push_back(TextRun{"hello", TextStyle()});
  body.is_editing = true;
  text.body = body;
  scene_.Insert(text);

  SceneObject palette;
  palette.id = "p";
  palette.body = PaletteBody{};
  scene_.Insert(palette);

  painter_.Paint(Frame());
  EXPECT_EQ(adapter_.Count("text:t:box"), 1);
  EXPECT_EQ(adapter_.Count("text:t"), 0);
  EXPECT_EQ(adapter_.Count("palette:p"), 1);
}

TEST(RenderAdapterFactoryTest, NullOrUsableAdapter) {
  std::vector<uint8_t> pixels(64 * 64 * 4);
  std::unique_ptr<RenderAdapter> adapter =
      CreateBufferRenderAdapter(pixels.data(), 64, 64, 64 * 4);
  if (!adapter) GTEST_SKIP() << "Built without a raster back-end";
  Viewport viewport;
  EXPECT_TRUE(adapter->BeginFrame(viewport));
  adapter->EndFrame();
}
