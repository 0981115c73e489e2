// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for drawing new curves with the pen tool.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tools/pen-tool.h"

#include <memory>
#include <vector>
#include <gtest/gtest.h>

#include "preferences.h"
#include "test-utils.h"

using namespace Sketchpath;
using Sketchpath::UI::Tools::PenTool;

class PenToolTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        host.tool = ToolType::PEN;
        pen = std::make_unique<PenTool>(host, prefs);
    }

    void click(Geom::Point const &p, unsigned modifiers = 0)
    {
        pen->root_handler(press(p, 1, modifiers));
        pen->root_handler(release(p, modifiers));
    }

    std::optional<BezierShape> stored() const
    {
        auto const id = pen->shapeId();
        if (!id) {
            return {};
        }
        return host.store.getAs<BezierShape>(*id);
    }

    static std::vector<Geom::Point> page_anchors(BezierShape const &shape)
    {
        std::vector<Geom::Point> result;
        for (auto const &point : shape.points) {
            result.push_back(point.position + shape.position);
        }
        return result;
    }

    TestCanvasHost host;
    Preferences prefs;
    std::unique_ptr<PenTool> pen;
};

TEST_F(PenToolTest, ClicksPlaceCornerPoints)
{
    EXPECT_EQ(pen->state(), PenTool::IDLE);
    click({0, 0});
    EXPECT_EQ(pen->state(), PenTool::CREATING);
    click({50, 0});
    click({50, 50});

    auto const shape = stored();
    ASSERT_TRUE(shape);
    EXPECT_TRUE(shape->edit_mode);
    EXPECT_EQ(page_anchors(*shape), (std::vector<Geom::Point>{{0, 0}, {50, 0}, {50, 50}}));

    EXPECT_TRUE(pen->root_handler(key(GDK_KEY_Return)));
    EXPECT_EQ(pen->state(), PenTool::COMMITTED);

    auto const committed = stored();
    ASSERT_TRUE(committed);
    EXPECT_FALSE(committed->closed);
    EXPECT_FALSE(committed->edit_mode);
    EXPECT_EQ(to_path_commands(*committed),
              (std::vector<PathCommand>{MoveTo{{0, 0}}, LineTo{{50, 0}}, LineTo{{50, 50}}}));
    EXPECT_EQ(host.tool, ToolType::SELECT);
    EXPECT_EQ(host.selected, pen->shapeId());
}

TEST_F(PenToolTest, ClickOnStartClosesCurve)
{
    std::optional<ShapeId> finished;
    pen->signal_finished().connect([&](ShapeId id) { finished = id; });

    click({0, 0});
    click({50, 0});
    click({50, 50});
    click({4, 3});

    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
    auto const shape = stored();
    ASSERT_TRUE(shape);
    EXPECT_TRUE(shape->closed);
    EXPECT_EQ(shape->points.size(), 3u);
    auto const commands = to_path_commands(*shape);
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[3], PathCommand(LineTo{{0, 0}}));
    EXPECT_EQ(commands[4], PathCommand(ClosePath{}));
    EXPECT_EQ(finished, pen->shapeId());
}

TEST_F(PenToolTest, CloseThresholdScalesWithZoom)
{
    host.setZoom(4.0);
    click({0, 0});
    click({50, 0});
    click({50, 50});

    // 4 document units is 16 screen pixels here
    click({4, 0});
    EXPECT_EQ(pen->state(), PenTool::CREATING);
    EXPECT_EQ(pen->points().size(), 4u);

    click({1, 1});
    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
    EXPECT_TRUE(stored()->closed);
}

TEST_F(PenToolTest, StartPointNeedsThreeAnchorsToClose)
{
    click({0, 0});
    click({50, 0});
    click({2, 0});
    EXPECT_EQ(pen->state(), PenTool::CREATING);
    EXPECT_EQ(pen->points().size(), 3u);
}

TEST_F(PenToolTest, SnapToStartHasHysteresis)
{
    click({0, 0});
    click({100, 0});
    click({100, 100});

    pen->root_handler(motion({40, 40}));
    EXPECT_FALSE(pen->snappedToStart());
    auto preview = pen->previewSegment();
    ASSERT_TRUE(preview);
    EXPECT_EQ(preview->finalPoint(), Geom::Point(40, 40));

    pen->root_handler(motion({11, 0}));
    EXPECT_TRUE(pen->snappedToStart());
    preview = pen->previewSegment();
    ASSERT_TRUE(preview);
    EXPECT_EQ(preview->initialPoint(), Geom::Point(100, 100));
    EXPECT_EQ(preview->finalPoint(), Geom::Point(0, 0));

    // the snap holds until the pointer leaves the release radius around where it engaged
    pen->root_handler(motion({16, 0}));
    EXPECT_TRUE(pen->snappedToStart());
    pen->root_handler(motion({26, 0}));
    EXPECT_TRUE(pen->snappedToStart());
    pen->root_handler(motion({27, 0}));
    EXPECT_FALSE(pen->snappedToStart());

    // a snapped press closes even outside the plain close radius
    pen->root_handler(motion({11, 0}));
    click({11, 0});
    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
    EXPECT_TRUE(stored()->closed);
}

TEST_F(PenToolTest, DragPullsSymmetricHandles)
{
    click({0, 0});
    pen->root_handler(press({100, 100}));
    pen->root_handler(motion({130, 110}));
    pen->root_handler(release({130, 110}));

    auto const &point = pen->points().back();
    ASSERT_TRUE(point.out_handle);
    ASSERT_TRUE(point.in_handle);
    EXPECT_TRUE(PointIsNear(*point.out_handle, {130, 110}));
    EXPECT_TRUE(PointIsNear(*point.in_handle, {70, 90}));

    auto const shape = stored();
    ASSERT_TRUE(shape);
    EXPECT_EQ(segment_type(shape->points[0], shape->points[1]), UI::SEGMENT_QUADRATIC_BEZIER);
}

TEST_F(PenToolTest, AltDragSetsOutgoingHandleOnly)
{
    click({0, 0});
    pen->root_handler(press({100, 100}));
    pen->root_handler(motion({130, 110}, GDK_ALT_MASK));

    auto const &point = pen->points().back();
    EXPECT_TRUE(point.out_handle);
    EXPECT_FALSE(point.in_handle);
}

TEST_F(PenToolTest, SnapReleaseIsMeasuredFromEngagePoint)
{
    click({0, 0});
    click({100, 0});
    click({100, 100});

    pen->root_handler(motion({0, 11}));
    ASSERT_TRUE(pen->snappedToStart());

    // close to the start anchor but farther than the release radius from the engage point
    pen->root_handler(motion({-4, -5}));
    EXPECT_FALSE(pen->snappedToStart());

    pen->root_handler(motion({0, 11}));
    ASSERT_TRUE(pen->snappedToStart());
    pen->root_handler(motion({-4, 0}));
    EXPECT_TRUE(pen->snappedToStart());
}

TEST_F(PenToolTest, ShiftDragSnapsHandleAngle)
{
    click({0, 0});
    pen->root_handler(press({100, 100}));
    pen->root_handler(motion({130, 103}, GDK_SHIFT_MASK));

    auto const &point = pen->points().back();
    ASSERT_TRUE(point.out_handle);
    EXPECT_NEAR(point.out_handle->y(), 100.0, 1e-9);
    EXPECT_GT(point.out_handle->x(), 130.0);
}

TEST_F(PenToolTest, ShortDragLeavesCornerPoint)
{
    click({0, 0});
    pen->root_handler(press({100, 100}));
    pen->root_handler(motion({130, 100}));
    pen->root_handler(motion({101, 101}));
    pen->root_handler(release({101, 101}));

    auto const &point = pen->points().back();
    EXPECT_FALSE(point.in_handle);
    EXPECT_FALSE(point.out_handle);

    // at low zoom a long drag in document units is still short on screen
    host.setZoom(0.1);
    pen->root_handler(press({200, 100}));
    pen->root_handler(motion({220, 100}));
    EXPECT_FALSE(pen->points().back().out_handle);
}

TEST_F(PenToolTest, EscapeDiscardsCurve)
{
    bool cancelled = false;
    pen->signal_cancelled().connect([&] { cancelled = true; });

    click({0, 0});
    click({50, 0});
    ASSERT_EQ(host.store.size(), 1u);

    EXPECT_TRUE(pen->root_handler(key(GDK_KEY_Escape)));
    EXPECT_EQ(pen->state(), PenTool::DISCARDED);
    EXPECT_EQ(host.store.size(), 0u);
    EXPECT_FALSE(pen->shapeId());
    EXPECT_TRUE(cancelled);
    EXPECT_EQ(host.tool, ToolType::SELECT);

    // terminal
    click({10, 10});
    EXPECT_EQ(host.store.size(), 0u);
}

TEST_F(PenToolTest, FinishingSinglePointDiscards)
{
    click({0, 0});
    pen->root_handler(key(GDK_KEY_KP_Enter));
    EXPECT_EQ(pen->state(), PenTool::DISCARDED);
    EXPECT_EQ(host.store.size(), 0u);
}

TEST_F(PenToolTest, DoubleClickFinishesOpenCurve)
{
    click({0, 0});
    click({50, 0});
    // a double click delivers two single presses before the double press
    click({80, 20});
    click({80, 20});
    pen->root_handler(press({80, 20}, 2));

    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
    auto const shape = stored();
    ASSERT_TRUE(shape);
    EXPECT_FALSE(shape->closed);
    EXPECT_EQ(page_anchors(*shape), (std::vector<Geom::Point>{{0, 0}, {50, 0}, {80, 20}}));
}

TEST_F(PenToolTest, ShiftEnterClosesCurve)
{
    click({0, 0});
    click({50, 0});
    click({50, 50});
    pen->root_handler(key(GDK_KEY_Return, GDK_SHIFT_MASK));
    EXPECT_TRUE(stored()->closed);

    // with only two anchors there is nothing to close
    auto second = std::make_unique<PenTool>(host, prefs);
    second->root_handler(press({200, 0}));
    second->root_handler(release({200, 0}));
    second->root_handler(press({250, 0}));
    second->root_handler(release({250, 0}));
    second->root_handler(key(GDK_KEY_Return, GDK_SHIFT_MASK));
    ASSERT_TRUE(second->shapeId());
    EXPECT_FALSE(host.store.getAs<BezierShape>(*second->shapeId())->closed);
}

TEST_F(PenToolTest, CKeyClosesCurve)
{
    click({0, 0});
    click({50, 0});
    EXPECT_FALSE(pen->root_handler(key(GDK_KEY_c)));
    click({50, 50});
    EXPECT_FALSE(pen->root_handler(key(GDK_KEY_c, GDK_CONTROL_MASK)));
    EXPECT_EQ(pen->state(), PenTool::CREATING);

    EXPECT_TRUE(pen->root_handler(key(GDK_KEY_c)));
    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
    EXPECT_TRUE(stored()->closed);
}

TEST_F(PenToolTest, BackspaceRemovesLastPoint)
{
    click({0, 0});
    click({50, 0});
    click({50, 50});

    EXPECT_TRUE(pen->root_handler(key(GDK_KEY_BackSpace)));
    EXPECT_EQ(pen->points().size(), 2u);
    EXPECT_EQ(page_anchors(*stored()), (std::vector<Geom::Point>{{0, 0}, {50, 0}}));

    pen->root_handler(key(GDK_KEY_Delete));
    EXPECT_EQ(pen->points().size(), 1u);
    pen->root_handler(key(GDK_KEY_BackSpace));
    EXPECT_EQ(pen->state(), PenTool::DISCARDED);
    EXPECT_EQ(host.store.size(), 0u);
}

TEST_F(PenToolTest, StoredShapeIsNormalized)
{
    click({30, 40});
    click({-10, 60});
    auto const shape = stored();
    ASSERT_TRUE(shape);
    EXPECT_EQ(shape->position, Geom::Point(-10, 40));
    EXPECT_DOUBLE_EQ(shape->width, 40.0);
    EXPECT_DOUBLE_EQ(shape->height, 20.0);
    EXPECT_EQ(normalize(*shape), *shape);
}

TEST_F(PenToolTest, StatusMessages)
{
    std::vector<Glib::ustring> messages;
    pen->signal_status().connect([&](Glib::ustring const &message) { messages.push_back(message); });

    click({0, 0});
    EXPECT_EQ(messages.size(), 1u);
    pen->root_handler(key(GDK_KEY_Escape));
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages.back(), "Drawing cancelled");
}

TEST_F(PenToolTest, DestroyedWhileDrawingKeepsValidCurve)
{
    click({0, 0});
    click({50, 0});
    auto const id = *pen->shapeId();
    pen.reset();

    auto const shape = host.store.getAs<BezierShape>(id);
    ASSERT_TRUE(shape);
    EXPECT_FALSE(shape->edit_mode);
    EXPECT_EQ(shape->points.size(), 2u);
}

TEST_F(PenToolTest, DestroyedWithSinglePointRemovesShape)
{
    click({0, 0});
    pen.reset();
    EXPECT_EQ(host.store.size(), 0u);
}

TEST_F(PenToolTest, FreehandSamplesAndSmooths)
{
    Preferences freehand;
    ASSERT_TRUE(freehand.loadFromData("[tools/bezier]\nmode=freehand\nfreehand-spacing=8\n"));
    pen = std::make_unique<PenTool>(host, freehand);
    EXPECT_EQ(pen->mode(), PenTool::MODE_FREEHAND);

    pen->root_handler(press({0, 0}));
    pen->root_handler(motion({4, 0}));
    EXPECT_EQ(pen->points().size(), 1u);
    pen->root_handler(motion({10, 0}));
    pen->root_handler(motion({20, 5}));
    pen->root_handler(release({20, 5}));

    auto const &points = pen->points();
    ASSERT_EQ(points.size(), 3u);
    EXPECT_TRUE(points[1].in_handle);
    EXPECT_TRUE(points[1].out_handle);
    EXPECT_FALSE(points[0].in_handle);
    EXPECT_FALSE(points[2].out_handle);

    pen->root_handler(key(GDK_KEY_Return));
    EXPECT_EQ(pen->state(), PenTool::COMMITTED);
}

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
