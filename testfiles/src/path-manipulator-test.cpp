// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for editing committed curves and for the hover preview loop.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tool/path-manipulator.h"

#include <memory>
#include <vector>
#include <gtest/gtest.h>

#include "object/polyline-shape.h"
#include "preferences.h"
#include "test-utils.h"

using namespace Sketchpath;
using Sketchpath::UI::PathManipulator;

class PathManipulatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        BezierShape shape;
        shape.points = {CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100})};
        id = host.store.add(normalize(std::move(shape)));
        manipulator = std::make_unique<PathManipulator>(host, prefs, id);
        ASSERT_TRUE(manipulator->begin());
    }

    BezierShape current() const { return *host.store.getAs<BezierShape>(id); }

    void holdAlt(Geom::Point const &pointer)
    {
        host.input.modifiers = GDK_ALT_MASK;
        host.input.pointer = pointer;
        manipulator->event(motion(pointer, GDK_ALT_MASK));
    }

    TestCanvasHost host;
    Preferences prefs;
    ShapeId id = 0;
    std::unique_ptr<PathManipulator> manipulator;
};

TEST_F(PathManipulatorTest, BeginTurnsOnEditMode)
{
    EXPECT_TRUE(manipulator->active());
    EXPECT_TRUE(current().edit_mode);

    auto const line = host.store.add(PolylineShape{{0, 0}, {{0, 0}, {10, 0}}, false});
    PathManipulator other(host, prefs, line);
    EXPECT_FALSE(other.begin());
    EXPECT_FALSE(other.active());
}

TEST_F(PathManipulatorTest, ClickOnSegmentInsertsCornerPoint)
{
    EXPECT_TRUE(manipulator->event(press({50, 3})));

    auto const shape = current();
    ASSERT_EQ(shape.points.size(), 4u);
    EXPECT_EQ(shape.points[1].position, Geom::Point(50, 3));
    EXPECT_EQ(point_type(shape.points[1]), UI::NODE_CORNER);
    EXPECT_EQ(shape.points[2].position, Geom::Point(100, 0));
    EXPECT_TRUE(shape.edit_mode);
}

TEST_F(PathManipulatorTest, SegmentHitRadiusScalesWithZoom)
{
    host.setZoom(4.0);
    EXPECT_FALSE(manipulator->event(press({50, 3})));
    EXPECT_EQ(current().points.size(), 3u);

    EXPECT_TRUE(manipulator->event(press({50, 2})));
    EXPECT_EQ(current().points.size(), 4u);
}

TEST_F(PathManipulatorTest, ClickNearAnchorSelectsInsteadOfInserting)
{
    EXPECT_FALSE(manipulator->event(press({97, 2})));
    auto shape = current();
    EXPECT_EQ(shape.points.size(), 3u);
    EXPECT_EQ(shape.selection, (std::vector<std::size_t>{1}));

    manipulator->event(press({0, 0}, 1, GDK_SHIFT_MASK));
    EXPECT_EQ(current().selection, (std::vector<std::size_t>{1, 0}));
    manipulator->event(press({100, 0}, 1, GDK_SHIFT_MASK));
    EXPECT_EQ(current().selection, (std::vector<std::size_t>{0}));
}

TEST_F(PathManipulatorTest, ClickOnClosingSegment)
{
    auto shape = current();
    shape.closed = true;
    host.store.update(id, shape);

    EXPECT_TRUE(manipulator->event(press({50, 50})));
    auto const edited = current();
    ASSERT_EQ(edited.points.size(), 4u);
    EXPECT_EQ(edited.points[3].position, Geom::Point(50, 50));
}

TEST_F(PathManipulatorTest, EmptyClickInsideBoundsClearsSelection)
{
    manipulator->event(press({100, 100}));
    ASSERT_FALSE(current().selection.empty());

    EXPECT_FALSE(manipulator->event(press({30, 60})));
    EXPECT_TRUE(current().selection.empty());
    EXPECT_TRUE(manipulator->active());
}

TEST_F(PathManipulatorTest, ClickOutsideBoundsExits)
{
    bool exited = false;
    manipulator->signal_exited().connect([&] { exited = true; });

    manipulator->event(press({300, 300}));
    EXPECT_FALSE(manipulator->active());
    EXPECT_FALSE(current().edit_mode);
    EXPECT_TRUE(exited);
    EXPECT_EQ(host.selected, id);
}

TEST_F(PathManipulatorTest, PressOnControlPointIsLeftToHost)
{
    auto shape = current();
    shape.points[0].out_handle = Geom::Point(30, 0);
    shape.points[1].in_handle = Geom::Point(70, 1);
    shape.hover = HoverPreview{{50, 0}, 0};
    host.store.update(id, normalize(std::move(shape)));

    EXPECT_FALSE(manipulator->event(press({30, 0})));
    auto edited = current();
    EXPECT_EQ(edited.points.size(), 3u);
    EXPECT_FALSE(edited.hover);
    EXPECT_TRUE(manipulator->active());

    EXPECT_FALSE(manipulator->event(press({71, 2})));
    edited = current();
    EXPECT_EQ(edited.points.size(), 3u);
    EXPECT_TRUE(edited.edit_mode);
}

TEST_F(PathManipulatorTest, DoubleClickOnSegmentKeepsInsertedPoint)
{
    int updates = 0;
    host.store.signal_changed().connect([&](ShapeId) { ++updates; });

    EXPECT_TRUE(manipulator->event(press({50, 3})));
    EXPECT_FALSE(manipulator->event(press({50, 3})));
    EXPECT_TRUE(manipulator->event(press({50, 3}, 2)));

    auto const shape = current();
    ASSERT_EQ(shape.points.size(), 4u);
    EXPECT_EQ(shape.points[1].position, Geom::Point(50, 3));
    EXPECT_EQ(shape.selection, std::vector<std::size_t>{1});
    EXPECT_EQ(updates, 2);

    // a later double click on the same anchor removes it
    manipulator->event(press({50, 3}));
    EXPECT_TRUE(manipulator->event(press({50, 3}, 2)));
    EXPECT_EQ(current().points.size(), 3u);
}

TEST_F(PathManipulatorTest, DoubleClickRemovesAnchor)
{
    EXPECT_TRUE(manipulator->event(press({100, 0}, 2)));
    auto const shape = current();
    ASSERT_EQ(shape.points.size(), 2u);
    EXPECT_EQ(shape.points[1].position, Geom::Point(100, 100));
}

TEST_F(PathManipulatorTest, DoubleClickKeepsMinimumPoints)
{
    manipulator->event(press({100, 0}, 2));
    ASSERT_EQ(current().points.size(), 2u);
    auto const before = current();

    EXPECT_TRUE(manipulator->event(press({100, 100}, 2)));
    EXPECT_EQ(current(), before);
}

TEST_F(PathManipulatorTest, DoubleClickOffAnchorDoesNothing)
{
    EXPECT_FALSE(manipulator->event(press({40, 70}, 2)));
    EXPECT_EQ(current().points.size(), 3u);
}

TEST_F(PathManipulatorTest, CtrlDoubleClickTogglesPointType)
{
    manipulator->event(press({100, 0}, 2, GDK_CONTROL_MASK));
    auto shape = current();
    ASSERT_EQ(shape.points.size(), 3u);
    EXPECT_EQ(point_type(shape.points[1]), UI::NODE_SMOOTH);

    auto const anchor = shape.points[1].position + shape.position;
    manipulator->event(press(anchor, 2, GDK_CONTROL_MASK));
    EXPECT_EQ(point_type(current().points[1]), UI::NODE_CORNER);
}

TEST_F(PathManipulatorTest, DeleteRemovesSelectedPoints)
{
    auto shape = current();
    shape.points.emplace_back(Geom::Point(0, 100));
    shape.selection = {1, 2};
    host.store.update(id, shape);

    EXPECT_TRUE(manipulator->event(key(GDK_KEY_Delete)));
    auto const edited = current();
    EXPECT_EQ(edited.points.size(), 2u);
    EXPECT_TRUE(edited.selection.empty());
}

TEST_F(PathManipulatorTest, DeleteKeepsMinimumPoints)
{
    auto shape = current();
    shape.selection = {0, 1};
    host.store.update(id, shape);

    EXPECT_TRUE(manipulator->event(key(GDK_KEY_BackSpace)));
    EXPECT_EQ(current().points.size(), 3u);

    // nothing selected, nothing to do
    shape.selection.clear();
    host.store.update(id, shape);
    EXPECT_FALSE(manipulator->event(key(GDK_KEY_Delete)));
}

TEST_F(PathManipulatorTest, EscapeLeavesEditModeInOneUpdate)
{
    auto shape = current();
    shape.selection = {2};
    shape.hover = HoverPreview{{50, 0}, 0};
    host.store.update(id, shape);

    int updates = 0;
    host.store.signal_changed().connect([&](ShapeId) { ++updates; });
    host.tool = ToolType::PEN;

    EXPECT_TRUE(manipulator->event(key(GDK_KEY_Escape)));
    EXPECT_EQ(updates, 1);

    auto const edited = current();
    EXPECT_FALSE(edited.edit_mode);
    EXPECT_FALSE(edited.hover);
    EXPECT_TRUE(edited.selection.empty());
    EXPECT_EQ(edited.points, shape.points);
    EXPECT_EQ(host.tool, ToolType::SELECT);

    // inactive manipulators ignore input
    EXPECT_FALSE(manipulator->event(press({50, 0})));
    EXPECT_EQ(current().points.size(), 3u);
}

TEST_F(PathManipulatorTest, EnterLeavesEditMode)
{
    manipulator->event(key(GDK_KEY_Return));
    EXPECT_FALSE(manipulator->active());
    EXPECT_FALSE(current().edit_mode);
}

TEST_F(PathManipulatorTest, EditModeEndedElsewhere)
{
    bool exited = false;
    manipulator->signal_exited().connect([&] { exited = true; });

    auto shape = current();
    shape.edit_mode = false;
    host.store.update(id, shape);

    EXPECT_FALSE(manipulator->active());
    EXPECT_TRUE(exited);
}

TEST_F(PathManipulatorTest, ShapeRemovedElsewhere)
{
    host.store.remove(id);
    EXPECT_FALSE(manipulator->active());
    EXPECT_FALSE(manipulator->event(press({50, 0})));
}

TEST_F(PathManipulatorTest, HandlesFollowShape)
{
    auto const handles = manipulator->handles();
    ASSERT_EQ(handles.size(), 3u);
    EXPECT_EQ(handles[2].id, "bezier-2-anchor");

    EXPECT_TRUE(manipulator->moveHandle("bezier-1-anchor", {120, 0}));
    auto const shape = current();
    EXPECT_EQ(shape.points[1].position + shape.position, Geom::Point(120, 0));
    EXPECT_DOUBLE_EQ(shape.width, 120.0);

    EXPECT_FALSE(manipulator->moveHandle("bezier-1-cp-in", {0, 0}));
    EXPECT_FALSE(manipulator->moveHandle("bezier-7-anchor", {0, 0}));
}

TEST_F(PathManipulatorTest, HoverPreviewFollowsPointer)
{
    holdAlt({50, 4});
    ASSERT_TRUE(manipulator->hoverPoint().running());
    EXPECT_EQ(host.clock.pending(), 1u);

    host.clock.tick();
    auto hover = current().hover;
    ASSERT_TRUE(hover);
    EXPECT_EQ(hover->segment, 0u);
    EXPECT_TRUE(PointIsNear(hover->point, {50, 0}));

    host.input.pointer = {96, 70};
    host.clock.tick();
    hover = current().hover;
    ASSERT_TRUE(hover);
    EXPECT_EQ(hover->segment, 1u);
    EXPECT_TRUE(PointIsNear(hover->point, {100, 70}));

    // off the curve the marker disappears but polling continues
    host.input.pointer = {40, 60};
    host.clock.tick();
    EXPECT_FALSE(current().hover);
    EXPECT_TRUE(manipulator->hoverPoint().running());
}

TEST_F(PathManipulatorTest, HoverPreviewFollowsCurvedSegment)
{
    auto shape = current();
    shape.points[0].out_handle = Geom::Point(50, 40);
    host.store.update(id, normalize(shape));

    auto const stored = current();
    auto const [a, b] = segment_points(stored, 0);
    holdAlt(stored.position + Geom::Point(50, 0));
    host.clock.tick();

    auto const hover = current().hover;
    ASSERT_TRUE(hover);
    EXPECT_EQ(hover->segment, 0u);
    EXPECT_TRUE(PointIsNear(hover->point, point_on_segment(a, b, 0.5)));
    // the marker sits on the curve, not on the chord
    EXPECT_FALSE(IsNear(hover->point.y(), a.position.y()));
}

TEST_F(PathManipulatorTest, ClickOnHoverMarkerInsertsThere)
{
    holdAlt({50, 4});
    host.clock.tick();
    ASSERT_TRUE(current().hover);

    EXPECT_TRUE(manipulator->event(press({52, 6})));
    auto const shape = current();
    ASSERT_EQ(shape.points.size(), 4u);
    EXPECT_TRUE(PointIsNear(shape.points[1].position + shape.position, {50, 0}));
    EXPECT_FALSE(shape.hover);
}

TEST_F(PathManipulatorTest, HoverStopsWhenAltIsReleased)
{
    holdAlt({50, 4});
    host.clock.tick();
    ASSERT_TRUE(current().hover);

    host.input.modifiers = 0;
    host.clock.tick();
    EXPECT_FALSE(current().hover);
    EXPECT_FALSE(manipulator->hoverPoint().running());
    EXPECT_EQ(host.clock.pending(), 0u);

    // pressing Alt again restarts it
    host.input.modifiers = GDK_ALT_MASK;
    manipulator->event(key(GDK_KEY_Alt_L, GDK_ALT_MASK));
    EXPECT_TRUE(manipulator->hoverPoint().running());
    host.clock.tick();
    EXPECT_TRUE(current().hover);
}

TEST_F(PathManipulatorTest, HoverStopsWhenToolChanges)
{
    holdAlt({50, 4});
    host.clock.tick();
    ASSERT_TRUE(current().hover);

    host.tool = ToolType::PEN;
    host.clock.tick();
    EXPECT_FALSE(current().hover);
    EXPECT_FALSE(manipulator->hoverPoint().running());

    // waking does nothing while another tool is active
    manipulator->event(motion({50, 4}, GDK_ALT_MASK));
    EXPECT_FALSE(manipulator->hoverPoint().running());
}

TEST_F(PathManipulatorTest, HoverStopsWhenEditModeEnds)
{
    holdAlt({50, 4});
    host.clock.tick();
    ASSERT_TRUE(current().hover);

    manipulator->exit();
    EXPECT_FALSE(manipulator->hoverPoint().running());
    host.clock.tick();
    EXPECT_FALSE(current().hover);
    EXPECT_EQ(host.clock.pending(), 0u);
}

TEST_F(PathManipulatorTest, HoverPausesDuringDrag)
{
    holdAlt({50, 4});
    host.clock.tick();
    auto const before = current().hover;
    ASSERT_TRUE(before);

    host.input.dragging = true;
    host.input.pointer = {100, 50};
    host.clock.tick();
    EXPECT_EQ(current().hover, before);
    EXPECT_TRUE(manipulator->hoverPoint().running());

    host.input.dragging = false;
    host.clock.tick();
    EXPECT_EQ(current().hover->segment, 1u);
}

TEST_F(PathManipulatorTest, WakeWithoutAltDoesNotPoll)
{
    manipulator->event(motion({50, 4}));
    EXPECT_FALSE(manipulator->hoverPoint().running());
    EXPECT_EQ(host.clock.pending(), 0u);
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
