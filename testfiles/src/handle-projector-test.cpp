// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for projecting curve points to draggable handles and back.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tool/handle-projector.h"

#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Sketchpath;
using namespace Sketchpath::UI;

namespace {

BezierShape sample_curve()
{
    BezierShape shape;
    shape.position = {100, 100};
    shape.points = {CurvePoint({0, 0}), CurvePoint({50, 20}, Geom::Point(40, 10), Geom::Point(60, 30)),
                    CurvePoint({100, 0}, Geom::Point(90, 0))};
    return normalize(std::move(shape));
}

} // namespace

TEST(HandleProjectorTest, HandleIds)
{
    EXPECT_EQ(make_handle_id({0, HandleRole::ANCHOR}), "bezier-0-anchor");
    EXPECT_EQ(make_handle_id({12, HandleRole::CONTROL_IN}), "bezier-12-cp-in");
    EXPECT_EQ(make_handle_id({3, HandleRole::CONTROL_OUT}), "bezier-3-cp-out");

    EXPECT_EQ(parse_handle_id("bezier-12-cp-in"), (HandleRef{12, HandleRole::CONTROL_IN}));
    EXPECT_EQ(parse_handle_id("bezier-0-anchor"), (HandleRef{0, HandleRole::ANCHOR}));
}

TEST(HandleProjectorTest, MalformedIdsAreRejected)
{
    for (auto const id : {"", "bezier-", "bezier-1", "bezier-1-", "bezier--anchor", "bezier-x-anchor",
                          "bezier-1-cp-sideways", "rect-1-anchor", "bezier-1anchor"}) {
        EXPECT_FALSE(parse_handle_id(id)) << id;
    }
}

TEST(HandleProjectorTest, ProjectsAnchorsAndPresentControls)
{
    auto const shape = sample_curve();
    auto const handles = project_handles(shape);
    ASSERT_EQ(handles.size(), 6u);

    EXPECT_EQ(handles[0].id, "bezier-0-anchor");
    EXPECT_EQ(handles[0].kind, HandleKind::VERTEX);
    EXPECT_EQ(handles[1].id, "bezier-1-anchor");
    EXPECT_EQ(handles[2].id, "bezier-1-cp-in");
    EXPECT_EQ(handles[2].kind, HandleKind::VIRTUAL);
    EXPECT_EQ(handles[3].id, "bezier-1-cp-out");
    EXPECT_EQ(handles[4].id, "bezier-2-anchor");
    EXPECT_EQ(handles[5].id, "bezier-2-cp-in");

    EXPECT_EQ(handles[3].position, *shape.points[1].out_handle);
    EXPECT_EQ(handles[4].position, shape.points[2].position);
}

TEST(HandleProjectorTest, MovingControlLeavesAnchorAndTwin)
{
    auto const shape = sample_curve();
    auto const moved = apply_handle_move(shape, "bezier-1-cp-out", {70, 25});

    EXPECT_EQ(moved.position, shape.position);
    EXPECT_EQ(moved.points[1].position, shape.points[1].position);
    EXPECT_EQ(moved.points[1].in_handle, shape.points[1].in_handle);
    EXPECT_EQ(*moved.points[1].out_handle, Geom::Point(70, 25));
}

TEST(HandleProjectorTest, MovingAnchorLeavesItsControls)
{
    auto const shape = sample_curve();
    auto const moved = apply_handle_move(shape, "bezier-2-anchor", {110, 0});
    EXPECT_EQ(moved.points[2].position, Geom::Point(110, 0));
    EXPECT_EQ(moved.points[2].in_handle, shape.points[2].in_handle);
    EXPECT_DOUBLE_EQ(moved.width, 110.0);
}

TEST(HandleProjectorTest, MoveOutsideBoundsRenormalizes)
{
    auto const shape = sample_curve();
    auto const page_before = shape.points[2].position + shape.position;

    auto const moved = apply_handle_move(shape, "bezier-0-anchor", {-20, -10});
    EXPECT_EQ(moved.position, shape.position + Geom::Point(-20, -10));
    EXPECT_EQ(moved.points[0].position, Geom::Point(0, 0));
    EXPECT_EQ(moved.points[2].position + moved.position, page_before);
}

TEST(HandleProjectorTest, StaleIdsLeaveShapeUntouched)
{
    auto const shape = sample_curve();
    EXPECT_EQ(apply_handle_move(shape, "bezier-9-anchor", {1, 1}), shape);
    EXPECT_EQ(apply_handle_move(shape, "bezier-0-cp-out", {1, 1}), shape);
    EXPECT_EQ(apply_handle_move(shape, "garbage", {1, 1}), shape);
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
