// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for the Bezier curve shape: path output, bounds and structural edits.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "object/bezier-shape.h"

#include <vector>
#include <gtest/gtest.h>
#include <2geom/transforms.h>

#include "helper/bezier-math.h"
#include "test-utils.h"

using namespace Sketchpath;

namespace {

BezierShape make_shape(std::vector<CurvePoint> points, bool closed = false)
{
    BezierShape shape;
    shape.points = std::move(points);
    shape.closed = closed;
    return normalize(std::move(shape));
}

std::vector<Geom::Point> page_anchors(BezierShape const &shape)
{
    std::vector<Geom::Point> result;
    for (auto const &point : shape.points) {
        result.push_back(point.position + shape.position);
    }
    return result;
}

} // namespace

TEST(BezierShapeTest, OpenCornerCurveIsStraightLines)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({50, 0}), CurvePoint({50, 50})});

    std::vector<PathCommand> const expected{MoveTo{{0, 0}}, LineTo{{50, 0}}, LineTo{{50, 50}}};
    EXPECT_EQ(to_path_commands(shape), expected);
    EXPECT_FALSE(shape.closed);
    EXPECT_EQ(segment_count(shape), 2u);
    EXPECT_EQ(point_type(shape.points[1]), UI::NODE_CORNER);
}

TEST(BezierShapeTest, ClosedCurveEmitsClosingSegment)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({50, 0}), CurvePoint({50, 50})}, true);

    std::vector<PathCommand> const expected{MoveTo{{0, 0}}, LineTo{{50, 0}}, LineTo{{50, 50}}, LineTo{{0, 0}},
                                            ClosePath{}};
    EXPECT_EQ(to_path_commands(shape), expected);
    EXPECT_TRUE(has_closing_segment(shape));
    EXPECT_EQ(segment_count(shape), 3u);

    auto const [from, to] = segment_points(shape, 2);
    EXPECT_EQ(from.position, Geom::Point(50, 50));
    EXPECT_EQ(to.position, Geom::Point(0, 0));
}

TEST(BezierShapeTest, ClosedFlagWithTwoPointsDrawsNoClosingSegment)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({50, 0})}, true);
    EXPECT_FALSE(has_closing_segment(shape));
    EXPECT_EQ(segment_count(shape), 1u);

    std::vector<PathCommand> const expected{MoveTo{{0, 0}}, LineTo{{50, 0}}};
    EXPECT_EQ(to_path_commands(shape), expected);
}

TEST(BezierShapeTest, HandlesSelectCommandBasis)
{
    auto const shape = make_shape({CurvePoint({0, 0}, {}, Geom::Point(10, -10)), CurvePoint({40, 0}),
                                   CurvePoint({80, 0}, Geom::Point(70, 20)), CurvePoint({120, 0})});
    // after normalisation everything moved down by 10
    auto const commands = to_path_commands(shape);
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[1], PathCommand(QuadTo{{10, 0}, {40, 10}}));
    EXPECT_EQ(commands[2], PathCommand(QuadTo{{70, 30}, {80, 10}}));
    EXPECT_EQ(commands[3], PathCommand(LineTo{{120, 10}}));
}

TEST(BezierShapeTest, PathAgreesWithPointOnSegment)
{
    auto const shape = make_shape({CurvePoint({10, 10}, {}, Geom::Point(30, -20)), CurvePoint({60, 10}),
                                   CurvePoint({90, 40}, Geom::Point(80, 0), Geom::Point(100, 60))},
                                  true);
    auto const pv = to_pathvector(shape);
    ASSERT_EQ(pv.size(), 1u);
    ASSERT_EQ(pv[0].size_default(), 3u);
    EXPECT_TRUE(pv[0].closed());

    for (std::size_t i = 0; i < segment_count(shape); ++i) {
        auto const [a, b] = segment_points(shape, i);
        for (double t : {0.0, 0.3, 0.5, 0.9, 1.0}) {
            EXPECT_TRUE(PointIsNear(pv[0][i].pointAt(t), point_on_segment(a, b, t))) << "segment " << i;
        }
    }
}

TEST(BezierShapeTest, NormalizeMovesOriginToBoundsMinimum)
{
    BezierShape shape;
    shape.position = {100, 100};
    shape.points = {CurvePoint({20, 30}, {}, Geom::Point(5, 40)), CurvePoint({60, 35}, Geom::Point(50, 80))};
    auto const before = page_anchors(shape);

    auto const normalized = normalize(shape);
    EXPECT_EQ(normalized.position, Geom::Point(105, 130));
    EXPECT_DOUBLE_EQ(normalized.width, 55.0);
    EXPECT_DOUBLE_EQ(normalized.height, 50.0);
    EXPECT_EQ(page_anchors(normalized), before);
    EXPECT_EQ(*normalized.points[0].out_handle, Geom::Point(0, 10));

    // a normalized shape stays put
    EXPECT_EQ(normalize(normalized), normalized);
}

TEST(BezierShapeTest, BoundsContainEveryAnchorAndHandle)
{
    auto const shape = make_shape({CurvePoint({-30, 5}, Geom::Point(-60, -10), Geom::Point(0, 90)),
                                   CurvePoint({40, 12}), CurvePoint({44, -7}, Geom::Point(41, 0))});
    auto const box = page_bounds(shape);
    for (auto const &point : shape.points) {
        EXPECT_TRUE(box.contains(point.position + shape.position));
        if (point.in_handle) {
            EXPECT_TRUE(box.contains(*point.in_handle + shape.position));
        }
        if (point.out_handle) {
            EXPECT_TRUE(box.contains(*point.out_handle + shape.position));
        }
    }
    EXPECT_EQ(box.min(), Geom::Point(-60, -10));
    EXPECT_EQ(box.max(), Geom::Point(44, 90));
}

TEST(BezierShapeTest, DegenerateBoundsAreFlooredAtOne)
{
    auto const bounds = recompute_bounds(std::vector<CurvePoint>{CurvePoint({5, 5}), CurvePoint({5, 20})});
    EXPECT_EQ(bounds.min, Geom::Point(5, 5));
    EXPECT_DOUBLE_EQ(bounds.width, 1.0);
    EXPECT_DOUBLE_EQ(bounds.height, 15.0);

    auto const empty = recompute_bounds({});
    EXPECT_DOUBLE_EQ(empty.width, 1.0);
    EXPECT_DOUBLE_EQ(empty.height, 1.0);
}

TEST(BezierShapeTest, InsertPointOnStraightSegment)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0})});
    auto const [a, b] = segment_points(shape, 0);
    auto const inserted = insert_point(shape, 0, CurvePoint(point_on_segment(a, b, 0.5)));

    ASSERT_EQ(inserted.points.size(), 3u);
    EXPECT_EQ(inserted.points[1].position, Geom::Point(50, 0));
    for (auto const &point : inserted.points) {
        EXPECT_FALSE(point.in_handle);
        EXPECT_FALSE(point.out_handle);
    }
}

TEST(BezierShapeTest, InsertPointOnClosingSegmentAppends)
{
    auto shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100})}, true);
    shape.selection = {0, 2};
    auto const inserted = insert_point(shape, 2, CurvePoint({50, 50}));

    ASSERT_EQ(inserted.points.size(), 4u);
    EXPECT_EQ(inserted.points[3].position, Geom::Point(50, 50));
    EXPECT_EQ(inserted.selection, (std::vector<std::size_t>{0, 2}));
}

TEST(BezierShapeTest, InsertPointShiftsSelectionAndDropsHover)
{
    auto shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({200, 0})});
    shape.selection = {0, 2};
    shape.hover = HoverPreview{{50, 0}, 0};

    auto const inserted = insert_point(shape, 0, CurvePoint({50, 0}));
    EXPECT_EQ(inserted.selection, (std::vector<std::size_t>{0, 3}));
    EXPECT_FALSE(inserted.hover);
}

TEST(BezierShapeTest, InsertPointOutsideBoundsRenormalizes)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0})});
    auto const inserted = insert_point(shape, 0, CurvePoint({50, -20}));
    EXPECT_EQ(inserted.position, Geom::Point(0, -20));
    EXPECT_EQ(inserted.points[1].position, Geom::Point(50, 0));
    EXPECT_DOUBLE_EQ(inserted.height, 20.0);
}

TEST(BezierShapeTest, InsertPointRejectsInvalidSegment)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0})});
    EXPECT_DEBUG_DEATH(insert_point(shape, 1, CurvePoint({50, 0})), "segment index out of range");
}

TEST(BezierShapeTest, RemovePointKeepsMinimum)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0})});
    auto const copy = shape;
    EXPECT_THROW(remove_point(shape, 0), MinimumPointsViolation);
    EXPECT_EQ(shape, copy);

    try {
        remove_point(shape, 1);
        FAIL() << "removal from a two point curve succeeded";
    } catch (MinimumPointsViolation const &e) {
        EXPECT_EQ(e.count(), 1u);
    }

    try {
        remove_point(BezierShape{}, 0);
        FAIL() << "removal from an empty curve succeeded";
    } catch (MinimumPointsViolation const &e) {
        EXPECT_EQ(e.count(), 0u);
    }
}

TEST(BezierShapeTest, RemovePointFixesSelection)
{
    auto shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100}), CurvePoint({0, 100})});
    shape.selection = {1, 3};

    auto const removed = remove_point(shape, 1);
    ASSERT_EQ(removed.points.size(), 3u);
    EXPECT_EQ(removed.points[1].position, Geom::Point(100, 100));
    EXPECT_EQ(removed.selection, (std::vector<std::size_t>{2}));
}

TEST(BezierShapeTest, RemovePointsTogether)
{
    auto shape = make_shape({CurvePoint({0, 0}), CurvePoint({10, 0}), CurvePoint({20, 0}), CurvePoint({30, 5})});
    shape.selection = {1, 2};

    auto const removed = remove_points(shape, {2, 1, 2, 17});
    ASSERT_EQ(removed.points.size(), 2u);
    EXPECT_EQ(page_anchors(removed), (std::vector<Geom::Point>{{0, 0}, {30, 5}}));
    EXPECT_TRUE(removed.selection.empty());

    EXPECT_THROW(remove_points(shape, {0, 1, 2}), MinimumPointsViolation);
    EXPECT_EQ(remove_points(shape, {}), shape);
}

TEST(BezierShapeTest, TogglePointType)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({200, 0})});

    auto const smooth = toggle_point_type(shape, 1, 0.5);
    EXPECT_EQ(point_type(smooth.points[1]), UI::NODE_SMOOTH);
    EXPECT_TRUE(PointIsNear(*smooth.points[1].in_handle, {50, 0}));
    EXPECT_TRUE(PointIsNear(*smooth.points[1].out_handle, {150, 0}));

    auto const corner = toggle_point_type(smooth, 1, 0.5);
    EXPECT_EQ(point_type(corner.points[1]), UI::NODE_CORNER);
    EXPECT_EQ(corner, shape);
}

TEST(BezierShapeTest, TogglePointTypeWrapsOnClosedCurve)
{
    auto const shape = make_shape({CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100})}, true);
    auto const smooth = toggle_point_type(shape, 0, 0.3);
    EXPECT_TRUE(smooth.points[0].in_handle);
    EXPECT_TRUE(smooth.points[0].out_handle);

    auto const open = make_shape(shape.points);
    auto const first = toggle_point_type(open, 0, 0.3);
    EXPECT_FALSE(first.points[0].in_handle);
    EXPECT_TRUE(first.points[0].out_handle);
}

TEST(BezierShapeTest, ShapeFromPathCommands)
{
    std::vector<PathCommand> const commands{MoveTo{{10, 10}}, QuadTo{{30, -20}, {60, 10}},
                                            CurveTo{{70, 0}, {80, 40}, {90, 30}}, LineTo{{10, 10}}, ClosePath{}};
    auto const shape = shape_from_path_commands(commands);
    ASSERT_TRUE(shape);
    EXPECT_TRUE(shape->closed);
    ASSERT_EQ(shape->points.size(), 3u);
    EXPECT_EQ(shape->position, Geom::Point(10, -20));
    EXPECT_EQ(page_anchors(*shape), (std::vector<Geom::Point>{{10, 10}, {60, 10}, {90, 30}}));
    EXPECT_EQ(point_type(shape->points[0]), UI::NODE_SMOOTH);
    EXPECT_EQ(segment_type(shape->points[1], shape->points[2]), UI::SEGMENT_CUBIC_BEZIER);

    // writing it back reproduces the outline
    auto const pv = to_pathvector(*shape) * Geom::Translate(shape->position);
    EXPECT_TRUE(PointIsNear(pv[0][0].pointAt(0.5), {32.5, -5}));
}

TEST(BezierShapeTest, ShapeFromPathCommandsNeedsTwoPoints)
{
    EXPECT_FALSE(shape_from_path_commands(std::vector<PathCommand>{MoveTo{{0, 0}}}));
    EXPECT_FALSE(shape_from_path_commands(std::vector<PathCommand>{LineTo{{0, 0}}, LineTo{{5, 0}}}));
    EXPECT_FALSE(shape_from_path_commands({}));
}

TEST(BezierShapeTest, ShapeFromPathCommandsKeepsFirstSubpath)
{
    std::vector<PathCommand> const commands{MoveTo{{0, 0}}, LineTo{{10, 0}}, MoveTo{{50, 50}}, LineTo{{60, 60}}};
    auto const shape = shape_from_path_commands(commands);
    ASSERT_TRUE(shape);
    EXPECT_EQ(shape->points.size(), 2u);
    EXPECT_FALSE(shape->closed);
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
