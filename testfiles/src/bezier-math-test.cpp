// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for segment evaluation, hit testing and handle synthesis.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "helper/bezier-math.h"

#include <vector>
#include <gtest/gtest.h>

#include "preferences.h"
#include "test-utils.h"

using namespace Sketchpath;

TEST(BezierMathTest, SegmentTypeFollowsHandles)
{
    CurvePoint const corner({0, 0});
    CurvePoint const with_out({0, 0}, {}, Geom::Point(5, 5));
    CurvePoint const with_in({10, 0}, Geom::Point(5, 5));

    EXPECT_EQ(segment_type(corner, CurvePoint({10, 0})), UI::SEGMENT_STRAIGHT);
    EXPECT_EQ(segment_type(with_out, CurvePoint({10, 0})), UI::SEGMENT_QUADRATIC_BEZIER);
    EXPECT_EQ(segment_type(corner, with_in), UI::SEGMENT_QUADRATIC_BEZIER);
    EXPECT_EQ(segment_type(with_out, with_in), UI::SEGMENT_CUBIC_BEZIER);
    // the incoming handle of the start point does not affect the segment leaving it
    EXPECT_EQ(segment_type(CurvePoint({0, 0}, Geom::Point(-5, 0)), CurvePoint({10, 0})), UI::SEGMENT_STRAIGHT);
}

TEST(BezierMathTest, LinearSegmentInterpolates)
{
    CurvePoint const a({0, 0});
    CurvePoint const b({100, 50});
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 0.0), {0, 0}));
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 0.25), {25, 12.5}));
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 1.0), {100, 50}));
}

TEST(BezierMathTest, SingleHandleEvaluatesAsQuadratic)
{
    CurvePoint const a({10, 10}, {}, Geom::Point(30, -20));
    CurvePoint const b({60, 10});

    // 0.25 * (10,10) + 0.5 * (30,-20) + 0.25 * (60,10)
    auto const mid = point_on_segment(a, b, 0.5);
    EXPECT_NEAR(mid.x(), 32.5, 1e-9);
    EXPECT_NEAR(mid.y(), -5.0, 1e-9);

    // a straight interpolation would stay on y = 10
    EXPECT_FALSE(IsNear(mid.y(), 10.0));
}

TEST(BezierMathTest, IncomingHandleAloneIsAlsoQuadratic)
{
    CurvePoint const a({10, 10});
    CurvePoint const b({60, 10}, Geom::Point(30, -20));
    auto const mid = point_on_segment(a, b, 0.5);
    EXPECT_NEAR(mid.x(), 32.5, 1e-9);
    EXPECT_NEAR(mid.y(), -5.0, 1e-9);
}

TEST(BezierMathTest, CubicSegment)
{
    CurvePoint const a({0, 0}, {}, Geom::Point(0, 100));
    CurvePoint const b({100, 0}, Geom::Point(100, 100));
    // 0.125*P0 + 0.375*C0 + 0.375*C1 + 0.125*P1
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 0.5), {50, 75}));
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 0.0), {0, 0}));
    EXPECT_TRUE(PointIsNear(point_on_segment(a, b, 1.0), {100, 0}));
}

TEST(BezierMathTest, DistanceUsesAnchorChord)
{
    CurvePoint const a({0, 0}, {}, Geom::Point(50, 200));
    CurvePoint const b({100, 0}, Geom::Point(50, 200));

    EXPECT_DOUBLE_EQ(distance_to_segment({50, 10}, a, b), 10.0);
    // beyond the ends the distance is measured to the anchor
    EXPECT_DOUBLE_EQ(distance_to_segment({-30, 40}, a, b), 50.0);
    EXPECT_DOUBLE_EQ(distance_to_segment({103, 4}, a, b), 5.0);
}

TEST(BezierMathTest, DistanceToDegenerateSegment)
{
    CurvePoint const a({5, 5});
    EXPECT_DOUBLE_EQ(distance_to_segment({8, 9}, a, a), 5.0);
    EXPECT_DOUBLE_EQ(chord_time({8, 9}, {5, 5}, {5, 5}), 0.0);
}

TEST(BezierMathTest, FindAnchorPicksNearest)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}), CurvePoint({5, 0}), CurvePoint({100, 0})};
    EXPECT_EQ(find_anchor(points, {4, 0}, 1.0, 8.0), 1u);
    EXPECT_EQ(find_anchor(points, {1, 0}, 1.0, 8.0), 0u);
    EXPECT_FALSE(find_anchor(points, {50, 0}, 1.0, 8.0));
    // at 4x zoom the radius shrinks to 2 document units
    EXPECT_FALSE(find_anchor(points, {100, 3}, 4.0, 8.0));
    EXPECT_EQ(find_anchor(points, {100, 1}, 4.0, 8.0), 2u);
}

TEST(BezierMathTest, FindControlChecksPresentHandles)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}, std::nullopt, Geom::Point(30, 0)),
                                         CurvePoint({100, 0}, Geom::Point(70, 2)), CurvePoint({100, 100})};

    auto hit = find_control(points, {31, 1}, 1.0, 8.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 0u);
    EXPECT_EQ(hit->role, UI::HandleRole::CONTROL_OUT);

    hit = find_control(points, {70, 0}, 1.0, 8.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 1u);
    EXPECT_EQ(hit->role, UI::HandleRole::CONTROL_IN);

    EXPECT_FALSE(find_control(points, {50, 0}, 1.0, 8.0));
    EXPECT_FALSE(find_control(points, {33, 0}, 4.0, 8.0));
}

TEST(BezierMathTest, NearestSegmentReturnsIndexAndTime)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100})};

    auto hit = nearest_segment(points, false, {25, 4}, 1.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 0u);
    EXPECT_NEAR(hit->t, 0.25, 1e-12);

    hit = nearest_segment(points, false, {97, 60}, 1.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 1u);
    EXPECT_NEAR(hit->t, 0.6, 1e-12);

    EXPECT_FALSE(nearest_segment(points, false, {50, 30}, 1.0));
}

TEST(BezierMathTest, NearestSegmentIncludesClosingSegmentOnlyWhenClosed)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({100, 100})};
    Geom::Point const on_diagonal(50, 52);

    EXPECT_FALSE(nearest_segment(points, false, on_diagonal, 1.0));

    auto const hit = nearest_segment(points, true, on_diagonal, 1.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 2u);
    EXPECT_NEAR(hit->t, 0.49, 1e-12);
}

TEST(BezierMathTest, AnchorExclusionWinsOverSegment)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}), CurvePoint({100, 0}), CurvePoint({200, 0})};

    // 11 units from the middle anchor and right on top of both segments
    EXPECT_FALSE(nearest_segment(points, false, {89, 0}, 1.0));
    EXPECT_FALSE(nearest_segment(points, false, {111, 0}, 1.0));
    // just outside the exclusion radius the segment is hit again
    auto const hit = nearest_segment(points, false, {87, 0}, 1.0);
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->index, 0u);
}

TEST(BezierMathTest, SegmentHitsAreZoomInvariant)
{
    std::vector<CurvePoint> const points{CurvePoint({0, 0}), CurvePoint({100, 0})};

    for (double zoom : {0.25, 1.0, 4.0, 16.0}) {
        // 5 screen pixels off the segment at every zoom level
        auto const hit = nearest_segment(points, false, {50, 5.0 / zoom}, zoom);
        ASSERT_TRUE(hit) << "zoom " << zoom;
        EXPECT_EQ(hit->index, 0u);
        EXPECT_NEAR(hit->t, 0.5, 1e-12);

        // 11 screen pixels off is always a miss
        EXPECT_FALSE(nearest_segment(points, false, {50, 11.0 / zoom}, zoom)) << "zoom " << zoom;
    }
}

TEST(BezierMathTest, NearestSegmentNeedsTwoPoints)
{
    std::vector<CurvePoint> const single{CurvePoint({0, 0})};
    EXPECT_FALSE(nearest_segment(single, true, {0, 30}, 1.0));
    EXPECT_FALSE(nearest_segment({}, false, {0, 0}, 1.0));
}

TEST(BezierMathTest, SynthesizeHandlesFollowsNeighbourTangent)
{
    auto const handles = synthesize_handles(Geom::Point(0, 0), {100, 0}, Geom::Point(200, 0), 0.5);
    ASSERT_TRUE(handles.in);
    ASSERT_TRUE(handles.out);
    EXPECT_TRUE(PointIsNear(*handles.in, {50, 0}));
    EXPECT_TRUE(PointIsNear(*handles.out, {150, 0}));
}

TEST(BezierMathTest, SynthesizeHandlesScalesWithNeighbourDistance)
{
    // tangent along +x, previous neighbour 40 away, next 100 away
    auto const handles = synthesize_handles(Geom::Point(0, 0), {40, 0}, Geom::Point(140, 0), 0.25);
    EXPECT_TRUE(PointIsNear(*handles.in, {30, 0}));
    EXPECT_TRUE(PointIsNear(*handles.out, {65, 0}));

    // handles stay collinear with the anchor
    auto const bent = synthesize_handles(Geom::Point(0, 0), {50, 50}, Geom::Point(100, 0), 0.3);
    auto const a = *bent.in - Geom::Point(50, 50);
    auto const b = *bent.out - Geom::Point(50, 50);
    EXPECT_NEAR(Geom::cross(a, b), 0.0, 1e-9);
    EXPECT_NEAR(a.y(), 0.0, 1e-9);
}

TEST(BezierMathTest, SynthesizeHandlesAtEndpointsIsOneSided)
{
    auto const first = synthesize_handles({}, {0, 0}, Geom::Point(100, 0), 0.3);
    EXPECT_FALSE(first.in);
    ASSERT_TRUE(first.out);
    EXPECT_TRUE(PointIsNear(*first.out, {30, 0}));

    auto const last = synthesize_handles(Geom::Point(0, 0), {0, 100}, {}, 0.3);
    EXPECT_FALSE(last.out);
    ASSERT_TRUE(last.in);
    EXPECT_TRUE(PointIsNear(*last.in, {0, 70}));

    auto const lonely = synthesize_handles({}, {0, 0}, {}, 0.3);
    EXPECT_FALSE(lonely.in);
    EXPECT_FALSE(lonely.out);
}

TEST(BezierMathTest, SynthesizeHandlesDegenerateTangent)
{
    // coincident neighbours: no direction to follow
    auto const handles = synthesize_handles(Geom::Point(10, 10), {20, 20}, Geom::Point(10, 10), 0.5);
    ASSERT_TRUE(handles.in);
    ASSERT_TRUE(handles.out);
    EXPECT_TRUE(PointIsNear(*handles.in, {20, 20}));
    EXPECT_TRUE(PointIsNear(*handles.out, {20, 20}));
}

TEST(BezierMathTest, SynthesizeHandlesClampsSmoothing)
{
    auto const handles = synthesize_handles(Geom::Point(0, 0), {100, 0}, Geom::Point(200, 0), 3.0);
    EXPECT_TRUE(PointIsNear(*handles.in, {0, 0}));
    EXPECT_TRUE(PointIsNear(*handles.out, {200, 0}));
}

TEST(BezierMathTest, HandlesFromDrag)
{
    auto const symmetric = handles_from_drag({10, 10}, {5, -2}, false);
    EXPECT_TRUE(PointIsNear(*symmetric.out, {15, 8}));
    EXPECT_TRUE(PointIsNear(*symmetric.in, {5, 12}));

    auto const one_sided = handles_from_drag({10, 10}, {5, -2}, true);
    EXPECT_TRUE(PointIsNear(*one_sided.out, {15, 8}));
    EXPECT_FALSE(one_sided.in);
}

TEST(BezierMathTest, ConstrainAngleSnapsToEighths)
{
    auto const snapped = constrain_angle({10, 1});
    EXPECT_NEAR(snapped.y(), 0.0, 1e-9);
    EXPECT_NEAR(snapped.x(), Geom::L2(Geom::Point(10, 1)), 1e-9);

    auto const diagonal = constrain_angle({10, 9});
    EXPECT_NEAR(diagonal.x(), diagonal.y(), 1e-9);

    EXPECT_TRUE(PointIsNear(constrain_angle({0, 0}), {0, 0}));
}

TEST(BezierMathTest, ThresholdsFromPreferences)
{
    Preferences prefs;
    ASSERT_TRUE(prefs.loadFromData("[tools/bezier/hit]\nanchor=6\nsegment=500\nsnap-to-start=20\nsnap-release=5\n"));

    auto const thresholds = HitThresholds::from_preferences(prefs);
    EXPECT_DOUBLE_EQ(thresholds.anchor, 6.0);
    // out of range values fall back to the default
    EXPECT_DOUBLE_EQ(thresholds.segment, 10.0);
    EXPECT_DOUBLE_EQ(thresholds.anchor_exclusion, 12.0);
    EXPECT_DOUBLE_EQ(thresholds.snap_to_start, 20.0);
    EXPECT_DOUBLE_EQ(thresholds.snap_release, 20.0);
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
