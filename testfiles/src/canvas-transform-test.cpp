// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for the document to window mapping of the canvas camera.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/desktop/canvas-transform.h"

#include <2geom/affine.h>
#include <2geom/transforms.h>
#include <gtest/gtest.h>

#include "test-utils.h"

namespace Sketchpath {

TEST(CanvasTransformTest, StartsAtIdentity)
{
    CanvasTransform transform;
    EXPECT_EQ(transform.d2w(), Geom::identity());
    EXPECT_EQ(transform.w2d(), Geom::identity());
    EXPECT_DOUBLE_EQ(transform.getZoom(), 1.0);
}

TEST(CanvasTransformTest, SetZoom)
{
    CanvasTransform transform;
    transform.setZoom(4.0);
    EXPECT_EQ(transform.d2w(), Geom::Scale(4.0));
    EXPECT_DOUBLE_EQ(transform.getZoom(), 4.0);
    EXPECT_DOUBLE_EQ(transform.toDocumentDistance(8.0), 2.0);

    transform.setZoom(0.5);
    EXPECT_DOUBLE_EQ(transform.toDocumentDistance(8.0), 16.0);
}

TEST(CanvasTransformTest, OffsetAppliesAfterZoom)
{
    CanvasTransform transform;
    transform.setZoom(2.0);
    transform.setOffset({100, 50});
    EXPECT_TRUE(PointIsNear(transform.documentToWindow({10, 10}), {120, 70}));
    EXPECT_TRUE(PointIsNear(transform.windowToDocument({120, 70}), {10, 10}));

    transform.addOffset({-20, 0});
    EXPECT_EQ(transform.getOffset(), Geom::Point(80, 50));
    EXPECT_TRUE(PointIsNear(transform.windowToDocument({100, 70}), {10, 10}));
}

TEST(CanvasTransformTest, ZoomByKeepsPointUnderCursor)
{
    CanvasTransform transform;
    transform.setOffset({30, -10});
    Geom::Point const cursor(200, 150);
    auto const under_cursor = transform.windowToDocument(cursor);

    transform.zoomBy(3.0, cursor);
    EXPECT_DOUBLE_EQ(transform.getZoom(), 3.0);
    EXPECT_TRUE(PointIsNear(transform.windowToDocument(cursor), under_cursor, 1e-9));

    transform.zoomBy(0.25, {0, 0});
    EXPECT_DOUBLE_EQ(transform.getZoom(), 0.75);
}

TEST(CanvasTransformTest, RotationDoesNotChangeZoom)
{
    CanvasTransform transform;
    transform.setZoom(2.0);
    transform.setRotate(0.5);

    auto const expected = Geom::Scale(2.0) * Geom::Rotate(0.5);
    EXPECT_TRUE(Geom::are_near(transform.d2w(), expected, 1e-12));
    EXPECT_DOUBLE_EQ(transform.getZoom(), 2.0);
    EXPECT_TRUE(PointIsNear(transform.windowToDocument(transform.documentToWindow({7, -3})), {7, -3}, 1e-9));
}

} // namespace Sketchpath

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
