// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for the shape store and the shape variants it holds.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "document/shape-store.h"

#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "object/polyline-shape.h"
#include "object/shape.h"
#include "test-utils.h"

using namespace Sketchpath;

class ShapeStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store.signal_changed().connect([this](ShapeId id) { changed.push_back(id); });
        store.signal_removed().connect([this](ShapeId id) { removed.push_back(id); });
    }

    static BezierShape triangle()
    {
        BezierShape shape;
        shape.position = {10, 20};
        shape.points = {CurvePoint({0, 0}), CurvePoint({40, 0}), CurvePoint({40, 30})};
        shape.closed = true;
        return normalize(std::move(shape));
    }

    ShapeStore store;
    std::vector<ShapeId> changed;
    std::vector<ShapeId> removed;
};

TEST_F(ShapeStoreTest, AddAssignsIncreasingIds)
{
    auto const first = store.add(triangle());
    auto const second = store.add(PolylineShape{});
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.ids(), (std::vector<ShapeId>{1, 2}));
    EXPECT_EQ(changed, (std::vector<ShapeId>{1, 2}));
}

TEST_F(ShapeStoreTest, SnapshotsSurviveUpdates)
{
    auto const id = store.add(triangle());
    auto const before = store.get(id);

    auto shape = *store.getAs<BezierShape>(id);
    shape.edit_mode = true;
    EXPECT_TRUE(store.update(id, shape));

    auto const after = store.get(id);
    EXPECT_NE(before, after);
    EXPECT_FALSE(std::get<BezierShape>(*before).edit_mode);
    EXPECT_TRUE(std::get<BezierShape>(*after).edit_mode);
}

TEST_F(ShapeStoreTest, UpdateWithSameDataIsSilent)
{
    auto const id = store.add(triangle());
    changed.clear();

    EXPECT_TRUE(store.update(id, triangle()));
    EXPECT_TRUE(changed.empty());

    auto moved = triangle();
    moved.position += Geom::Point(5, 5);
    EXPECT_TRUE(store.update(id, moved));
    EXPECT_EQ(changed, (std::vector<ShapeId>{id}));
}

TEST_F(ShapeStoreTest, UpdateOfUnknownShapeFails)
{
    EXPECT_FALSE(store.update(42, triangle()));
    EXPECT_TRUE(changed.empty());
    EXPECT_FALSE(store.contains(42));
}

TEST_F(ShapeStoreTest, RemoveEmitsSignal)
{
    auto const id = store.add(triangle());
    EXPECT_TRUE(store.remove(id));
    EXPECT_FALSE(store.remove(id));
    EXPECT_EQ(removed, (std::vector<ShapeId>{id}));
    EXPECT_FALSE(store.get(id));
    EXPECT_FALSE(store.getAs<BezierShape>(id));
    EXPECT_FALSE(store.pageBounds(id));
}

TEST_F(ShapeStoreTest, GetAsChecksKind)
{
    auto const id = store.add(PolylineShape{{0, 0}, {{0, 0}, {10, 10}}, false});
    EXPECT_FALSE(store.getAs<BezierShape>(id));
    ASSERT_TRUE(store.getAs<PolylineShape>(id));
    EXPECT_STREQ(shape_type_name(*store.get(id)), "polyline");
    EXPECT_STREQ(shape_type_name(ShapeData(triangle())), "bezier");
}

TEST_F(ShapeStoreTest, PageBoundsOfEachKind)
{
    auto const curve = store.add(triangle());
    auto const bounds = store.pageBounds(curve);
    ASSERT_TRUE(bounds);
    EXPECT_EQ(bounds->min(), Geom::Point(10, 20));
    EXPECT_EQ(bounds->max(), Geom::Point(50, 50));

    auto const line = store.add(normalize(PolylineShape{{100, 100}, {{5, 5}, {5, 25}}, false}));
    auto const line_bounds = store.pageBounds(line);
    ASSERT_TRUE(line_bounds);
    EXPECT_EQ(line_bounds->min(), Geom::Point(105, 105));
    // vertical line still has a width of one
    EXPECT_DOUBLE_EQ(line_bounds->width(), 1.0);
    EXPECT_DOUBLE_EQ(line_bounds->height(), 20.0);
}

TEST_F(ShapeStoreTest, OutlineIsInPageCoordinates)
{
    auto const pv = shape_to_pathvector(triangle());
    ASSERT_EQ(pv.size(), 1u);
    EXPECT_TRUE(pv[0].closed());
    EXPECT_EQ(pv[0].initialPoint(), Geom::Point(10, 20));
    EXPECT_EQ(pv[0][1].finalPoint(), Geom::Point(50, 50));

    auto const line = shape_to_pathvector(PolylineShape{{100, 100}, {{0, 0}, {10, 0}, {10, 10}}, false});
    ASSERT_EQ(line.size(), 1u);
    EXPECT_FALSE(line[0].closed());
    EXPECT_EQ(line[0].size(), 2u);
    EXPECT_EQ(line[0].initialPoint(), Geom::Point(100, 100));
    EXPECT_EQ(line[0].finalPoint(), Geom::Point(110, 110));
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
