// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Bezier curve shape: path output, bounds and structural edits.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "object/bezier-shape.h"

#include <algorithm>
#include <cassert>
#include <string>

#include <glib.h>
#include <2geom/coord.h>

#include "helper/bezier-math.h"
#include "util/variant-visitor.h"

namespace Sketchpath {

namespace {

void translate_point(CurvePoint &point, Geom::Point const &delta)
{
    point.position += delta;
    if (point.in_handle) {
        *point.in_handle += delta;
    }
    if (point.out_handle) {
        *point.out_handle += delta;
    }
}

/// Previous and next anchor of a point, following the closing segment when there is one.
std::pair<std::optional<Geom::Point>, std::optional<Geom::Point>> neighbors(BezierShape const &shape,
                                                                            std::size_t index)
{
    auto const &points = shape.points;
    auto const n = points.size();
    bool const wraps = has_closing_segment(shape);

    std::optional<Geom::Point> prev, next;
    if (index > 0) {
        prev = points[index - 1].position;
    } else if (wraps) {
        prev = points.back().position;
    }
    if (index + 1 < n) {
        next = points[index + 1].position;
    } else if (wraps) {
        next = points.front().position;
    }
    return {prev, next};
}

} // namespace

MinimumPointsViolation::MinimumPointsViolation(std::size_t count)
    : CurveError("a curve needs at least " + std::to_string(MIN_CURVE_POINTS) + " points, removal would leave " +
                 std::to_string(count))
    , _count(count)
{}

UI::NodeType point_type(CurvePoint const &point)
{
    return (point.in_handle || point.out_handle) ? UI::NODE_SMOOTH : UI::NODE_CORNER;
}

bool has_closing_segment(BezierShape const &shape)
{
    return shape.closed && shape.points.size() >= MIN_CLOSED_CURVE_POINTS;
}

std::size_t segment_count(BezierShape const &shape)
{
    auto const n = shape.points.size();
    if (n < MIN_CURVE_POINTS) {
        return 0;
    }
    return has_closing_segment(shape) ? n : n - 1;
}

std::pair<CurvePoint const &, CurvePoint const &> segment_points(BezierShape const &shape,
                                                                 std::size_t segment_index)
{
    auto const n = shape.points.size();
    return {shape.points[segment_index], shape.points[(segment_index + 1) % n]};
}

/**
 * Write the curve into a path sink.
 *
 * Each segment goes through make_segment(), so the emitted command always has the same basis
 * as point_on_segment() for that segment. The closing segment of a closed curve follows the
 * same rule before the subpath is closed.
 */
void write_path(BezierShape const &shape, Geom::PathSink &sink)
{
    auto const &points = shape.points;
    if (points.empty()) {
        sink.flush();
        return;
    }

    sink.moveTo(points.front().position);
    for (std::size_t i = 1; i < points.size(); ++i) {
        sink.feed(*make_segment(points[i - 1], points[i]), false);
    }
    if (has_closing_segment(shape)) {
        sink.feed(*make_segment(points.back(), points.front()), false);
        sink.closePath();
    }
    sink.flush();
}

std::vector<PathCommand> to_path_commands(BezierShape const &shape)
{
    PathCommandSink sink;
    write_path(shape, sink);
    return sink.take();
}

Geom::PathVector to_pathvector(BezierShape const &shape)
{
    Geom::PathBuilder builder;
    write_path(shape, builder);
    return builder.peek();
}

std::optional<BezierShape> shape_from_path_commands(std::span<PathCommand const> commands)
{
    if (commands.empty() || !std::holds_alternative<MoveTo>(commands.front())) {
        return {};
    }

    BezierShape shape;
    auto &points = shape.points;
    bool done = false;

    for (auto const &command : commands) {
        if (done) {
            g_debug("shape_from_path_commands: ignoring commands after the first subpath");
            break;
        }
        std::visit(VariantVisitor{
                       [&](MoveTo const &c) {
                           if (points.empty()) {
                               points.emplace_back(c.p);
                           } else {
                               done = true;
                           }
                       },
                       [&](LineTo const &c) { points.emplace_back(c.p); },
                       [&](QuadTo const &c) {
                           points.back().out_handle = c.c;
                           points.emplace_back(c.p);
                       },
                       [&](CurveTo const &c) {
                           points.back().out_handle = c.c0;
                           points.emplace_back(c.p, c.c1);
                       },
                       [&](ClosePath const &) {
                           shape.closed = true;
                           done = true;
                       },
                   },
                   command);
    }

    // An explicit segment back to the start becomes the closing segment.
    if (shape.closed && points.size() > 1 && Geom::are_near(points.back().position, points.front().position)) {
        points.front().in_handle = points.back().in_handle;
        points.pop_back();
    }

    if (points.size() < MIN_CURVE_POINTS) {
        return {};
    }
    return normalize(std::move(shape));
}

ShapeBounds recompute_bounds(std::span<CurvePoint const> points)
{
    if (points.empty()) {
        return {};
    }

    Geom::Rect box(points.front().position, points.front().position);
    for (auto const &point : points) {
        box.expandTo(point.position);
        if (point.in_handle) {
            box.expandTo(*point.in_handle);
        }
        if (point.out_handle) {
            box.expandTo(*point.out_handle);
        }
    }

    return {box.min(), std::max(1.0, box.width()), std::max(1.0, box.height())};
}

BezierShape normalize(BezierShape shape)
{
    auto const bounds = recompute_bounds(shape.points);
    auto const offset = bounds.min;

    for (auto &point : shape.points) {
        translate_point(point, -offset);
    }
    if (shape.hover) {
        shape.hover->point -= offset;
    }
    shape.position += offset;
    shape.width = bounds.width;
    shape.height = bounds.height;
    return shape;
}

Geom::Rect page_bounds(BezierShape const &shape)
{
    return Geom::Rect(shape.position, shape.position + Geom::Point(shape.width, shape.height));
}

BezierShape insert_point(BezierShape shape, std::size_t segment_index, CurvePoint const &point)
{
    auto const count = segment_count(shape);
    if (segment_index >= count) {
        g_warning("insert_point: segment %zu out of range, curve has %zu segments", segment_index, count);
        assert(segment_index < count && "segment index out of range");
        return shape;
    }

    auto const position = segment_index + 1;
    shape.points.insert(shape.points.begin() + position, point);
    for (auto &selected : shape.selection) {
        if (selected >= position) {
            ++selected;
        }
    }
    shape.hover.reset();
    return normalize(std::move(shape));
}

BezierShape remove_point(BezierShape const &shape, std::size_t index)
{
    auto const n = shape.points.size();
    if (n <= MIN_CURVE_POINTS) {
        throw MinimumPointsViolation(n > 0 ? n - 1 : 0);
    }
    g_return_val_if_fail(index < n, shape);

    auto result = shape;
    result.points.erase(result.points.begin() + index);
    std::erase(result.selection, index);
    for (auto &selected : result.selection) {
        if (selected > index) {
            --selected;
        }
    }
    result.hover.reset();
    return normalize(std::move(result));
}

BezierShape remove_points(BezierShape const &shape, std::vector<std::size_t> indices)
{
    auto const n = shape.points.size();
    std::erase_if(indices, [n](std::size_t i) { return i >= n; });
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    if (indices.empty()) {
        return shape;
    }
    if (n - indices.size() < MIN_CURVE_POINTS) {
        throw MinimumPointsViolation(n - indices.size());
    }

    auto result = shape;
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        result.points.erase(result.points.begin() + *it);
    }
    result.selection.clear();
    result.hover.reset();
    return normalize(std::move(result));
}

/**
 * Switch a point between corner and smooth.
 *
 * A corner point gets handles along the tangent through its neighbours; a smooth point loses
 * both of its handles.
 */
BezierShape toggle_point_type(BezierShape shape, std::size_t index, double smoothing)
{
    g_return_val_if_fail(index < shape.points.size(), shape);

    auto &point = shape.points[index];
    if (point_type(point) == UI::NODE_SMOOTH) {
        point.in_handle.reset();
        point.out_handle.reset();
    } else {
        auto const [prev, next] = neighbors(shape, index);
        auto const handles = synthesize_handles(prev, point.position, next, smoothing);
        point.in_handle = handles.in;
        point.out_handle = handles.out;
    }
    return normalize(std::move(shape));
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
