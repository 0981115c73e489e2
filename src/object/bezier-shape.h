// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Multi-segment Bezier curve shape and the structural operations on it.
 *
 * All point and handle coordinates are local to the shape's bounding-box origin, which sits at
 * @a position in page coordinates. Every operation that changes geometry returns a new,
 * normalized shape value; callers submit it to the store as a whole record.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_OBJECT_BEZIER_SHAPE_H
#define SKETCHPATH_OBJECT_BEZIER_SHAPE_H

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <2geom/path-sink.h>
#include <2geom/pathvector.h>
#include <2geom/point.h>
#include <2geom/rect.h>

#include "display/path-commands.h"
#include "ui/tool/node-types.h"

namespace Sketchpath {

/// Fewest points a committed curve may have.
inline constexpr std::size_t MIN_CURVE_POINTS = 2;
/// Fewest points for the closing segment to be drawn.
inline constexpr std::size_t MIN_CLOSED_CURVE_POINTS = 3;

/**
 * Anchor on a curve with optional control handles.
 *
 * A missing handle means the adjacent segment is straight on that side.
 */
struct CurvePoint
{
    Geom::Point position;
    std::optional<Geom::Point> in_handle;
    std::optional<Geom::Point> out_handle;

    CurvePoint() = default;
    CurvePoint(Geom::Point const &pos,
               std::optional<Geom::Point> in = {},
               std::optional<Geom::Point> out = {})
        : position(pos)
        , in_handle(in)
        , out_handle(out)
    {}

    bool operator==(CurvePoint const &) const = default;
};

/// Position-only marker shown where a click would insert a point.
struct HoverPreview
{
    Geom::Point point;
    std::size_t segment = 0;

    bool operator==(HoverPreview const &) const = default;
};

struct BezierShape
{
    Geom::Point position; ///< Page position of the local origin
    std::vector<CurvePoint> points;
    bool closed = false;
    bool edit_mode = false;
    double width = 1.0;
    double height = 1.0;

    std::vector<std::size_t> selection;   ///< Selected point indices while editing
    std::optional<HoverPreview> hover;    ///< Transient insertion preview

    bool operator==(BezierShape const &) const = default;
};

struct ShapeBounds
{
    Geom::Point min;
    double width = 1.0;
    double height = 1.0;
};

class CurveError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Thrown when a removal would leave fewer than MIN_CURVE_POINTS points.
class MinimumPointsViolation : public CurveError
{
public:
    explicit MinimumPointsViolation(std::size_t count);

    std::size_t count() const { return _count; }

private:
    std::size_t _count;
};

UI::NodeType point_type(CurvePoint const &point);

/// Number of segments, counting the closing segment of a closed curve.
std::size_t segment_count(BezierShape const &shape);
bool has_closing_segment(BezierShape const &shape);

/// The two points bounding a segment. The closing segment runs from the last to the first point.
std::pair<CurvePoint const &, CurvePoint const &> segment_points(BezierShape const &shape,
                                                                 std::size_t segment_index);

void write_path(BezierShape const &shape, Geom::PathSink &sink);
std::vector<PathCommand> to_path_commands(BezierShape const &shape);
Geom::PathVector to_pathvector(BezierShape const &shape);

/// Build a normalized curve from path commands; nullopt when there is no drawable subpath.
std::optional<BezierShape> shape_from_path_commands(std::span<PathCommand const> commands);

ShapeBounds recompute_bounds(std::span<CurvePoint const> points);
BezierShape normalize(BezierShape shape);

/// Bounding box of the shape in page coordinates.
Geom::Rect page_bounds(BezierShape const &shape);

BezierShape insert_point(BezierShape shape, std::size_t segment_index, CurvePoint const &point);
BezierShape remove_point(BezierShape const &shape, std::size_t index);
BezierShape remove_points(BezierShape const &shape, std::vector<std::size_t> indices);
BezierShape toggle_point_type(BezierShape shape, std::size_t index, double smoothing);

} // namespace Sketchpath

#endif // SKETCHPATH_OBJECT_BEZIER_SHAPE_H

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
