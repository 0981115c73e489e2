// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Straight-segment shape described by a list of points.
 *
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "object/polyline-shape.h"

#include <algorithm>

#include <2geom/path.h>

namespace Sketchpath {

Geom::PathVector to_pathvector(PolylineShape const &shape)
{
    Geom::PathVector result;
    if (shape.points.empty()) {
        return result;
    }

    Geom::Path path(shape.points.front());
    for (std::size_t i = 1; i < shape.points.size(); ++i) {
        path.appendNew<Geom::LineSegment>(shape.points[i]);
    }
    path.close(shape.closed && shape.points.size() >= MIN_CLOSED_CURVE_POINTS);
    result.push_back(std::move(path));
    return result;
}

PolylineShape normalize(PolylineShape shape)
{
    if (shape.points.empty()) {
        return shape;
    }

    auto const [min_x, max_x] = std::minmax_element(shape.points.begin(), shape.points.end(),
                                                    [](auto const &a, auto const &b) { return a.x() < b.x(); });
    auto const [min_y, max_y] = std::minmax_element(shape.points.begin(), shape.points.end(),
                                                    [](auto const &a, auto const &b) { return a.y() < b.y(); });
    Geom::Point const offset(min_x->x(), min_y->y());

    for (auto &point : shape.points) {
        point -= offset;
    }
    shape.position += offset;
    return shape;
}

Geom::Rect page_bounds(PolylineShape const &shape)
{
    double width = 0.0;
    double height = 0.0;
    for (auto const &point : shape.points) {
        width = std::max(width, point.x());
        height = std::max(height, point.y());
    }
    return Geom::Rect(shape.position, shape.position + Geom::Point(std::max(1.0, width), std::max(1.0, height)));
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
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
