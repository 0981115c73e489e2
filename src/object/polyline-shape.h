// SPDX-License-Identifier: GPL-2.0-or-later
#ifndef SKETCHPATH_OBJECT_POLYLINE_SHAPE_H
#define SKETCHPATH_OBJECT_POLYLINE_SHAPE_H

/*
 * Straight-segment shape described by a list of points.
 *
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <vector>

#include <2geom/pathvector.h>
#include <2geom/point.h>
#include <2geom/rect.h>

#include "object/bezier-shape.h"

namespace Sketchpath {

struct PolylineShape
{
    Geom::Point position; ///< Page position of the local origin
    std::vector<Geom::Point> points;
    bool closed = false;

    bool operator==(PolylineShape const &) const = default;
};

Geom::PathVector to_pathvector(PolylineShape const &shape);
PolylineShape normalize(PolylineShape shape);
Geom::Rect page_bounds(PolylineShape const &shape);

} // namespace Sketchpath

#endif // SKETCHPATH_OBJECT_POLYLINE_SHAPE_H

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
