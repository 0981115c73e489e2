// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * The closed set of shape kinds held by the shape store.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_OBJECT_SHAPE_H
#define SKETCHPATH_OBJECT_SHAPE_H

#include <cstdint>
#include <variant>

#include <2geom/pathvector.h>
#include <2geom/rect.h>

#include "object/bezier-shape.h"
#include "object/polyline-shape.h"

namespace Sketchpath {

using ShapeId = std::uint64_t;

using ShapeData = std::variant<BezierShape, PolylineShape>;

struct ShapeRecord
{
    ShapeId id = 0;
    ShapeData data;
};

Geom::PathVector shape_to_pathvector(ShapeData const &data);
Geom::Rect shape_page_bounds(ShapeData const &data);
char const *shape_type_name(ShapeData const &data);

} // namespace Sketchpath

#endif // SKETCHPATH_OBJECT_SHAPE_H

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
