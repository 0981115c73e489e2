// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "object/shape.h"

#include <2geom/affine.h>
#include <2geom/transforms.h>

#include "util/variant-visitor.h"

namespace Sketchpath {

/// Outline in page coordinates.
Geom::PathVector shape_to_pathvector(ShapeData const &data)
{
    return std::visit(VariantVisitor{
                          [](BezierShape const &shape) {
                              return to_pathvector(shape) * Geom::Translate(shape.position);
                          },
                          [](PolylineShape const &shape) {
                              return to_pathvector(shape) * Geom::Translate(shape.position);
                          },
                      },
                      data);
}

Geom::Rect shape_page_bounds(ShapeData const &data)
{
    return std::visit([](auto const &shape) { return page_bounds(shape); }, data);
}

char const *shape_type_name(ShapeData const &data)
{
    return std::visit(VariantVisitor{
                          [](BezierShape const &) { return "bezier"; },
                          [](PolylineShape const &) { return "polyline"; },
                      },
                      data);
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
