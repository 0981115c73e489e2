// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Interactive handles for the host's generic drag machinery.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_TOOL_HANDLE_PROJECTOR_H
#define SKETCHPATH_UI_TOOL_HANDLE_PROJECTOR_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <2geom/point.h>

#include "object/bezier-shape.h"
#include "ui/tool/node-types.h"

namespace Sketchpath {
namespace UI {

struct HandleRef
{
    std::size_t index = 0;
    HandleRole role = HandleRole::ANCHOR;

    bool operator==(HandleRef const &) const = default;
};

struct Handle
{
    std::string id;
    HandleKind kind = HandleKind::VERTEX;
    Geom::Point position; ///< Local coordinates of the shape
};

/// "bezier-<index>-<role>", stable for as long as the point keeps its index.
std::string make_handle_id(HandleRef const &ref);
std::optional<HandleRef> parse_handle_id(std::string_view id);

/**
 * One vertex handle per anchor followed by its present control points, in point order.
 */
std::vector<Handle> project_handles(BezierShape const &shape);

/**
 * Write a moved handle back into the curve.
 *
 * Only the addressed coordinate changes; the result is normalized. Unknown or stale ids leave
 * the shape untouched.
 */
BezierShape apply_handle_move(BezierShape shape, std::string_view id, Geom::Point const &position);

} // namespace UI
} // namespace Sketchpath

#endif // SKETCHPATH_UI_TOOL_HANDLE_PROJECTOR_H

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
