// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Point, segment and handle enums shared by the curve model and the curve tools.
 * Kept separate so the math helpers do not pull in the tool headers.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_TOOL_NODE_TYPES_H
#define SKETCHPATH_UI_TOOL_NODE_TYPES_H

#include <optional>
#include <string_view>

namespace Sketchpath {
namespace UI {

/** Types of points on a Bezier curve. */
enum NodeType {
    NODE_CORNER, ///< Corner point - no control handles
    NODE_SMOOTH, ///< Smooth point - at least one control handle
};

/** Types of segments between two consecutive points. */
enum SegmentType {
    SEGMENT_STRAIGHT,        ///< No handle on either side
    SEGMENT_QUADRATIC_BEZIER, ///< Exactly one handle, shared as the single control point
    SEGMENT_CUBIC_BEZIER     ///< Outgoing handle of the start and incoming handle of the end
};

/** Which part of a curve point an interactive handle drives. */
enum class HandleRole
{
    ANCHOR,
    CONTROL_IN,
    CONTROL_OUT,
};

/** Vertex handles sit on the curve, virtual handles are off-curve control points. */
enum class HandleKind
{
    VERTEX,
    VIRTUAL,
};

/// Role names used in handle ids ("bezier-3-cp-in").
inline constexpr std::string_view encode_handle_role(HandleRole role)
{
    switch (role) {
        case HandleRole::ANCHOR:
            return "anchor";

        case HandleRole::CONTROL_IN:
            return "cp-in";

        case HandleRole::CONTROL_OUT:
            return "cp-out";
    }
    return {};
}

inline constexpr std::optional<HandleRole> decode_handle_role(std::string_view name)
{
    if (name == "anchor") {
        return HandleRole::ANCHOR;
    }
    if (name == "cp-in") {
        return HandleRole::CONTROL_IN;
    }
    if (name == "cp-out") {
        return HandleRole::CONTROL_OUT;
    }
    return {};
}

inline constexpr HandleKind handle_kind(HandleRole role)
{
    return role == HandleRole::ANCHOR ? HandleKind::VERTEX : HandleKind::VIRTUAL;
}

} // namespace UI
} // namespace Sketchpath

#endif

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
