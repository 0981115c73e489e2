// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Geometry helpers for curve points: segment evaluation, hit testing and handle synthesis.
 *
 * Every function here is pure. Hit-testing thresholds are given in screen pixels and
 * divided by the zoom factor, so a hit feels the same at any magnification.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_HELPER_BEZIER_MATH_H
#define SKETCHPATH_HELPER_BEZIER_MATH_H

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include <2geom/curve.h>
#include <2geom/point.h>

#include "object/bezier-shape.h"
#include "ui/tool/node-types.h"

namespace Sketchpath {

class Preferences;

/// Hit radii and drag tolerances, in screen pixels.
struct HitThresholds
{
    double anchor = 8.0;
    double segment = 10.0;
    double anchor_exclusion = 12.0;
    double close_curve = 10.0;
    double snap_to_start = 12.0;
    double snap_release = 15.0;
    double hover_click = 12.0;
    double corner_drag = 3.0;

    static HitThresholds from_preferences(Preferences const &prefs);
};

struct SegmentHit
{
    std::size_t index = 0; ///< Segment index; the closing segment is points.size() - 1
    double t = 0.0;        ///< Parameter along the anchor-to-anchor chord, in [0, 1]
};

struct HandlePair
{
    std::optional<Geom::Point> in;
    std::optional<Geom::Point> out;
};

UI::SegmentType segment_type(CurvePoint const &p1, CurvePoint const &p2);

/// The 2geom curve for the segment from p1 to p2, with the basis chosen by segment_type().
std::unique_ptr<Geom::Curve> make_segment(CurvePoint const &p1, CurvePoint const &p2);

Geom::Point point_on_segment(CurvePoint const &p1, CurvePoint const &p2, double t);

/**
 * Distance from @a point to the straight chord between the two anchors.
 * Handles are ignored; this is the approximation every hit test uses.
 */
double distance_to_segment(Geom::Point const &point, CurvePoint const &p1, CurvePoint const &p2);

/// Chord parameter of the projection of @a point, clamped to [0, 1].
double chord_time(Geom::Point const &point, Geom::Point const &a, Geom::Point const &b);

std::optional<std::size_t> find_anchor(std::span<CurvePoint const> points, Geom::Point const &query,
                                       double zoom, double threshold);

struct ControlHit
{
    std::size_t index = 0;
    UI::HandleRole role = UI::HandleRole::CONTROL_IN;
};

/// Nearest present control point within @a threshold screen pixels.
std::optional<ControlHit> find_control(std::span<CurvePoint const> points, Geom::Point const &query,
                                       double zoom, double threshold);

std::optional<SegmentHit> nearest_segment(std::span<CurvePoint const> points, bool closed,
                                          Geom::Point const &query, double zoom,
                                          HitThresholds const &thresholds = {});

HandlePair synthesize_handles(std::optional<Geom::Point> const &prev, Geom::Point const &current,
                              std::optional<Geom::Point> const &next, double smoothing);

HandlePair handles_from_drag(Geom::Point const &anchor, Geom::Point const &drag, bool asymmetric);

/// Rotate @a v to the nearest multiple of 45 degrees, keeping its length.
Geom::Point constrain_angle(Geom::Point const &v);

} // namespace Sketchpath

#endif // SKETCHPATH_HELPER_BEZIER_MATH_H

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
