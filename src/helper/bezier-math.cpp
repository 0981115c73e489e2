// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "helper/bezier-math.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glib.h>
#include <2geom/bezier-curve.h>
#include <2geom/coord.h>

#include "preferences.h"

namespace Sketchpath {

HitThresholds HitThresholds::from_preferences(Preferences const &prefs)
{
    HitThresholds const defaults;
    HitThresholds result;
    result.anchor = prefs.getDoubleLimited("/tools/bezier/hit/anchor", defaults.anchor, 1, 100);
    result.segment = prefs.getDoubleLimited("/tools/bezier/hit/segment", defaults.segment, 1, 100);
    result.anchor_exclusion =
        prefs.getDoubleLimited("/tools/bezier/hit/anchor-exclusion", defaults.anchor_exclusion, 0, 100);
    result.close_curve = prefs.getDoubleLimited("/tools/bezier/hit/close", defaults.close_curve, 1, 100);
    result.snap_to_start =
        prefs.getDoubleLimited("/tools/bezier/hit/snap-to-start", defaults.snap_to_start, 0, 100);
    result.snap_release =
        prefs.getDoubleLimited("/tools/bezier/hit/snap-release", defaults.snap_release, 0, 100);
    result.hover_click = prefs.getDoubleLimited("/tools/bezier/hit/hover-click", defaults.hover_click, 0, 100);
    result.corner_drag = prefs.getDoubleLimited("/tools/bezier/hit/corner-drag", defaults.corner_drag, 0, 100);

    // leaving the snap radius must be harder than entering it
    result.snap_release = std::max(result.snap_release, result.snap_to_start);
    return result;
}

UI::SegmentType segment_type(CurvePoint const &p1, CurvePoint const &p2)
{
    if (p1.out_handle && p2.in_handle) {
        return UI::SEGMENT_CUBIC_BEZIER;
    }
    if (p1.out_handle || p2.in_handle) {
        return UI::SEGMENT_QUADRATIC_BEZIER;
    }
    return UI::SEGMENT_STRAIGHT;
}

std::unique_ptr<Geom::Curve> make_segment(CurvePoint const &p1, CurvePoint const &p2)
{
    switch (segment_type(p1, p2)) {
        case UI::SEGMENT_CUBIC_BEZIER:
            return std::make_unique<Geom::CubicBezier>(p1.position, *p1.out_handle, *p2.in_handle, p2.position);

        case UI::SEGMENT_QUADRATIC_BEZIER: {
            auto const control = p1.out_handle ? *p1.out_handle : *p2.in_handle;
            return std::make_unique<Geom::QuadraticBezier>(p1.position, control, p2.position);
        }

        case UI::SEGMENT_STRAIGHT:
        default:
            return std::make_unique<Geom::LineSegment>(p1.position, p2.position);
    }
}

Geom::Point point_on_segment(CurvePoint const &p1, CurvePoint const &p2, double t)
{
    return make_segment(p1, p2)->pointAt(std::clamp(t, 0.0, 1.0));
}

double chord_time(Geom::Point const &point, Geom::Point const &a, Geom::Point const &b)
{
    auto const chord = b - a;
    auto const length_sq = Geom::dot(chord, chord);
    if (length_sq == 0.0) {
        return 0.0;
    }
    return std::clamp(Geom::dot(point - a, chord) / length_sq, 0.0, 1.0);
}

double distance_to_segment(Geom::Point const &point, CurvePoint const &p1, CurvePoint const &p2)
{
    auto const &a = p1.position;
    auto const &b = p2.position;
    double const t = chord_time(point, a, b);
    return Geom::distance(point, a + (b - a) * t);
}

std::optional<std::size_t> find_anchor(std::span<CurvePoint const> points, Geom::Point const &query,
                                       double zoom, double threshold)
{
    g_return_val_if_fail(zoom > 0, std::nullopt);

    double const radius = threshold / zoom;
    std::optional<std::size_t> found;
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < points.size(); ++i) {
        double const d = Geom::distance(points[i].position, query);
        if (d < radius && d < best) {
            best = d;
            found = i;
        }
    }
    return found;
}

std::optional<ControlHit> find_control(std::span<CurvePoint const> points, Geom::Point const &query,
                                       double zoom, double threshold)
{
    g_return_val_if_fail(zoom > 0, std::nullopt);

    double const radius = threshold / zoom;
    std::optional<ControlHit> found;
    double best = std::numeric_limits<double>::infinity();
    auto check = [&](std::optional<Geom::Point> const &handle, std::size_t index, UI::HandleRole role) {
        if (!handle) {
            return;
        }
        double const d = Geom::distance(*handle, query);
        if (d < radius && d < best) {
            best = d;
            found = ControlHit{index, role};
        }
    };
    for (std::size_t i = 0; i < points.size(); ++i) {
        check(points[i].in_handle, i, UI::HandleRole::CONTROL_IN);
        check(points[i].out_handle, i, UI::HandleRole::CONTROL_OUT);
    }
    return found;
}

std::optional<SegmentHit> nearest_segment(std::span<CurvePoint const> points, bool closed,
                                          Geom::Point const &query, double zoom,
                                          HitThresholds const &thresholds)
{
    g_return_val_if_fail(zoom > 0, std::nullopt);

    auto const n = points.size();
    if (n < MIN_CURVE_POINTS) {
        return {};
    }
    // anchors win over the segments running through them
    if (find_anchor(points, query, zoom, thresholds.anchor_exclusion)) {
        return {};
    }

    std::size_t const count = (closed && n >= MIN_CLOSED_CURVE_POINTS) ? n : n - 1;
    std::optional<std::size_t> best_index;
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < count; ++i) {
        double const d = distance_to_segment(query, points[i], points[(i + 1) % n]);
        if (d < best) {
            best = d;
            best_index = i;
        }
    }

    if (!best_index || best >= thresholds.segment / zoom) {
        return {};
    }
    auto const &a = points[*best_index].position;
    auto const &b = points[(*best_index + 1) % n].position;
    return SegmentHit{*best_index, chord_time(query, a, b)};
}

HandlePair synthesize_handles(std::optional<Geom::Point> const &prev, Geom::Point const &current,
                              std::optional<Geom::Point> const &next, double smoothing)
{
    HandlePair result;
    if (!prev && !next) {
        return result;
    }
    smoothing = std::clamp(smoothing, 0.0, 1.0);

    auto const tangent = next.value_or(current) - prev.value_or(current);
    double const length = Geom::L2(tangent);
    if (length < Geom::EPSILON) {
        g_debug("synthesize_handles: degenerate tangent at (%g, %g)", current.x(), current.y());
        if (prev) {
            result.in = current;
        }
        if (next) {
            result.out = current;
        }
        return result;
    }

    auto const direction = tangent / length;
    if (prev) {
        result.in = current - direction * (Geom::distance(current, *prev) * smoothing);
    }
    if (next) {
        result.out = current + direction * (Geom::distance(*next, current) * smoothing);
    }
    return result;
}

HandlePair handles_from_drag(Geom::Point const &anchor, Geom::Point const &drag, bool asymmetric)
{
    HandlePair result;
    result.out = anchor + drag;
    if (!asymmetric) {
        result.in = anchor - drag;
    }
    return result;
}

Geom::Point constrain_angle(Geom::Point const &v)
{
    double const length = Geom::L2(v);
    if (length == 0.0) {
        return v;
    }
    double const step = M_PI / 4;
    double const angle = std::round(std::atan2(v.y(), v.x()) / step) * step;
    return Geom::Point::polar(angle, length);
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
