// SPDX-License-Identifier: GPL-2.0-or-later
/** \file
 * Bezier drawing tool.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_TOOLS_PEN_TOOL_H
#define SKETCHPATH_UI_TOOLS_PEN_TOOL_H

#include <cstddef>
#include <optional>
#include <vector>

#include <glibmm/ustring.h>
#include <sigc++/signal.h>
#include <2geom/bezier-curve.h>
#include <2geom/point.h>

#include "helper/bezier-math.h"
#include "object/bezier-shape.h"
#include "object/shape.h"
#include "ui/widget/events/canvas-event.h"

namespace Sketchpath {
class CanvasHost;
class Preferences;
} // namespace Sketchpath

namespace Sketchpath::UI::Tools {

/**
 * Draws one new curve from pointer input.
 *
 * The first press creates the shape in the host store; every later press adds an anchor, and
 * dragging away from a fresh anchor pulls out its handles. The tool ends in COMMITTED once the
 * curve is finished or closed, or in DISCARDED when drawing is cancelled. Both are terminal: the
 * host creates a new tool for the next curve.
 */
class PenTool
{
public:
    enum State
    {
        IDLE,
        CREATING,
        COMMITTED,
        DISCARDED
    };

    enum Mode
    {
        MODE_CLICK,    ///< One anchor per click, drag to pull handles
        MODE_FREEHAND, ///< Anchors sampled along the drag and smoothed
    };

    PenTool(CanvasHost &host, Preferences const &prefs);
    ~PenTool();

    PenTool(PenTool const &) = delete;
    PenTool &operator=(PenTool const &) = delete;

    bool root_handler(CanvasEvent const &event);

    State state() const { return _state; }
    Mode mode() const { return _mode; }
    std::optional<ShapeId> shapeId() const { return _shape_id; }

    /// Anchors of the curve being drawn, in document coordinates.
    std::vector<CurvePoint> const &points() const { return _points; }

    /// Rubber band from the last anchor to the pointer, or to the first anchor when snapped.
    std::optional<Geom::LineSegment> previewSegment() const;
    bool snappedToStart() const { return _snapped; }

    sigc::signal<void (Glib::ustring const &)> &signal_status() { return _signal_status; }
    sigc::signal<void (ShapeId)> &signal_finished() { return _signal_finished; }
    sigc::signal<void ()> &signal_cancelled() { return _signal_cancelled; }

private:
    bool _handleButtonPress(ButtonPressEvent const &event);
    bool _handle2ButtonPress(ButtonPressEvent const &event);
    bool _handleMotionNotify(MotionEvent const &event);
    bool _handleButtonRelease(ButtonReleaseEvent const &event);
    bool _handleKeyPress(KeyPressEvent const &event);

    void _startCurve(Geom::Point const &p);
    void _appendPoint(Geom::Point const &p);
    void _dragHandles(Geom::Point const &p, CanvasEvent const &event);
    void _sampleFreehand(Geom::Point const &p);
    void _updateSnap(Geom::Point const &p);
    bool _nearStart(Geom::Point const &p) const;
    bool _undoLastPoint();

    void _finish(bool closed);
    void _cancel();
    void _publish(bool edit_mode);
    void _setStatus(Glib::ustring const &message);

    CanvasHost &_host;
    HitThresholds _thresholds;
    Mode _mode = MODE_CLICK;
    double _smoothing;
    double _sample_spacing;

    State _state = IDLE;
    std::optional<ShapeId> _shape_id;
    std::vector<CurvePoint> _points;
    bool _closed = false;

    bool _dragging = false;
    Geom::Point _drag_origin;
    std::optional<Geom::Point> _pointer;
    bool _snapped = false;
    Geom::Point _snap_origin;

    sigc::signal<void (Glib::ustring const &)> _signal_status;
    sigc::signal<void (ShapeId)> _signal_finished;
    sigc::signal<void ()> _signal_cancelled;
};

} // namespace Sketchpath::UI::Tools

#endif // SKETCHPATH_UI_TOOLS_PEN_TOOL_H

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
