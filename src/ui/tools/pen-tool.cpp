// SPDX-License-Identifier: GPL-2.0-or-later
/** \file
 * Bezier drawing tool implementation.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tools/pen-tool.h"

#include <gdk/gdkkeysyms.h>
#include <glib/gi18n.h>

#include "document/shape-store.h"
#include "preferences.h"
#include "ui/desktop/canvas-host.h"

namespace Sketchpath::UI::Tools {

PenTool::PenTool(CanvasHost &host, Preferences const &prefs)
    : _host(host)
    , _thresholds(HitThresholds::from_preferences(prefs))
    , _smoothing(prefs.getDoubleLimited("/tools/bezier/smoothing", 0.3, 0.0, 1.0))
    , _sample_spacing(prefs.getDoubleLimited("/tools/bezier/freehand-spacing", 8.0, 1.0, 100.0))
{
    if (prefs.getString("/tools/bezier/mode", "click") == "freehand") {
        _mode = MODE_FREEHAND;
    }
}

PenTool::~PenTool()
{
    if (_state != CREATING || !_shape_id) {
        return;
    }
    // switching away mid-drawing keeps whatever is a valid curve
    if (_points.size() >= MIN_CURVE_POINTS) {
        _publish(false);
    } else {
        _host.shapes().remove(*_shape_id);
    }
}

/**
 * Callback to handle all pen events.
 */
bool PenTool::root_handler(CanvasEvent const &event)
{
    bool ret = false;

    inspect_event(
        event,
        [&](ButtonPressEvent const &event) {
            if (event.num_press == 1) {
                ret = _handleButtonPress(event);
            } else if (event.num_press == 2) {
                ret = _handle2ButtonPress(event);
            }
        },
        [&](MotionEvent const &event) { ret = _handleMotionNotify(event); },
        [&](ButtonReleaseEvent const &event) { ret = _handleButtonRelease(event); },
        [&](KeyPressEvent const &event) { ret = _handleKeyPress(event); }, [&](CanvasEvent const &event) {});

    return ret;
}

std::optional<Geom::LineSegment> PenTool::previewSegment() const
{
    if (_state != CREATING || _dragging || _points.empty() || !_pointer) {
        return {};
    }
    auto const end = _snapped ? _points.front().position : *_pointer;
    return Geom::LineSegment(_points.back().position, end);
}

/**
 * Handle mouse single button press event.
 */
bool PenTool::_handleButtonPress(ButtonPressEvent const &event)
{
    if (event.button != 1) {
        return false;
    }

    auto const p = event.pos;
    _pointer = p;

    switch (_state) {
        case IDLE:
            _startCurve(p);
            return true;

        case CREATING:
            if (_points.size() >= MIN_CLOSED_CURVE_POINTS && (_snapped || _nearStart(p))) {
                _finish(true);
            } else {
                _appendPoint(p);
            }
            return true;

        case COMMITTED:
        case DISCARDED:
        default:
            return false;
    }
}

/**
 * Handle mouse double button press event.
 */
bool PenTool::_handle2ButtonPress(ButtonPressEvent const &event)
{
    if (event.button != 1 || _state != CREATING) {
        return false;
    }
    // the first press of the double click already placed an anchor on top of the previous one
    auto const n = _points.size();
    if (n > MIN_CURVE_POINTS &&
        Geom::distance(_points[n - 1].position, _points[n - 2].position) < _thresholds.anchor / _host.zoom()) {
        _points.pop_back();
    }
    _finish(false);
    return true;
}

bool PenTool::_handleMotionNotify(MotionEvent const &event)
{
    auto const p = event.pos;
    _pointer = p;

    if (_state != CREATING) {
        return false;
    }

    if (_dragging) {
        if (_mode == MODE_FREEHAND) {
            _sampleFreehand(p);
        } else {
            _dragHandles(p, event);
        }
        return true;
    }

    _updateSnap(p);
    return true;
}

bool PenTool::_handleButtonRelease(ButtonReleaseEvent const &event)
{
    if (event.button != 1 || !_dragging) {
        return false;
    }
    _dragging = false;
    _pointer = event.pos;
    return true;
}

bool PenTool::_handleKeyPress(KeyPressEvent const &event)
{
    if (_state != CREATING) {
        return false;
    }

    bool ret = false;
    switch (event.keyval) {
        case GDK_KEY_Return:
        case GDK_KEY_KP_Enter:
            _finish(mod_shift_only(event));
            ret = true;
            break;
        case GDK_KEY_Escape:
            _cancel();
            ret = true;
            break;
        case GDK_KEY_c:
        case GDK_KEY_C:
            if (!held_ctrl(event) && _points.size() >= MIN_CLOSED_CURVE_POINTS) {
                _finish(true);
                ret = true;
            }
            break;
        case GDK_KEY_BackSpace:
        case GDK_KEY_Delete:
        case GDK_KEY_KP_Delete:
            ret = _undoLastPoint();
            break;
        default:
            break;
    }
    return ret;
}

void PenTool::_startCurve(Geom::Point const &p)
{
    _points.assign(1, CurvePoint(p));
    _closed = false;
    _state = CREATING;
    _dragging = true;
    _drag_origin = p;
    _snapped = false;
    _publish(true);

    g_debug("PenTool: started curve %" G_GUINT64_FORMAT " at (%g, %g)", *_shape_id, p.x(), p.y());
    _setStatus(_("<b>Click</b> or <b>click and drag</b> to continue the path. "
                 "<b>Double click</b> or <b>Enter</b> to finish, <b>Esc</b> to cancel."));
}

void PenTool::_appendPoint(Geom::Point const &p)
{
    _points.emplace_back(p);
    _dragging = true;
    _drag_origin = p;
    _snapped = false;
    _publish(true);
}

/**
 * Pull handles out of the anchor placed by the current press.
 *
 * Drags shorter than the corner tolerance leave a corner point. Shift snaps the handle angle,
 * Alt sets the outgoing handle only.
 */
void PenTool::_dragHandles(Geom::Point const &p, CanvasEvent const &event)
{
    auto &point = _points.back();
    auto drag = p - _drag_origin;

    if (Geom::L2(drag) * _host.zoom() <= _thresholds.corner_drag) {
        point.in_handle.reset();
        point.out_handle.reset();
    } else {
        if (held_shift(event)) {
            drag = constrain_angle(drag);
        }
        auto const handles = handles_from_drag(point.position, drag, held_alt(event));
        point.in_handle = handles.in;
        point.out_handle = handles.out;
        _setStatus(_("<b>Curve handle</b>: <b>Shift</b> to snap angle, "
                     "<b>Alt</b> to move the outgoing handle only"));
    }
    _publish(true);
}

void PenTool::_sampleFreehand(Geom::Point const &p)
{
    if (Geom::distance(p, _points.back().position) * _host.zoom() < _sample_spacing) {
        return;
    }
    _points.emplace_back(p);

    auto const n = _points.size();
    auto smooth = [&](std::size_t i) {
        std::optional<Geom::Point> prev, next;
        if (i > 0) {
            prev = _points[i - 1].position;
        }
        if (i + 1 < n) {
            next = _points[i + 1].position;
        }
        auto const handles = synthesize_handles(prev, _points[i].position, next, _smoothing);
        _points[i].in_handle = handles.in;
        _points[i].out_handle = handles.out;
    };
    smooth(n - 2);
    smooth(n - 1);
    _publish(true);
}

void PenTool::_updateSnap(Geom::Point const &p)
{
    if (_points.size() < MIN_CLOSED_CURVE_POINTS) {
        _snapped = false;
        return;
    }

    double const zoom = _host.zoom();
    if (!_snapped) {
        if (Geom::distance(p, _points.front().position) * zoom < _thresholds.snap_to_start) {
            _snapped = true;
            _snap_origin = p;
            _setStatus(_("<b>Click</b> to close and finish the path."));
        }
    } else if (Geom::distance(p, _snap_origin) * zoom > _thresholds.snap_release) {
        // measured from where the snap engaged
        _snapped = false;
    }
}

bool PenTool::_nearStart(Geom::Point const &p) const
{
    return Geom::distance(p, _points.front().position) < _thresholds.close_curve / _host.zoom();
}

bool PenTool::_undoLastPoint()
{
    if (_points.size() <= 1) {
        _cancel();
        return true;
    }
    _points.pop_back();
    _dragging = false;
    _snapped = false;
    _publish(true);
    return true;
}

/**
 * Write the final curve and hand control back to the select tool.
 *
 * The host may destroy this tool when the tool changes, so that happens last.
 */
void PenTool::_finish(bool closed)
{
    if (_state != CREATING) {
        return;
    }
    if (_points.size() < MIN_CURVE_POINTS) {
        _cancel();
        return;
    }

    _dragging = false;
    _snapped = false;
    _closed = closed && _points.size() >= MIN_CLOSED_CURVE_POINTS;
    _publish(false);
    _state = COMMITTED;

    auto const id = *_shape_id;
    g_debug("PenTool: finished curve %" G_GUINT64_FORMAT " with %zu points%s", id, _points.size(),
            _closed ? " (closed)" : "");
    _setStatus(_closed ? _("Path closed") : _("Path finished"));
    _host.select(id);
    _signal_finished.emit(id);
    _host.setCurrentTool(ToolType::SELECT);
}

void PenTool::_cancel()
{
    if (_shape_id) {
        _host.shapes().remove(*_shape_id);
    }
    _shape_id.reset();
    _points.clear();
    _dragging = false;
    _snapped = false;
    _state = DISCARDED;

    _setStatus(_("Drawing cancelled"));
    _signal_cancelled.emit();
    _host.setCurrentTool(ToolType::SELECT);
}

/// Submit the current points to the store as one normalized record.
void PenTool::_publish(bool edit_mode)
{
    BezierShape shape;
    shape.points = _points;
    shape.closed = _closed;
    shape.edit_mode = edit_mode;
    shape = normalize(std::move(shape));

    auto &store = _host.shapes();
    if (!_shape_id) {
        _shape_id = store.add(std::move(shape));
    } else {
        store.update(*_shape_id, std::move(shape));
    }
}

void PenTool::_setStatus(Glib::ustring const &message)
{
    _signal_status.emit(message);
}

} // namespace Sketchpath::UI::Tools

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
