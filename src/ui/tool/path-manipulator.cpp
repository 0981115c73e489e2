// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tool/path-manipulator.h"

#include <algorithm>
#include <utility>

#include <gdk/gdkkeysyms.h>
#include <glib.h>
#include <sigc++/functors/mem_fun.h>

#include "document/shape-store.h"
#include "preferences.h"
#include "ui/desktop/canvas-host.h"

namespace Sketchpath {
namespace UI {

PathManipulator::PathManipulator(CanvasHost &host, Preferences const &prefs, ShapeId id)
    : _host(host)
    , _id(id)
    , _thresholds(HitThresholds::from_preferences(prefs))
    , _smoothing(prefs.getDoubleLimited("/tools/bezier/smoothing", 0.3, 0.0, 1.0))
    , _hover_point(host, id, _thresholds)
{
    auto &store = _host.shapes();
    _changed_connection = store.signal_changed().connect(sigc::mem_fun(*this, &PathManipulator::_onShapeChanged));
    _removed_connection = store.signal_removed().connect(sigc::mem_fun(*this, &PathManipulator::_onShapeRemoved));
}

PathManipulator::~PathManipulator() = default;

bool PathManipulator::begin()
{
    auto shape = _shape();
    if (!shape) {
        g_warning("PathManipulator: shape %" G_GUINT64_FORMAT " is not a Bezier curve", _id);
        return false;
    }

    _active = true;
    if (!shape->edit_mode) {
        shape->edit_mode = true;
        _commit(std::move(*shape));
    }
    g_debug("PathManipulator: editing shape %" G_GUINT64_FORMAT, _id);
    _hover_point.wake();
    return true;
}

/**
 * Leave edit mode in a single store update, dropping the preview and point selection with it.
 */
void PathManipulator::exit()
{
    if (!_active) {
        return;
    }
    _deactivate();

    if (auto shape = _shape()) {
        shape->edit_mode = false;
        shape->hover.reset();
        shape->selection.clear();
        _commit(std::move(*shape));
    }

    _host.select(_id);
    _signal_exited.emit();
    _host.setCurrentTool(ToolType::SELECT);
}

bool PathManipulator::event(CanvasEvent const &event)
{
    if (!_active) {
        return false;
    }

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
        [&](KeyPressEvent const &event) { ret = _handleKeyPress(event); }, [&](CanvasEvent const &event) {});
    return ret;
}

std::vector<Handle> PathManipulator::handles() const
{
    if (auto shape = _shape()) {
        return project_handles(*shape);
    }
    return {};
}

bool PathManipulator::moveHandle(std::string_view handle_id, Geom::Point const &position)
{
    if (!_active) {
        return false;
    }
    auto shape = _shape();
    if (!shape) {
        return false;
    }

    auto moved = apply_handle_move(*shape, handle_id, position - shape->position);
    if (moved == *shape) {
        return false;
    }
    _commit(std::move(moved));
    return true;
}

bool PathManipulator::_handleButtonPress(ButtonPressEvent const &event)
{
    if (event.button != 1) {
        return false;
    }
    auto shape = _shape();
    if (!shape) {
        return false;
    }

    auto const local = event.pos - shape->position;
    double const zoom = _host.zoom();
    auto const hover = shape->hover;
    shape->hover.reset();
    auto const inserted = std::exchange(_inserted, std::nullopt);

    // Anchor: select it and leave the drag to the host.
    if (auto const index = find_anchor(shape->points, local, zoom, _thresholds.anchor)) {
        if (inserted == index) {
            _inserted = inserted;
        }
        auto &selection = shape->selection;
        auto const it = std::find(selection.begin(), selection.end(), *index);
        if (held_shift(event)) {
            if (it != selection.end()) {
                selection.erase(it);
            } else {
                selection.push_back(*index);
            }
        } else if (it == selection.end()) {
            selection.assign(1, *index);
        }
        _commit(std::move(*shape));
        return false;
    }

    // Control points are dragged by the host as well.
    if (find_control(shape->points, local, zoom, _thresholds.anchor)) {
        _commit(std::move(*shape));
        return false;
    }

    if (hover && Geom::distance(local, hover->point) < _thresholds.hover_click / zoom) {
        _commit(insert_point(std::move(*shape), hover->segment, CurvePoint(hover->point)));
        _inserted = hover->segment + 1;
        return true;
    }

    if (auto const hit = nearest_segment(shape->points, shape->closed, local, zoom, _thresholds)) {
        _commit(insert_point(std::move(*shape), hit->index, CurvePoint(local)));
        _inserted = hit->index + 1;
        return true;
    }

    if (!page_bounds(*shape).contains(event.pos)) {
        exit();
        return false;
    }

    shape->selection.clear();
    _commit(std::move(*shape));
    return false;
}

bool PathManipulator::_handle2ButtonPress(ButtonPressEvent const &event)
{
    if (event.button != 1) {
        return false;
    }
    auto shape = _shape();
    if (!shape) {
        return false;
    }

    auto const local = event.pos - shape->position;
    auto const index = find_anchor(shape->points, local, _host.zoom(), _thresholds.anchor);
    if (!index) {
        return false;
    }
    // the first press of this double click put the point there
    if (std::exchange(_inserted, std::nullopt) == index) {
        return true;
    }

    if (held_ctrl(event)) {
        _commit(toggle_point_type(std::move(*shape), *index, _smoothing));
        return true;
    }

    try {
        _commit(remove_point(*shape, *index));
    } catch (MinimumPointsViolation const &e) {
        g_debug("PathManipulator: point not removed: %s", e.what());
    }
    return true;
}

bool PathManipulator::_handleMotionNotify(MotionEvent const &event)
{
    if (held_alt(event)) {
        _hover_point.wake();
    }
    return false;
}

bool PathManipulator::_handleKeyPress(KeyPressEvent const &event)
{
    bool ret = false;
    switch (event.keyval) {
        case GDK_KEY_Escape:
        case GDK_KEY_Return:
        case GDK_KEY_KP_Enter:
            exit();
            ret = true;
            break;
        case GDK_KEY_Delete:
        case GDK_KEY_KP_Delete:
        case GDK_KEY_BackSpace:
            if (auto shape = _shape()) {
                ret = _removeSelected(*shape);
            }
            break;
        case GDK_KEY_Alt_L:
        case GDK_KEY_Alt_R:
        case GDK_KEY_Meta_L:
        case GDK_KEY_Meta_R:
            _hover_point.wake();
            break;
        default:
            break;
    }
    return ret;
}

bool PathManipulator::_removeSelected(BezierShape const &shape)
{
    if (shape.selection.empty()) {
        return false;
    }
    try {
        _commit(remove_points(shape, shape.selection));
    } catch (MinimumPointsViolation const &e) {
        g_debug("PathManipulator: selection not removed: %s", e.what());
    }
    return true;
}

std::optional<BezierShape> PathManipulator::_shape() const
{
    return _host.shapes().getAs<BezierShape>(_id);
}

void PathManipulator::_commit(BezierShape shape)
{
    _host.shapes().update(_id, std::move(shape));
}

void PathManipulator::_deactivate()
{
    _active = false;
    _inserted.reset();
    _hover_point.stop(false);
}

void PathManipulator::_onShapeChanged(ShapeId id)
{
    if (id != _id || !_active) {
        return;
    }
    auto const shape = _shape();
    if (!shape || !shape->edit_mode) {
        g_debug("PathManipulator: edit mode of shape %" G_GUINT64_FORMAT " ended elsewhere", _id);
        _deactivate();
        _hover_point.stop(true);
        _signal_exited.emit();
    }
}

void PathManipulator::_onShapeRemoved(ShapeId id)
{
    if (id != _id || !_active) {
        return;
    }
    _deactivate();
    _signal_exited.emit();
}

} // namespace UI
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
