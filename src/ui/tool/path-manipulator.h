// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Point insertion and removal on a Bezier curve in edit mode.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_TOOL_PATH_MANIPULATOR_H
#define SKETCHPATH_UI_TOOL_PATH_MANIPULATOR_H

#include <optional>
#include <string_view>
#include <vector>

#include <sigc++/scoped_connection.h>
#include <sigc++/signal.h>
#include <2geom/point.h>

#include "helper/bezier-math.h"
#include "object/bezier-shape.h"
#include "object/shape.h"
#include "ui/tool/curve-hover-point.h"
#include "ui/tool/handle-projector.h"
#include "ui/widget/events/canvas-event.h"

namespace Sketchpath {
class CanvasHost;
class Preferences;
} // namespace Sketchpath

namespace Sketchpath {
namespace UI {

/**
 * Edits one committed curve while its edit mode is on.
 *
 * A click on a segment inserts a corner point, a double click on an anchor removes it, and
 * Escape or Enter leaves edit mode. Presses on anchors are not consumed so the host's handle
 * drag can take over; moves reported for those handles come back through moveHandle().
 */
class PathManipulator
{
public:
    PathManipulator(CanvasHost &host, Preferences const &prefs, ShapeId id);
    ~PathManipulator();

    PathManipulator(PathManipulator const &) = delete;
    PathManipulator &operator=(PathManipulator const &) = delete;

    /// Switch edit mode on and start handling events. False if @a id is not a Bezier curve.
    bool begin();
    void exit();

    bool active() const { return _active; }
    ShapeId shapeId() const { return _id; }

    bool event(CanvasEvent const &event);

    /// Handles in the shape's local coordinates.
    std::vector<Handle> handles() const;
    /// Apply a handle move reported by the host, @a position in document coordinates.
    bool moveHandle(std::string_view handle_id, Geom::Point const &position);

    CurveHoverPoint &hoverPoint() { return _hover_point; }

    sigc::signal<void ()> &signal_exited() { return _signal_exited; }

private:
    bool _handleButtonPress(ButtonPressEvent const &event);
    bool _handle2ButtonPress(ButtonPressEvent const &event);
    bool _handleMotionNotify(MotionEvent const &event);
    bool _handleKeyPress(KeyPressEvent const &event);

    bool _removeSelected(BezierShape const &shape);

    std::optional<BezierShape> _shape() const;
    void _commit(BezierShape shape);
    void _deactivate();

    void _onShapeChanged(ShapeId id);
    void _onShapeRemoved(ShapeId id);

    CanvasHost &_host;
    ShapeId _id;
    HitThresholds _thresholds;
    double _smoothing;
    bool _active = false;
    std::optional<std::size_t> _inserted;

    CurveHoverPoint _hover_point;
    sigc::scoped_connection _changed_connection;
    sigc::scoped_connection _removed_connection;
    sigc::signal<void ()> _signal_exited;
};

} // namespace UI
} // namespace Sketchpath

#endif // SKETCHPATH_UI_TOOL_PATH_MANIPULATOR_H

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
