// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tool/curve-hover-point.h"

#include <glib.h>
#include <sigc++/functors/mem_fun.h>

#include "document/shape-store.h"
#include "ui/desktop/canvas-host.h"
#include "ui/widget/events/canvas-event.h"

namespace Sketchpath {
namespace UI {

CurveHoverPoint::CurveHoverPoint(CanvasHost &host, ShapeId id, HitThresholds const &thresholds)
    : _host(host)
    , _id(id)
    , _thresholds(thresholds)
{}

CurveHoverPoint::~CurveHoverPoint() = default;

void CurveHoverPoint::wake()
{
    if (running() || !_qualifies()) {
        return;
    }
    _frame = _host.frameClock().connectFrame(sigc::mem_fun(*this, &CurveHoverPoint::_onFrame));
}

void CurveHoverPoint::stop(bool clear)
{
    _frame.disconnect();
    if (clear) {
        _write({});
    }
}

bool CurveHoverPoint::_qualifies() const
{
    if (_host.currentTool() != ToolType::SELECT || !(_host.inputs().modifiers & GDK_ALT_MASK)) {
        return false;
    }
    auto const shape = _host.shapes().getAs<BezierShape>(_id);
    return shape && shape->edit_mode;
}

bool CurveHoverPoint::_onFrame()
{
    if (!_qualifies()) {
        _write({});
        return false;
    }

    auto const &inputs = _host.inputs();
    if (inputs.dragging || inputs.pointing) {
        return true;
    }

    auto const shape = _host.shapes().getAs<BezierShape>(_id);
    auto const local = inputs.pointer - shape->position;
    auto const hit = nearest_segment(shape->points, shape->closed, local, _host.zoom(), _thresholds);
    if (!hit) {
        _write({});
        return true;
    }

    auto const [start, end] = segment_points(*shape, hit->index);
    _write(HoverPreview{point_on_segment(start, end, hit->t), hit->index});
    return true;
}

void CurveHoverPoint::_write(std::optional<HoverPreview> const &preview)
{
    auto shape = _host.shapes().getAs<BezierShape>(_id);
    if (!shape || shape->hover == preview) {
        return;
    }
    shape->hover = preview;
    _host.shapes().update(_id, std::move(*shape));
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
