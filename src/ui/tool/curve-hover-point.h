// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Insertion preview that follows the pointer along a curve in edit mode.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_TOOL_CURVE_HOVER_POINT_H
#define SKETCHPATH_UI_TOOL_CURVE_HOVER_POINT_H

#include <optional>

#include <sigc++/scoped_connection.h>

#include "helper/bezier-math.h"
#include "object/bezier-shape.h"
#include "object/shape.h"

namespace Sketchpath {
class CanvasHost;
}

namespace Sketchpath {
namespace UI {

/**
 * Polls the pointer once per frame and stores a preview marker on the curve.
 *
 * Polling only runs while the curve is in edit mode, the select tool is active and Alt is held.
 * As soon as any of these stops being true the preview is cleared and the frame callback
 * returns false; the next qualifying input event calls wake() to start it again.
 */
class CurveHoverPoint
{
public:
    CurveHoverPoint(CanvasHost &host, ShapeId id, HitThresholds const &thresholds);
    ~CurveHoverPoint();

    CurveHoverPoint(CurveHoverPoint const &) = delete;
    CurveHoverPoint &operator=(CurveHoverPoint const &) = delete;

    void wake();

    /// Stop polling. With @a clear, the stored preview is removed as well.
    void stop(bool clear = true);

    bool running() const { return _frame.connected(); }

private:
    bool _onFrame();
    bool _qualifies() const;
    void _write(std::optional<HoverPreview> const &preview);

    CanvasHost &_host;
    ShapeId _id;
    HitThresholds _thresholds;
    sigc::scoped_connection _frame;
};

} // namespace UI
} // namespace Sketchpath

#endif // SKETCHPATH_UI_TOOL_CURVE_HOVER_POINT_H

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
