// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * What the curve tools need from the editor that embeds them.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_DESKTOP_CANVAS_HOST_H
#define SKETCHPATH_UI_DESKTOP_CANVAS_HOST_H

#include <optional>

#include <sigc++/connection.h>
#include <sigc++/functors/slot.h>
#include <2geom/point.h>

#include "object/shape.h"
#include "ui/desktop/canvas-transform.h"

namespace Sketchpath {

class ShapeStore;

enum class ToolType
{
    SELECT, ///< Default pointer tool
    PEN,    ///< Bezier drawing tool
};

/// Pointer and keyboard state sampled by the host.
struct InputState
{
    Geom::Point pointer;     ///< Last pointer position, document coordinates
    unsigned modifiers = 0;  ///< GDK modifier mask
    bool dragging = false;   ///< A drag gesture is in progress
    bool pointing = false;   ///< A button is held without a drag yet
};

/**
 * Source of per-frame callbacks.
 *
 * The slot is invoked once per frame until it returns false or the connection is broken.
 */
class FrameClock
{
public:
    virtual ~FrameClock() = default;
    virtual sigc::connection connectFrame(sigc::slot<bool ()> const &slot) = 0;
};

class CanvasHost
{
public:
    virtual ~CanvasHost() = default;

    virtual ShapeStore &shapes() = 0;
    virtual CanvasTransform const &transform() const = 0;
    virtual InputState const &inputs() const = 0;
    virtual FrameClock &frameClock() = 0;

    virtual ToolType currentTool() const = 0;
    virtual void setCurrentTool(ToolType tool) = 0;

    /// Make @a id the only selected shape, or clear the selection.
    virtual void select(std::optional<ShapeId> id) = 0;

    double zoom() const { return transform().getZoom(); }
};

} // namespace Sketchpath

#endif // SKETCHPATH_UI_DESKTOP_CANVAS_HOST_H
