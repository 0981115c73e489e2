// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Frame clock driven by a GLib timeout on the default main context.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_DESKTOP_GLIB_FRAME_CLOCK_H
#define SKETCHPATH_UI_DESKTOP_GLIB_FRAME_CLOCK_H

#include "ui/desktop/canvas-host.h"

namespace Sketchpath {

class GlibFrameClock : public FrameClock
{
public:
    /// @param interval_ms Time between frames; 16 ms is roughly 60 Hz.
    explicit GlibFrameClock(unsigned interval_ms = 16);

    sigc::connection connectFrame(sigc::slot<bool ()> const &slot) override;

    unsigned interval() const { return _interval; }

private:
    unsigned _interval;
};

} // namespace Sketchpath

#endif // SKETCHPATH_UI_DESKTOP_GLIB_FRAME_CLOCK_H
