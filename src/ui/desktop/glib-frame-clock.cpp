// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/desktop/glib-frame-clock.h"

#include <glibmm/main.h>

namespace Sketchpath {

GlibFrameClock::GlibFrameClock(unsigned interval_ms)
    : _interval(interval_ms > 0 ? interval_ms : 1)
{}

sigc::connection GlibFrameClock::connectFrame(sigc::slot<bool ()> const &slot)
{
    return Glib::signal_timeout().connect(slot, _interval);
}

} // namespace Sketchpath
