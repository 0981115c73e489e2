// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Input events delivered by the host canvas to the curve tools.
 *
 * Pointer positions are in document coordinates; the host has already removed pan and zoom.
 * Key values and modifier masks are GDK's.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_WIDGET_EVENTS_CANVAS_EVENT_H
#define SKETCHPATH_UI_WIDGET_EVENTS_CANVAS_EVENT_H

#include <utility>

#include <gdk/gdk.h>
#include <2geom/point.h>

#include "util/variant-visitor.h"

namespace Sketchpath {

enum class EventType
{
    BUTTON_PRESS,
    BUTTON_RELEASE,
    MOTION,
    KEY_PRESS,
    KEY_RELEASE,
};

struct CanvasEvent
{
    virtual ~CanvasEvent() = default;
    virtual EventType type() const = 0;

    /// Modifier state at the time of the event (GDK_SHIFT_MASK, GDK_CONTROL_MASK, ...).
    unsigned modifiers = 0;
};

struct ButtonPressEvent final : CanvasEvent
{
    EventType type() const override { return EventType::BUTTON_PRESS; }

    Geom::Point pos;
    unsigned button = 1;
    /// 1 for a single click, 2 for the second press of a double click.
    int num_press = 1;
};

struct ButtonReleaseEvent final : CanvasEvent
{
    EventType type() const override { return EventType::BUTTON_RELEASE; }

    Geom::Point pos;
    unsigned button = 1;
};

struct MotionEvent final : CanvasEvent
{
    EventType type() const override { return EventType::MOTION; }

    Geom::Point pos;
};

struct KeyEvent : CanvasEvent
{
    unsigned keyval = 0;
};

struct KeyPressEvent final : KeyEvent
{
    EventType type() const override { return EventType::KEY_PRESS; }
};

struct KeyReleaseEvent final : KeyEvent
{
    EventType type() const override { return EventType::KEY_RELEASE; }
};

inline bool held_shift(CanvasEvent const &event) { return event.modifiers & GDK_SHIFT_MASK; }
inline bool held_ctrl(CanvasEvent const &event) { return event.modifiers & GDK_CONTROL_MASK; }
inline bool held_alt(CanvasEvent const &event) { return event.modifiers & GDK_ALT_MASK; }
inline bool held_button1(CanvasEvent const &event) { return event.modifiers & GDK_BUTTON1_MASK; }

inline bool mod_shift_only(CanvasEvent const &event)
{
    return (event.modifiers & (GDK_SHIFT_MASK | GDK_CONTROL_MASK | GDK_ALT_MASK)) == GDK_SHIFT_MASK;
}

/**
 * Call the first of @a funcs that accepts the concrete event type.
 * Pass a trailing handler taking CanvasEvent const & to ignore the remaining types.
 */
template <typename... Fs>
void inspect_event(CanvasEvent const &event, Fs &&...funcs)
{
    auto visitor = VariantVisitor{std::forward<Fs>(funcs)...};

    switch (event.type()) {
        case EventType::BUTTON_PRESS:
            visitor(static_cast<ButtonPressEvent const &>(event));
            break;
        case EventType::BUTTON_RELEASE:
            visitor(static_cast<ButtonReleaseEvent const &>(event));
            break;
        case EventType::MOTION:
            visitor(static_cast<MotionEvent const &>(event));
            break;
        case EventType::KEY_PRESS:
            visitor(static_cast<KeyPressEvent const &>(event));
            break;
        case EventType::KEY_RELEASE:
            visitor(static_cast<KeyReleaseEvent const &>(event));
            break;
    }
}

} // namespace Sketchpath

#endif // SKETCHPATH_UI_WIDGET_EVENTS_CANVAS_EVENT_H
