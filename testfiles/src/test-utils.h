// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Shared test header: geometry assertions and an in-memory canvas host
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_TEST_UTILS_H
#define SKETCHPATH_TEST_UTILS_H

#include <cmath>
#include <list>
#include <optional>
#include <gtest/gtest.h>

#include <gdk/gdk.h>
#include <sigc++/connection.h>
#include <sigc++/functors/slot.h>
#include <2geom/point.h>

#include "document/shape-store.h"
#include "ui/desktop/canvas-host.h"
#include "ui/desktop/canvas-transform.h"
#include "ui/widget/events/canvas-event.h"

namespace {

inline static ::testing::AssertionResult IsNear(double a, double b, double epsilon = 0.01)
{
    if (std::fabs(a - b) < epsilon) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << a << " != " << b;
}

inline static ::testing::AssertionResult PointIsNear(Geom::Point const &a, Geom::Point const &b,
                                                     double epsilon = 1e-9)
{
    if (Geom::distance(a, b) <= epsilon) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << "(" << a.x() << ", " << a.y() << ") != (" << b.x() << ", " << b.y()
                                         << ")";
}

/**
 * Frame clock advanced by hand. Slots returning false are dropped.
 */
class ManualFrameClock : public Sketchpath::FrameClock
{
public:
    sigc::connection connectFrame(sigc::slot<bool ()> const &slot) override
    {
        _slots.push_back(slot);
        return sigc::connection(_slots.back());
    }

    void tick(int frames = 1)
    {
        for (int i = 0; i < frames; ++i) {
            for (auto it = _slots.begin(); it != _slots.end();) {
                if (it->blocked() || it->empty() || !(*it)()) {
                    it = _slots.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    std::size_t pending() const
    {
        std::size_t count = 0;
        for (auto const &slot : _slots) {
            if (!slot.empty()) {
                ++count;
            }
        }
        return count;
    }

private:
    std::list<sigc::slot<bool ()>> _slots;
};

/**
 * Canvas host backed by an in-memory store. Tests drive the input state directly.
 */
class TestCanvasHost : public Sketchpath::CanvasHost
{
public:
    Sketchpath::ShapeStore &shapes() override { return store; }
    Sketchpath::CanvasTransform const &transform() const override { return camera; }
    Sketchpath::InputState const &inputs() const override { return input; }
    Sketchpath::FrameClock &frameClock() override { return clock; }

    Sketchpath::ToolType currentTool() const override { return tool; }
    void setCurrentTool(Sketchpath::ToolType t) override
    {
        tool = t;
        ++tool_switches;
    }

    void select(std::optional<Sketchpath::ShapeId> id) override { selected = id; }

    void setZoom(double zoom) { camera.setZoom(zoom); }

    Sketchpath::ShapeStore store;
    Sketchpath::CanvasTransform camera;
    Sketchpath::InputState input;
    ManualFrameClock clock;
    Sketchpath::ToolType tool = Sketchpath::ToolType::SELECT;
    int tool_switches = 0;
    std::optional<Sketchpath::ShapeId> selected;
};

inline Sketchpath::ButtonPressEvent press(Geom::Point const &pos, int num_press = 1, unsigned modifiers = 0)
{
    Sketchpath::ButtonPressEvent event;
    event.pos = pos;
    event.num_press = num_press;
    event.modifiers = modifiers;
    return event;
}

inline Sketchpath::ButtonReleaseEvent release(Geom::Point const &pos, unsigned modifiers = 0)
{
    Sketchpath::ButtonReleaseEvent event;
    event.pos = pos;
    event.modifiers = modifiers;
    return event;
}

inline Sketchpath::MotionEvent motion(Geom::Point const &pos, unsigned modifiers = 0)
{
    Sketchpath::MotionEvent event;
    event.pos = pos;
    event.modifiers = modifiers;
    return event;
}

inline Sketchpath::KeyPressEvent key(unsigned keyval, unsigned modifiers = 0)
{
    Sketchpath::KeyPressEvent event;
    event.keyval = keyval;
    event.modifiers = modifiers;
    return event;
}

} // namespace

#endif // SKETCHPATH_TEST_UTILS_H
/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
