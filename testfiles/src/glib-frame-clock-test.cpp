// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for the GLib timeout frame clock.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/desktop/glib-frame-clock.h"

#include <glib.h>
#include <glibmm/init.h>
#include <glibmm/main.h>
#include <gtest/gtest.h>

using namespace Sketchpath;

TEST(GlibFrameClockTest, ZeroIntervalIsRaised)
{
    EXPECT_EQ(GlibFrameClock(0).interval(), 1u);
    EXPECT_EQ(GlibFrameClock().interval(), 16u);
}

TEST(GlibFrameClockTest, RunsUntilSlotDeclines)
{
    Glib::init();
    GlibFrameClock clock(1);
    auto context = Glib::MainContext::get_default();

    int frames = 0;
    auto connection = clock.connectFrame([&] { return ++frames < 3; });
    for (int i = 0; i < 1000 && frames < 3; ++i) {
        context->iteration(true);
    }
    ASSERT_EQ(frames, 3);

    g_usleep(5000);
    while (context->iteration(false)) {
    }
    EXPECT_EQ(frames, 3);
}

TEST(GlibFrameClockTest, DisconnectStopsFrames)
{
    Glib::init();
    GlibFrameClock clock(1);
    auto context = Glib::MainContext::get_default();

    int frames = 0;
    auto connection = clock.connectFrame([&] {
        ++frames;
        return true;
    });
    connection.disconnect();

    g_usleep(5000);
    while (context->iteration(false)) {
    }
    EXPECT_EQ(frames, 0);
}

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
