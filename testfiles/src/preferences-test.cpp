// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Tests for the key file backed preferences.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "preferences.h"

#include <vector>
#include <gtest/gtest.h>

using namespace Sketchpath;

class PreferencesTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(prefs.loadFromData("[tools/bezier]\n"
                                       "mode=freehand\n"
                                       "smoothing=0.45\n"
                                       "freehand-spacing=-4\n"
                                       "steps=12\n"
                                       "snap=true\n"
                                       "broken=abc\n"
                                       "\n"
                                       "[global]\n"
                                       "zoom=2.5\n"));
    }

    Preferences prefs;
};

TEST_F(PreferencesTest, ReadsTypedValues)
{
    EXPECT_EQ(prefs.getString("/tools/bezier/mode"), "freehand");
    EXPECT_DOUBLE_EQ(prefs.getDouble("/tools/bezier/smoothing"), 0.45);
    EXPECT_EQ(prefs.getInt("/tools/bezier/steps"), 12);
    EXPECT_TRUE(prefs.getBool("/tools/bezier/snap"));
    EXPECT_DOUBLE_EQ(prefs.getDouble("/zoom"), 2.5);
}

TEST_F(PreferencesTest, MissingEntriesUseDefault)
{
    EXPECT_EQ(prefs.getString("/tools/pen/mode", "click"), "click");
    EXPECT_DOUBLE_EQ(prefs.getDouble("/tools/bezier/missing", 7.0), 7.0);
    EXPECT_EQ(prefs.getInt("/nowhere/at/all", 3), 3);
    EXPECT_FALSE(prefs.getBool("/tools/bezier/missing"));
}

TEST_F(PreferencesTest, MalformedValuesUseDefault)
{
    EXPECT_DOUBLE_EQ(prefs.getDouble("/tools/bezier/broken", 1.5), 1.5);
    EXPECT_EQ(prefs.getInt("/tools/bezier/broken", 4), 4);
    EXPECT_TRUE(prefs.getBool("/tools/bezier/broken", true));
}

TEST_F(PreferencesTest, LimitedGettersRejectOutOfRange)
{
    EXPECT_DOUBLE_EQ(prefs.getDoubleLimited("/tools/bezier/smoothing", 0.3, 0.0, 1.0), 0.45);
    EXPECT_DOUBLE_EQ(prefs.getDoubleLimited("/tools/bezier/freehand-spacing", 8.0, 1.0, 100.0), 8.0);
    EXPECT_EQ(prefs.getIntLimited("/tools/bezier/steps", 5, 1, 10), 5);
    EXPECT_EQ(prefs.getIntLimited("/tools/bezier/steps", 5, 1, 20), 12);
}

TEST_F(PreferencesTest, SettersNotify)
{
    std::vector<Glib::ustring> paths;
    auto connection = prefs.signal_changed().connect([&](Glib::ustring const &path) { paths.push_back(path); });

    prefs.setDouble("/tools/bezier/smoothing", 0.6);
    prefs.setString("/tools/bezier/mode", "click");
    prefs.setInt("/tools/bezier/hit/anchor", 6);
    prefs.setBool("/tools/bezier/snap", false);

    EXPECT_DOUBLE_EQ(prefs.getDouble("/tools/bezier/smoothing"), 0.6);
    EXPECT_EQ(prefs.getString("/tools/bezier/mode"), "click");
    EXPECT_DOUBLE_EQ(prefs.getDouble("/tools/bezier/hit/anchor"), 6.0);
    EXPECT_FALSE(prefs.getBool("/tools/bezier/snap", true));
    ASSERT_EQ(paths.size(), 4u);
    EXPECT_EQ(paths[2], "/tools/bezier/hit/anchor");
    connection.disconnect();
}

TEST_F(PreferencesTest, BadDataKeepsPreviousValues)
{
    EXPECT_FALSE(prefs.loadFromData("this is [not a key file"));
    EXPECT_EQ(prefs.getString("/tools/bezier/mode"), "freehand");
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
