// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file Test reading and writing SVG path data.
 */
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#include "util/svg-path-parser.h"

#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "object/bezier-shape.h"

using namespace Sketchpath;

class SvgPathParserTest : public ::testing::Test
{
public:
    std::vector<std::pair<std::string, std::vector<PathCommand>>> const svg_path_list = {
        {"M 1,2 L 4,2 L 4,8 L 1,8 z", {MoveTo{{1, 2}}, LineTo{{4, 2}}, LineTo{{4, 8}}, LineTo{{1, 8}}, ClosePath{}}},
        {"M 10,10L90 90V 10 H50", {MoveTo{{10, 10}}, LineTo{{90, 90}}, LineTo{{90, 10}}, LineTo{{50, 10}}}},
        {"M110,10l80 80v-80h-40", {MoveTo{{110, 10}}, LineTo{{190, 90}}, LineTo{{190, 10}}, LineTo{{150, 10}}}},
        {"M110,90 c20, 0 15, -80 40 ,-80s 20 80 40 80",
         {MoveTo{{110, 90}}, CurveTo{{130, 90}, {125, 10}, {150, 10}}, CurveTo{{175, 10}, {170, 90}, {190, 90}}}},
        {"M10,50Q25,25 40,50t30,0",
         {MoveTo{{10, 50}}, QuadTo{{25, 25}, {40, 50}}, QuadTo{{55, 75}, {70, 50}}}},
        {"M72,229.5 173.5,248.25", {MoveTo{{72, 229.5}}, LineTo{{173.5, 248.25}}}},
        {"M 157e-1,17e-1l -025e-2,8", {MoveTo{{15.7, 1.7}}, LineTo{{15.45, 9.7}}}},
        {"m 5 5 10 0 z", {MoveTo{{5, 5}}, LineTo{{15, 5}}, ClosePath{}}},
    };
};

TEST_F(SvgPathParserTest, ParseSvgPaths)
{
    for (auto const &[path, expected] : svg_path_list) {
        auto const commands = SvgPathParser::parse(path);
        ASSERT_TRUE(commands) << path;
        ASSERT_EQ(commands->size(), expected.size()) << path;
        for (std::size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(commands->at(i).index(), expected[i].index()) << path << " command " << i;
        }
        auto const got = path_commands_to_pathvector(*commands);
        auto const want = path_commands_to_pathvector(expected);
        ASSERT_EQ(got.size(), want.size());
        for (std::size_t p = 0; p < got.size(); ++p) {
            EXPECT_TRUE(Geom::are_near(got[p].initialPoint(), want[p].initialPoint(), 1e-9)) << path;
            EXPECT_TRUE(Geom::are_near(got[p].finalPoint(), want[p].finalPoint(), 1e-9)) << path;
        }
    }
}

TEST_F(SvgPathParserTest, RejectsArcs)
{
    EXPECT_FALSE(SvgPathParser::parse("M10,30A20,20,0,0,1,50,30"));
}

TEST_F(SvgPathParserTest, RejectsMalformedData)
{
    EXPECT_FALSE(SvgPathParser::parse("M 10"));
    EXPECT_FALSE(SvgPathParser::parse("10 10 L 20 20"));
    EXPECT_FALSE(SvgPathParser::parse("L 20 20"));
    EXPECT_FALSE(SvgPathParser::parse("M 0 0 L 1 1 2"));
    EXPECT_FALSE(SvgPathParser::parse("M 0 0 Z 4"));
    EXPECT_FALSE(SvgPathParser::parse("M 0 0 # 5 5"));
}

TEST_F(SvgPathParserTest, EmptyDataIsEmptyPath)
{
    auto const commands = SvgPathParser::parse("");
    ASSERT_TRUE(commands);
    EXPECT_TRUE(commands->empty());
}

TEST_F(SvgPathParserTest, WriteOneCommandPerLine)
{
    std::vector<PathCommand> const commands{MoveTo{{0, 0}}, LineTo{{50, 0}}, QuadTo{{30, -20}, {60, 10}},
                                            CurveTo{{1.5, 2}, {3, 4}, {5, 6}}, ClosePath{}};
    EXPECT_EQ(SvgPathParser::write(commands), "M 0 0\nL 50 0\nQ 30 -20 60 10\nC 1.5 2 3 4 5 6\nZ");
    EXPECT_EQ(SvgPathParser::write({}), "");
}

TEST_F(SvgPathParserTest, CurveSurvivesSvgData)
{
    BezierShape shape;
    shape.points = {CurvePoint({10, 10}, {}, Geom::Point(30, -20)), CurvePoint({60, 10}),
                    CurvePoint({90, 40}, Geom::Point(80, 0))};
    shape.closed = true;
    shape = normalize(std::move(shape));

    auto const d = SvgPathParser::write(to_path_commands(shape));
    auto const commands = SvgPathParser::parse(d.raw());
    ASSERT_TRUE(commands);
    EXPECT_EQ(*commands, to_path_commands(shape));

    auto const parsed = shape_from_path_commands(*commands);
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed->closed);
    EXPECT_EQ(to_path_commands(*parsed), *commands);
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
