// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Flat list of path drawing commands handed to the renderer.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_DISPLAY_PATH_COMMANDS_H
#define SKETCHPATH_DISPLAY_PATH_COMMANDS_H

#include <span>
#include <variant>
#include <vector>

#include <2geom/path-sink.h>
#include <2geom/pathvector.h>
#include <2geom/point.h>

namespace Sketchpath {

struct MoveTo
{
    Geom::Point p;
    bool operator==(MoveTo const &) const = default;
};

struct LineTo
{
    Geom::Point p;
    bool operator==(LineTo const &) const = default;
};

struct QuadTo
{
    Geom::Point c;
    Geom::Point p;
    bool operator==(QuadTo const &) const = default;
};

struct CurveTo
{
    Geom::Point c0;
    Geom::Point c1;
    Geom::Point p;
    bool operator==(CurveTo const &) const = default;
};

struct ClosePath
{
    bool operator==(ClosePath const &) const = default;
};

using PathCommand = std::variant<MoveTo, LineTo, QuadTo, CurveTo, ClosePath>;

/**
 * Path sink that records every command it is fed.
 *
 * Arcs have no counterpart in the command list; they are approximated by a line to the arc end.
 */
class PathCommandSink : public Geom::PathSink
{
public:
    void moveTo(Geom::Point const &p) override;
    void lineTo(Geom::Point const &p) override;
    void curveTo(Geom::Point const &c0, Geom::Point const &c1, Geom::Point const &p) override;
    void quadTo(Geom::Point const &c, Geom::Point const &p) override;
    void arcTo(Geom::Coord rx, Geom::Coord ry, Geom::Coord angle, bool large_arc, bool sweep,
               Geom::Point const &p) override;
    void closePath() override;
    void flush() override {}

    std::vector<PathCommand> const &commands() const { return _commands; }
    std::vector<PathCommand> take() { return std::move(_commands); }

private:
    std::vector<PathCommand> _commands;
};

/// Replay the commands into any 2geom path sink.
void replay_path_commands(std::span<PathCommand const> commands, Geom::PathSink &sink);

Geom::PathVector path_commands_to_pathvector(std::span<PathCommand const> commands);

} // namespace Sketchpath

#endif // SKETCHPATH_DISPLAY_PATH_COMMANDS_H

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
