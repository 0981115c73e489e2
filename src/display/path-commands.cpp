// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "display/path-commands.h"

#include <glib.h>
#include <2geom/path.h>

#include "util/variant-visitor.h"

namespace Sketchpath {

void PathCommandSink::moveTo(Geom::Point const &p)
{
    _commands.emplace_back(MoveTo{p});
}

void PathCommandSink::lineTo(Geom::Point const &p)
{
    _commands.emplace_back(LineTo{p});
}

void PathCommandSink::curveTo(Geom::Point const &c0, Geom::Point const &c1, Geom::Point const &p)
{
    _commands.emplace_back(CurveTo{c0, c1, p});
}

void PathCommandSink::quadTo(Geom::Point const &c, Geom::Point const &p)
{
    _commands.emplace_back(QuadTo{c, p});
}

void PathCommandSink::arcTo(Geom::Coord, Geom::Coord, Geom::Coord, bool, bool, Geom::Point const &p)
{
    g_warning("PathCommandSink: elliptical arc replaced by a straight line");
    lineTo(p);
}

void PathCommandSink::closePath()
{
    _commands.emplace_back(ClosePath{});
}

void replay_path_commands(std::span<PathCommand const> commands, Geom::PathSink &sink)
{
    for (auto const &command : commands) {
        std::visit(VariantVisitor{
                       [&](MoveTo const &c) { sink.moveTo(c.p); },
                       [&](LineTo const &c) { sink.lineTo(c.p); },
                       [&](QuadTo const &c) { sink.quadTo(c.c, c.p); },
                       [&](CurveTo const &c) { sink.curveTo(c.c0, c.c1, c.p); },
                       [&](ClosePath const &) { sink.closePath(); },
                   },
                   command);
    }
    sink.flush();
}

Geom::PathVector path_commands_to_pathvector(std::span<PathCommand const> commands)
{
    Geom::PathBuilder builder;
    replay_path_commands(commands, builder);
    return builder.peek();
}

} // namespace Sketchpath

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
