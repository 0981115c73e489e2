// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UTIL_SVG_PATH_PARSER_H
#define SKETCHPATH_UTIL_SVG_PATH_PARSER_H

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <glibmm/ustring.h>

#include "display/path-commands.h"

namespace Sketchpath {

/**
 * Conversion between SVG path data and path commands.
 *
 * Only the commands a Bezier curve can express are read: moves, lines, quadratic and cubic
 * curves (including their shorthand forms) and close. Relative commands become absolute.
 */
class SvgPathParser
{
public:
    /// Nullopt when @a d is malformed or uses elliptical arcs.
    static std::optional<std::vector<PathCommand>> parse(std::string_view d);

    /// One command per line, absolute coordinates.
    static Glib::ustring write(std::span<PathCommand const> commands);

private:
    // Returns the number of arguments a path command expects
    static int get_command_arg_count(char cmd);
};

} // namespace Sketchpath

#endif // SKETCHPATH_UTIL_SVG_PATH_PARSER_H

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
