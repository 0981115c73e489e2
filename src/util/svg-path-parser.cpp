// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "util/svg-path-parser.h"

#include <boost/spirit/home/x3.hpp>
#include <cctype>
#include <string>
#include <unordered_map>

#include <glib.h>
#include <glibmm/stringutils.h>

#include "util/variant-visitor.h"

namespace Sketchpath {

namespace {

struct Token
{
    char command;
    std::vector<double> args;
};

void append_point(Glib::ustring &out, Geom::Point const &p)
{
    out.push_back(' ');
    out.append(Glib::Ascii::dtostr(p.x()));
    out.push_back(' ');
    out.append(Glib::Ascii::dtostr(p.y()));
}

} // namespace

std::optional<std::vector<PathCommand>> SvgPathParser::parse(std::string_view d)
{
    std::vector<Token> tokens;
    bool stray_number = false;

    auto const command =
        boost::spirit::x3::char_("A-Za-z")[([&](auto &ctx) {
            tokens.push_back({_attr(ctx), {}});
        })];

    auto const number =
        boost::spirit::x3::double_[([&](auto &ctx) {
            if (tokens.empty()) {
                stray_number = true;
            } else {
                tokens.back().args.push_back(_attr(ctx));
            }
        })];

    // Characters to skip
    constexpr auto skipper = boost::spirit::x3::space | boost::spirit::x3::char_(',');

    auto const grammar = *(command | number);

    auto first = d.begin();
    bool const ok = boost::spirit::x3::phrase_parse(first, d.end(), grammar, skipper);
    if (!ok || first != d.end() || stray_number) {
        auto const rest = d.substr(first - d.begin());
        g_warning("SvgPathParser: cannot parse path data near \"%.*s\"", static_cast<int>(rest.size()), rest.data());
        return {};
    }

    std::vector<PathCommand> result;
    Geom::Point current;
    Geom::Point subpath_start;
    std::optional<Geom::Point> last_cubic_control;
    std::optional<Geom::Point> last_quad_control;

    for (auto const &token : tokens) {
        char const upper = std::toupper(static_cast<unsigned char>(token.command));
        bool const relative = token.command != upper;
        auto const arg_count = static_cast<std::size_t>(get_command_arg_count(upper));

        if (upper == 'A') {
            g_warning("SvgPathParser: elliptical arcs are not supported");
            return {};
        }
        if (upper == 'Z') {
            if (!token.args.empty()) {
                g_warning("SvgPathParser: close command takes no arguments");
                return {};
            }
            result.emplace_back(ClosePath{});
            current = subpath_start;
            last_cubic_control.reset();
            last_quad_control.reset();
            continue;
        }
        if (arg_count == 0 || token.args.empty() || token.args.size() % arg_count != 0) {
            g_warning("SvgPathParser: wrong number of arguments for '%c'", token.command);
            return {};
        }
        if (result.empty() && upper != 'M') {
            g_warning("SvgPathParser: path data must start with a move");
            return {};
        }

        for (std::size_t i = 0; i < token.args.size(); i += arg_count) {
            auto pt = [&](std::size_t k) {
                Geom::Point const p(token.args[i + k], token.args[i + k + 1]);
                return relative ? current + p : p;
            };
            std::optional<Geom::Point> cubic_control, quad_control;

            switch (upper) {
                case 'M':
                    if (i == 0) {
                        current = pt(0);
                        subpath_start = current;
                        result.emplace_back(MoveTo{current});
                    } else {
                        // further pairs after a move are implicit lines
                        current = pt(0);
                        result.emplace_back(LineTo{current});
                    }
                    break;
                case 'L':
                    current = pt(0);
                    result.emplace_back(LineTo{current});
                    break;
                case 'H':
                    current = {token.args[i] + (relative ? current.x() : 0.0), current.y()};
                    result.emplace_back(LineTo{current});
                    break;
                case 'V':
                    current = {current.x(), token.args[i] + (relative ? current.y() : 0.0)};
                    result.emplace_back(LineTo{current});
                    break;
                case 'Q': {
                    auto const c = pt(0);
                    current = pt(2);
                    result.emplace_back(QuadTo{c, current});
                    quad_control = c;
                    break;
                }
                case 'T': {
                    auto const c = last_quad_control ? current + (current - *last_quad_control) : current;
                    current = pt(0);
                    result.emplace_back(QuadTo{c, current});
                    quad_control = c;
                    break;
                }
                case 'C': {
                    auto const c0 = pt(0);
                    auto const c1 = pt(2);
                    current = pt(4);
                    result.emplace_back(CurveTo{c0, c1, current});
                    cubic_control = c1;
                    break;
                }
                case 'S': {
                    auto const c0 = last_cubic_control ? current + (current - *last_cubic_control) : current;
                    auto const c1 = pt(0);
                    current = pt(2);
                    result.emplace_back(CurveTo{c0, c1, current});
                    cubic_control = c1;
                    break;
                }
                default:
                    g_warning("SvgPathParser: unknown path command '%c'", token.command);
                    return {};
            }
            last_cubic_control = cubic_control;
            last_quad_control = quad_control;
        }
    }

    return result;
}

Glib::ustring SvgPathParser::write(std::span<PathCommand const> commands)
{
    Glib::ustring out;
    for (auto const &command : commands) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        std::visit(VariantVisitor{
                       [&](MoveTo const &c) {
                           out.push_back('M');
                           append_point(out, c.p);
                       },
                       [&](LineTo const &c) {
                           out.push_back('L');
                           append_point(out, c.p);
                       },
                       [&](QuadTo const &c) {
                           out.push_back('Q');
                           append_point(out, c.c);
                           append_point(out, c.p);
                       },
                       [&](CurveTo const &c) {
                           out.push_back('C');
                           append_point(out, c.c0);
                           append_point(out, c.c1);
                           append_point(out, c.p);
                       },
                       [&](ClosePath const &) { out.push_back('Z'); },
                   },
                   command);
    }
    return out;
}

int SvgPathParser::get_command_arg_count(char cmd)
{
    static const std::unordered_map<char, int> cmd_argument_count_map {
        {'Z',0},
        {'H',1},
        {'V',1},
        {'M',2},
        {'L',2},
        {'T',2},
        {'Q',4},
        {'S',4},
        {'C',6},
        {'A',7}
    };

    auto it = cmd_argument_count_map.find(cmd);
    return it != cmd_argument_count_map.end() ? it->second : 0;
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
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
