// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "ui/tool/handle-projector.h"

#include <charconv>

#include <glib.h>

namespace Sketchpath {
namespace UI {

namespace {
constexpr std::string_view HANDLE_PREFIX = "bezier-";
}

std::string make_handle_id(HandleRef const &ref)
{
    std::string id{HANDLE_PREFIX};
    id += std::to_string(ref.index);
    id += '-';
    id += encode_handle_role(ref.role);
    return id;
}

std::optional<HandleRef> parse_handle_id(std::string_view id)
{
    if (!id.starts_with(HANDLE_PREFIX)) {
        return {};
    }
    id.remove_prefix(HANDLE_PREFIX.size());

    HandleRef ref;
    auto const [end, ec] = std::from_chars(id.data(), id.data() + id.size(), ref.index);
    if (ec != std::errc{} || end == id.data() || end == id.data() + id.size() || *end != '-') {
        return {};
    }
    id.remove_prefix(end - id.data() + 1);

    auto const role = decode_handle_role(id);
    if (!role) {
        return {};
    }
    ref.role = *role;
    return ref;
}

std::vector<Handle> project_handles(BezierShape const &shape)
{
    std::vector<Handle> handles;
    handles.reserve(shape.points.size() * 3);

    for (std::size_t i = 0; i < shape.points.size(); ++i) {
        auto const &point = shape.points[i];
        auto add = [&](HandleRole role, Geom::Point const &position) {
            handles.push_back({make_handle_id({i, role}), handle_kind(role), position});
        };

        add(HandleRole::ANCHOR, point.position);
        if (point.in_handle) {
            add(HandleRole::CONTROL_IN, *point.in_handle);
        }
        if (point.out_handle) {
            add(HandleRole::CONTROL_OUT, *point.out_handle);
        }
    }
    return handles;
}

BezierShape apply_handle_move(BezierShape shape, std::string_view id, Geom::Point const &position)
{
    auto const ref = parse_handle_id(id);
    if (!ref || ref->index >= shape.points.size()) {
        g_warning("apply_handle_move: no handle '%.*s' on this curve", static_cast<int>(id.size()), id.data());
        return shape;
    }

    auto &point = shape.points[ref->index];
    switch (ref->role) {
        case HandleRole::ANCHOR:
            point.position = position;
            break;

        case HandleRole::CONTROL_IN:
            if (!point.in_handle) {
                g_warning("apply_handle_move: point %zu has no incoming handle", ref->index);
                return shape;
            }
            point.in_handle = position;
            break;

        case HandleRole::CONTROL_OUT:
            if (!point.out_handle) {
                g_warning("apply_handle_move: point %zu has no outgoing handle", ref->index);
                return shape;
            }
            point.out_handle = position;
            break;
    }
    return normalize(std::move(shape));
}

} // namespace UI
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
