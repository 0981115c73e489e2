// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "document/shape-store.h"

#include <glib.h>

namespace Sketchpath {

ShapeId ShapeStore::add(ShapeData data)
{
    auto const id = _next_id++;
    _shapes.emplace(id, std::make_shared<ShapeData const>(std::move(data)));
    g_debug("ShapeStore: added %s shape %" G_GUINT64_FORMAT, shape_type_name(*_shapes[id]), id);
    _signal_changed.emit(id);
    return id;
}

bool ShapeStore::update(ShapeId id, ShapeData data)
{
    auto it = _shapes.find(id);
    if (it == _shapes.end()) {
        g_warning("ShapeStore: update of unknown shape %" G_GUINT64_FORMAT, id);
        return false;
    }
    if (*it->second == data) {
        return true;
    }

    it->second = std::make_shared<ShapeData const>(std::move(data));
    _signal_changed.emit(id);
    return true;
}

bool ShapeStore::remove(ShapeId id)
{
    if (_shapes.erase(id) == 0) {
        return false;
    }
    g_debug("ShapeStore: removed shape %" G_GUINT64_FORMAT, id);
    _signal_removed.emit(id);
    return true;
}

ShapeStore::Snapshot ShapeStore::get(ShapeId id) const
{
    auto it = _shapes.find(id);
    return it != _shapes.end() ? it->second : nullptr;
}

std::vector<ShapeId> ShapeStore::ids() const
{
    std::vector<ShapeId> result;
    result.reserve(_shapes.size());
    for (auto const &[id, shape] : _shapes) {
        result.push_back(id);
    }
    return result;
}

std::optional<Geom::Rect> ShapeStore::pageBounds(ShapeId id) const
{
    if (auto snapshot = get(id)) {
        return shape_page_bounds(*snapshot);
    }
    return {};
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
