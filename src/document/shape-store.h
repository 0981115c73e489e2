// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Arena of shapes addressed by id.
 *
 * Shapes are immutable once stored: readers hold a snapshot, writers submit a complete
 * replacement record. Nothing ever edits a stored shape in place.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_DOCUMENT_SHAPE_STORE_H
#define SKETCHPATH_DOCUMENT_SHAPE_STORE_H

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <sigc++/signal.h>
#include <2geom/rect.h>

#include "object/shape.h"

namespace Sketchpath {

class ShapeStore
{
public:
    using Snapshot = std::shared_ptr<ShapeData const>;

    ShapeStore() = default;
    ShapeStore(ShapeStore const &) = delete;
    ShapeStore &operator=(ShapeStore const &) = delete;

    ShapeId add(ShapeData data);

    /// Replace the whole record. Returns false when the id is unknown.
    bool update(ShapeId id, ShapeData data);
    bool remove(ShapeId id);

    Snapshot get(ShapeId id) const;
    bool contains(ShapeId id) const { return _shapes.contains(id); }
    std::size_t size() const { return _shapes.size(); }
    std::vector<ShapeId> ids() const;

    template <typename T>
    std::optional<T> getAs(ShapeId id) const
    {
        if (auto snapshot = get(id)) {
            if (auto shape = std::get_if<T>(snapshot.get())) {
                return *shape;
            }
        }
        return {};
    }

    std::optional<Geom::Rect> pageBounds(ShapeId id) const;

    sigc::signal<void (ShapeId)> &signal_changed() { return _signal_changed; }
    sigc::signal<void (ShapeId)> &signal_removed() { return _signal_removed; }

private:
    std::map<ShapeId, Snapshot> _shapes;
    ShapeId _next_id = 1;

    sigc::signal<void (ShapeId)> _signal_changed;
    sigc::signal<void (ShapeId)> _signal_removed;
};

} // namespace Sketchpath

#endif // SKETCHPATH_DOCUMENT_SHAPE_STORE_H

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
