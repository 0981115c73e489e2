// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Mapping between document (page) coordinates and window pixels.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UI_DESKTOP_CANVAS_TRANSFORM_H
#define SKETCHPATH_UI_DESKTOP_CANVAS_TRANSFORM_H

#include <2geom/affine.h>
#include <2geom/point.h>
#include <2geom/transforms.h>

namespace Sketchpath {

/** @class CanvasTransform
 * @brief Keeps _w2d in sync with the zoom, rotation and pan of the canvas camera.
 *
 * Zoom and rotation are stored separately so the zoom factor never has to be recovered from a
 * sheared matrix. The offset is the window position of the document origin.
 */
class CanvasTransform
{
public:
    Geom::Affine const &w2d() const { return _w2d; }

    Geom::Affine const &d2w() const { return _d2w; }

    void setZoom(double zoom)
    {
        _scale = Geom::Scale(zoom);
        _update();
    }

    /// Multiply the zoom, keeping the document point under @a window_point fixed.
    void zoomBy(double factor, Geom::Point const &window_point)
    {
        auto const anchor = windowToDocument(window_point);
        _scale *= Geom::Scale(factor);
        _update();
        _offset += window_point - documentToWindow(anchor);
        _update();
    }

    void setRotate(double angle)
    {
        _rotate = Geom::Rotate{angle};
        _update();
    }

    void setOffset(Geom::Point offset)
    {
        _offset = offset;
        _update();
    }

    void addOffset(Geom::Point offset)
    {
        _offset += offset;
        _update();
    }

    Geom::Point const &getOffset() const { return _offset; }

    double getZoom() const { return _scale[Geom::X]; }

    Geom::Point windowToDocument(Geom::Point const &p) const { return p * _w2d; }

    Geom::Point documentToWindow(Geom::Point const &p) const { return p * _d2w; }

    /// Length in document units of @a pixels screen pixels.
    double toDocumentDistance(double pixels) const { return pixels / getZoom(); }

private:
    void _update()
    {
        _d2w = Geom::Affine(_scale) * _rotate * Geom::Translate(_offset);
        _w2d = _d2w.inverse();
    }

    Geom::Affine _w2d;    // Window to document
    Geom::Affine _d2w;    // Document to window
    Geom::Rotate _rotate; // Rotation part of _d2w
    Geom::Scale _scale;   // Uniform zoom part of _d2w
    Geom::Point _offset;  // Window position of the document origin
};

} // namespace Sketchpath

#endif // SKETCHPATH_UI_DESKTOP_CANVAS_TRANSFORM_H
