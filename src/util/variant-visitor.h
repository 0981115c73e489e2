// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Overload set for std::visit.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_UTIL_VARIANT_VISITOR_H
#define SKETCHPATH_UTIL_VARIANT_VISITOR_H

namespace Sketchpath {

template <typename... Ts>
struct VariantVisitor : Ts...
{
    using Ts::operator()...;
};

} // namespace Sketchpath

#endif // SKETCHPATH_UTIL_VARIANT_VISITOR_H
