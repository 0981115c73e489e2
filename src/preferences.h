// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Path-addressed preference values backed by a key file.
 *
 * A preference path such as "/tools/bezier/hit/anchor" maps to the key "anchor" in the
 * group "tools/bezier/hit". Missing or malformed entries fall back to the caller's default.
 */
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SKETCHPATH_PREFERENCES_H
#define SKETCHPATH_PREFERENCES_H

#include <memory>
#include <string>
#include <utility>

#include <glibmm/keyfile.h>
#include <glibmm/ustring.h>
#include <sigc++/signal.h>

namespace Sketchpath {

class Preferences
{
public:
    Preferences();
    ~Preferences();

    Preferences(Preferences const &) = delete;
    Preferences &operator=(Preferences const &) = delete;

    /// Replace the current values with the contents of a key file. Returns false on failure.
    bool load(std::string const &filename);
    bool loadFromData(Glib::ustring const &data);
    bool save(std::string const &filename) const;

    bool getBool(Glib::ustring const &pref_path, bool def = false) const;
    int getInt(Glib::ustring const &pref_path, int def = 0) const;
    int getIntLimited(Glib::ustring const &pref_path, int def, int min, int max) const;
    double getDouble(Glib::ustring const &pref_path, double def = 0.0) const;
    double getDoubleLimited(Glib::ustring const &pref_path, double def, double min, double max) const;
    Glib::ustring getString(Glib::ustring const &pref_path, Glib::ustring const &def = "") const;

    void setBool(Glib::ustring const &pref_path, bool value);
    void setInt(Glib::ustring const &pref_path, int value);
    void setDouble(Glib::ustring const &pref_path, double value);
    void setString(Glib::ustring const &pref_path, Glib::ustring const &value);

    /// Emitted with the preference path after every set*() call and after a load.
    sigc::signal<void (Glib::ustring const &)> &signal_changed() { return _signal_changed; }

private:
    static std::pair<Glib::ustring, Glib::ustring> _splitPath(Glib::ustring const &pref_path);
    bool _hasEntry(Glib::ustring const &group, Glib::ustring const &key) const;

    std::unique_ptr<Glib::KeyFile> _keyfile;
    sigc::signal<void (Glib::ustring const &)> _signal_changed;
};

} // namespace Sketchpath

#endif // SKETCHPATH_PREFERENCES_H

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
