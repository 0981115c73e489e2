// SPDX-License-Identifier: GPL-2.0-or-later
/* Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "preferences.h"

#include <glib.h>
#include <glibmm/error.h>

namespace Sketchpath {

namespace {
constexpr char const *ROOT_GROUP = "global";
}

Preferences::Preferences()
    : _keyfile(std::make_unique<Glib::KeyFile>())
{}

Preferences::~Preferences() = default;

bool Preferences::load(std::string const &filename)
{
    auto keyfile = std::make_unique<Glib::KeyFile>();
    try {
        if (!keyfile->load_from_file(filename)) {
            return false;
        }
    } catch (Glib::Error const &error) {
        g_warning("Preferences: cannot load '%s': %s", filename.c_str(), error.what());
        return false;
    }

    _keyfile = std::move(keyfile);
    _signal_changed.emit("/");
    return true;
}

bool Preferences::loadFromData(Glib::ustring const &data)
{
    auto keyfile = std::make_unique<Glib::KeyFile>();
    try {
        if (!keyfile->load_from_data(data)) {
            return false;
        }
    } catch (Glib::Error const &error) {
        g_warning("Preferences: cannot parse preference data: %s", error.what());
        return false;
    }

    _keyfile = std::move(keyfile);
    _signal_changed.emit("/");
    return true;
}

bool Preferences::save(std::string const &filename) const
{
    try {
        return _keyfile->save_to_file(filename);
    } catch (Glib::Error const &error) {
        g_warning("Preferences: cannot save '%s': %s", filename.c_str(), error.what());
    }
    return false;
}

bool Preferences::getBool(Glib::ustring const &pref_path, bool def) const
{
    auto const [group, key] = _splitPath(pref_path);
    if (!_hasEntry(group, key)) {
        return def;
    }
    try {
        return _keyfile->get_boolean(group, key);
    } catch (Glib::Error const &error) {
        g_warning("Preferences: '%s' is not a boolean: %s", pref_path.c_str(), error.what());
    }
    return def;
}

int Preferences::getInt(Glib::ustring const &pref_path, int def) const
{
    auto const [group, key] = _splitPath(pref_path);
    if (!_hasEntry(group, key)) {
        return def;
    }
    try {
        return _keyfile->get_integer(group, key);
    } catch (Glib::Error const &error) {
        g_warning("Preferences: '%s' is not an integer: %s", pref_path.c_str(), error.what());
    }
    return def;
}

int Preferences::getIntLimited(Glib::ustring const &pref_path, int def, int min, int max) const
{
    int const value = getInt(pref_path, def);
    return (value >= min && value <= max) ? value : def;
}

double Preferences::getDouble(Glib::ustring const &pref_path, double def) const
{
    auto const [group, key] = _splitPath(pref_path);
    if (!_hasEntry(group, key)) {
        return def;
    }
    try {
        return _keyfile->get_double(group, key);
    } catch (Glib::Error const &error) {
        g_warning("Preferences: '%s' is not a number: %s", pref_path.c_str(), error.what());
    }
    return def;
}

double Preferences::getDoubleLimited(Glib::ustring const &pref_path, double def, double min, double max) const
{
    double const value = getDouble(pref_path, def);
    return (value >= min && value <= max) ? value : def;
}

Glib::ustring Preferences::getString(Glib::ustring const &pref_path, Glib::ustring const &def) const
{
    auto const [group, key] = _splitPath(pref_path);
    if (!_hasEntry(group, key)) {
        return def;
    }
    try {
        return _keyfile->get_string(group, key);
    } catch (Glib::Error const &error) {
        g_warning("Preferences: cannot read '%s': %s", pref_path.c_str(), error.what());
    }
    return def;
}

void Preferences::setBool(Glib::ustring const &pref_path, bool value)
{
    auto const [group, key] = _splitPath(pref_path);
    _keyfile->set_boolean(group, key, value);
    _signal_changed.emit(pref_path);
}

void Preferences::setInt(Glib::ustring const &pref_path, int value)
{
    auto const [group, key] = _splitPath(pref_path);
    _keyfile->set_integer(group, key, value);
    _signal_changed.emit(pref_path);
}

void Preferences::setDouble(Glib::ustring const &pref_path, double value)
{
    auto const [group, key] = _splitPath(pref_path);
    _keyfile->set_double(group, key, value);
    _signal_changed.emit(pref_path);
}

void Preferences::setString(Glib::ustring const &pref_path, Glib::ustring const &value)
{
    auto const [group, key] = _splitPath(pref_path);
    _keyfile->set_string(group, key, value);
    _signal_changed.emit(pref_path);
}

std::pair<Glib::ustring, Glib::ustring> Preferences::_splitPath(Glib::ustring const &pref_path)
{
    auto path = pref_path;
    while (!path.empty() && path[0] == '/') {
        path.erase(0, 1);
    }

    auto const slash = path.rfind('/');
    if (slash == Glib::ustring::npos) {
        return {ROOT_GROUP, path};
    }
    return {path.substr(0, slash), path.substr(slash + 1)};
}

bool Preferences::_hasEntry(Glib::ustring const &group, Glib::ustring const &key) const
{
    try {
        return _keyfile->has_group(group) && _keyfile->has_key(group, key);
    } catch (Glib::Error const &error) {
        g_debug("Preferences: lookup of [%s] %s failed: %s", group.c_str(), key.c_str(), error.what());
    }
    return false;
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
