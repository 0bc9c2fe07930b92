#include "paths.hpp"
#include <cstdlib>
#include <glibmm.h>

// ============================================================================
// Anonymous Namespace - Environment Helpers
// ============================================================================

namespace
{
std::string envOrEmpty(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
        return "";
    return value;
}
} // namespace

// ============================================================================
// Paths Implementation
// ============================================================================

Paths::Paths(std::string dataDir) : m_dataDir(std::move(dataDir)) {}

Paths Paths::fromEnvironment()
{
    std::string explicitHome = envOrEmpty("FLOWSTATE_HOME");
    if (!explicitHome.empty())
        return Paths(explicitHome);

    std::string xdg = envOrEmpty("XDG_DATA_HOME");
    if (!xdg.empty())
        return Paths(Glib::build_filename(xdg, "flowstate"));

    std::string home = envOrEmpty("HOME");
    if (home.empty())
        return Paths("");

    return Paths(Glib::build_filename(home, ".local", "share", "flowstate"));
}

std::string Paths::themesDir() const
{
    return Glib::build_filename(m_dataDir, "themes");
}

std::string Paths::customThemesDir() const
{
    return Glib::build_filename(m_dataDir, "custom-themes");
}

std::string Paths::currentDir() const
{
    return Glib::build_filename(m_dataDir, "current");
}

std::string Paths::pointerPath() const
{
    return Glib::build_filename(currentDir(), "theme");
}

std::string Paths::preferencesPath() const
{
    return Glib::build_filename(m_dataDir, "preferences.json");
}

std::string Paths::statePath() const
{
    return Glib::build_filename(m_dataDir, "state.json");
}

std::string Paths::lockPath() const
{
    return Glib::build_filename(m_dataDir, "instance.lock");
}

std::string Paths::logDir() const
{
    return Glib::build_filename(m_dataDir, "logs");
}

std::string Paths::logFile() const
{
    return Glib::build_filename(logDir(), "flowstate.log");
}

std::string expandHome(const std::string &path)
{
    if (path.empty() || path[0] != '~')
        return path;

    // "~user" forms are left alone; only the caller's own home is expanded.
    if (path.size() > 1 && path[1] != '/')
        return path;

    std::string home = envOrEmpty("HOME");
    if (home.empty())
        return path;

    return home + path.substr(1);
}
