#ifndef PATHS_HPP
#define PATHS_HPP

#include <string>

/**
 * On-disk layout of the theme store, rooted at a single data directory.
 *
 * Resolution order for the data directory: $FLOWSTATE_HOME,
 * $XDG_DATA_HOME/flowstate, then $HOME/.local/share/flowstate.
 */
class Paths
{
  public:
    explicit Paths(std::string dataDir);

    /** Paths for the current environment. Empty data dir if HOME is unset. */
    static Paths fromEnvironment();

    const std::string &dataDir() const { return m_dataDir; }
    std::string themesDir() const;
    /** The user's own themes, searched after themesDir(). */
    std::string customThemesDir() const;
    std::string currentDir() const;
    std::string pointerPath() const;
    std::string preferencesPath() const;
    std::string statePath() const;
    std::string lockPath() const;
    std::string logDir() const;
    std::string logFile() const;

  private:
    std::string m_dataDir;
};

/** Replaces a leading "~" with $HOME. Other paths are returned unchanged. */
std::string expandHome(const std::string &path);

#endif // PATHS_HPP
