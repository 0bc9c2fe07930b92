#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <cstdint>
#include <string>

/** Contents of state.json. */
struct SwitchState
{
    std::string currentTheme;
    std::string previousTheme;
    /** Milliseconds since the Unix epoch, 0 if never switched. */
    std::int64_t lastSwitched = 0;
};

/**
 * Persists the outcome of the last switch next to the pointer. The pointer
 * stays authoritative; this record only carries history the link cannot.
 */
class StateStore
{
  public:
    /** preferencesPath, if given, receives the recent-themes list. */
    explicit StateStore(std::string path, std::string preferencesPath = "");

    /** Missing or unreadable file yields an empty state. */
    SwitchState load() const;

    bool save(const SwitchState &state, std::string *error = nullptr) const;

    /**
     * Load, shift current to previous, stamp now, save. Also moves themeId to
     * the front of the recent themes in an existing preferences file.
     */
    bool recordSwitch(const std::string &themeId, std::string *error = nullptr) const;

  private:
    std::string m_path;
    std::string m_preferencesPath;
};

#endif // STATE_STORE_HPP
