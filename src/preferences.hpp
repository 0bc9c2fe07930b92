#ifndef PREFERENCES_HPP
#define PREFERENCES_HPP

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class FileRequirement
{
    Required,
    Optional,
};

/** Logical file name inside a bundle -> whether it must exist. */
using BundleFileSet = std::map<std::string, FileRequirement>;

/** Hook configuration, read fresh for every invocation. */
struct HookSettings
{
    std::string script;
    int timeoutMs = 30000;
    std::size_t maxOutputBytes = 64 * 1024;
};

/**
 * The user's preferences.json as seen by the theme store.
 *
 * The preferences file belongs to the desktop application; keys this core does
 * not know about are carried through load/save untouched.
 */
struct Preferences
{
    static constexpr std::size_t MAX_RECENT_THEMES = 10;

    HookSettings hook;
    BundleFileSet bundleFiles;
    std::vector<std::string> recentThemes;

    /**
     * Keys from the document that were not taken into the fields above,
     * including known keys whose value was rejected. Written back by save().
     */
    nlohmann::json extra = nlohmann::json::object();

    static Preferences defaults();
    static BundleFileSet defaultBundleFiles();

    /**
     * Load from path. A missing file yields defaults with no error; a corrupted
     * file yields defaults and sets *error.
     */
    static Preferences load(const std::string &path, std::string *error = nullptr);

    /** Atomically write the document (temp file + rename). */
    bool save(const std::string &path, std::string *error = nullptr) const;

    /** Move themeId to the front of recentThemes, dropping duplicates and overflow. */
    void pushRecentTheme(const std::string &themeId);

    nlohmann::json toJson() const;
};

#endif // PREFERENCES_HPP
