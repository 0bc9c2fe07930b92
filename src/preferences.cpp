#include "preferences.hpp"
#include <algorithm>
#include <climits>
#include <glibmm.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

// ============================================================================
// Internal Parsing Helpers
// ============================================================================

namespace
{
const char *const KEY_HOOK_SCRIPT = "hookScript";
const char *const KEY_HOOK_TIMEOUT = "hookTimeoutMs";
const char *const KEY_HOOK_MAX_OUTPUT = "hookMaxOutputBytes";
const char *const KEY_BUNDLE_FILES = "bundleFiles";
const char *const KEY_RECENT_THEMES = "recentThemes";

/**
 * Read the bundleFiles object into out.
 *
 * Entries whose value is neither "required" nor "optional" are skipped; the
 * rest still apply. theme.json is always forced to required.
 *
 * @param j The raw bundleFiles value
 * @param out Replaced with the parsed set unless j is not an object
 * @return True if every entry was understood and out was replaced
 */
bool parseBundleFiles(const json &j, BundleFileSet &out)
{
    if (!j.is_object())
    {
        spdlog::warn("[Preferences] '{}' is not an object, using defaults", KEY_BUNDLE_FILES);
        return false;
    }

    bool clean = true;
    BundleFileSet parsed;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const std::string mode = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        if (mode == "required")
            parsed[it.key()] = FileRequirement::Required;
        else if (mode == "optional")
            parsed[it.key()] = FileRequirement::Optional;
        else
        {
            spdlog::warn("[Preferences] Unknown requirement '{}' for {}", mode, it.key());
            clean = false;
        }
    }

    // The manifest is what makes a directory a bundle at all.
    parsed["theme.json"] = FileRequirement::Required;
    out = std::move(parsed);
    return clean;
}
} // namespace

// ============================================================================
// Preferences Implementation
// ============================================================================

BundleFileSet Preferences::defaultBundleFiles()
{
    return {
        {"theme.json", FileRequirement::Required},
        {"alacritty.toml", FileRequirement::Required},
        {"kitty.conf", FileRequirement::Optional},
        {"wezterm.lua", FileRequirement::Optional},
        {"neovim.lua", FileRequirement::Optional},
        {"starship.toml", FileRequirement::Optional},
        {"bat.conf", FileRequirement::Optional},
        {"warp.yaml", FileRequirement::Optional},
    };
}

Preferences Preferences::defaults()
{
    Preferences prefs;
    prefs.bundleFiles = defaultBundleFiles();
    return prefs;
}

Preferences Preferences::load(const std::string &path, std::string *error)
{
    Preferences prefs = defaults();

    if (!Glib::file_test(path, Glib::FileTest::EXISTS))
        return prefs;

    json j;
    try
    {
        j = json::parse(Glib::file_get_contents(path));
    }
    catch (const Glib::Error &e)
    {
        if (error)
            *error = e.what();
        return prefs;
    }
    catch (const json::exception &e)
    {
        if (error)
            *error = std::string("corrupted preferences: ") + e.what();
        return prefs;
    }

    if (!j.is_object())
    {
        if (error)
            *error = "corrupted preferences: top level is not an object";
        return prefs;
    }

    // Every key is consumed only once it has been accepted. A value that was
    // rejected stays in extra and goes back to disk exactly as the user wrote it.
    std::vector<const char *> consumed;

    if (j.contains(KEY_HOOK_SCRIPT))
    {
        const json &v = j[KEY_HOOK_SCRIPT];
        if (v.is_string())
        {
            prefs.hook.script = v.get<std::string>();
            consumed.push_back(KEY_HOOK_SCRIPT);
        }
        else if (!v.is_null())
            spdlog::warn("[Preferences] '{}' is not a string, ignoring", KEY_HOOK_SCRIPT);
    }

    if (j.contains(KEY_HOOK_TIMEOUT))
    {
        const json &v = j[KEY_HOOK_TIMEOUT];
        if (v.is_number_integer() && v.get<long long>() > 0 && v.get<long long>() <= INT_MAX)
        {
            prefs.hook.timeoutMs = v.get<int>();
            consumed.push_back(KEY_HOOK_TIMEOUT);
        }
        else
            spdlog::warn("[Preferences] '{}' must be a positive integer, using {}", KEY_HOOK_TIMEOUT,
                         prefs.hook.timeoutMs);
    }

    if (j.contains(KEY_HOOK_MAX_OUTPUT))
    {
        const json &v = j[KEY_HOOK_MAX_OUTPUT];
        if (v.is_number_unsigned() && v.get<std::size_t>() > 0)
        {
            prefs.hook.maxOutputBytes = v.get<std::size_t>();
            consumed.push_back(KEY_HOOK_MAX_OUTPUT);
        }
        else
            spdlog::warn("[Preferences] '{}' must be a positive integer, using {}", KEY_HOOK_MAX_OUTPUT,
                         prefs.hook.maxOutputBytes);
    }

    if (j.contains(KEY_BUNDLE_FILES) && parseBundleFiles(j[KEY_BUNDLE_FILES], prefs.bundleFiles))
        consumed.push_back(KEY_BUNDLE_FILES);

    // The recent list is maintained here, so it is always taken over.
    if (j.contains(KEY_RECENT_THEMES))
    {
        if (j[KEY_RECENT_THEMES].is_array())
        {
            for (const auto &entry : j[KEY_RECENT_THEMES])
            {
                if (entry.is_string())
                    prefs.recentThemes.push_back(entry.get<std::string>());
            }
        }
        consumed.push_back(KEY_RECENT_THEMES);
    }

    for (const char *key : consumed)
        j.erase(key);
    prefs.extra = std::move(j);

    return prefs;
}

json Preferences::toJson() const
{
    json j = extra.is_object() ? extra : json::object();
    const HookSettings defaultHook;

    // Settings still at their defaults are left out so later default changes apply.
    if (!hook.script.empty())
        j[KEY_HOOK_SCRIPT] = hook.script;
    if (hook.timeoutMs != defaultHook.timeoutMs)
        j[KEY_HOOK_TIMEOUT] = hook.timeoutMs;
    if (hook.maxOutputBytes != defaultHook.maxOutputBytes)
        j[KEY_HOOK_MAX_OUTPUT] = hook.maxOutputBytes;

    // A bundleFiles object the loader could not fully read is still in extra
    // and is written back untouched.
    if (bundleFiles != defaultBundleFiles() && !j.contains(KEY_BUNDLE_FILES))
    {
        json files = json::object();
        for (const auto &entry : bundleFiles)
            files[entry.first] = entry.second == FileRequirement::Required ? "required" : "optional";
        j[KEY_BUNDLE_FILES] = std::move(files);
    }
    j[KEY_RECENT_THEMES] = recentThemes;

    return j;
}

bool Preferences::save(const std::string &path, std::string *error) const
{
    try
    {
        Glib::file_set_contents(path, toJson().dump(2) + "\n");
    }
    catch (const Glib::Error &e)
    {
        if (error)
            *error = e.what();
        return false;
    }
    return true;
}

void Preferences::pushRecentTheme(const std::string &themeId)
{
    recentThemes.erase(std::remove(recentThemes.begin(), recentThemes.end(), themeId),
                       recentThemes.end());
    recentThemes.insert(recentThemes.begin(), themeId);
    if (recentThemes.size() > MAX_RECENT_THEMES)
        recentThemes.resize(MAX_RECENT_THEMES);
}
