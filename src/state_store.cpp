#include "state_store.hpp"
#include "preferences.hpp"
#include <chrono>
#include <glibmm.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

StateStore::StateStore(std::string path, std::string preferencesPath)
    : m_path(std::move(path)), m_preferencesPath(std::move(preferencesPath))
{
}

SwitchState StateStore::load() const
{
    SwitchState state;

    if (!Glib::file_test(m_path, Glib::FileTest::EXISTS))
        return state;

    try
    {
        json j = json::parse(Glib::file_get_contents(m_path));
        if (!j.is_object())
        {
            spdlog::warn("[State] {} is not a JSON object, ignoring", m_path);
            return state;
        }
        state.currentTheme = j.value("currentTheme", std::string());
        state.previousTheme = j.value("previousTheme", std::string());
        state.lastSwitched = j.value("lastSwitched", std::int64_t(0));
    }
    catch (const Glib::Error &e)
    {
        spdlog::warn("[State] Cannot read {}: {}", m_path, e.what());
    }
    catch (const json::exception &e)
    {
        spdlog::warn("[State] Corrupted {}: {}", m_path, e.what());
        state = SwitchState();
    }

    return state;
}

bool StateStore::save(const SwitchState &state, std::string *error) const
{
    json j = {
        {"currentTheme", state.currentTheme},
        {"lastSwitched", state.lastSwitched},
    };
    if (!state.previousTheme.empty())
        j["previousTheme"] = state.previousTheme;

    try
    {
        Glib::file_set_contents(m_path, j.dump(2) + "\n");
    }
    catch (const Glib::Error &e)
    {
        if (error)
            *error = e.what();
        return false;
    }
    return true;
}

bool StateStore::recordSwitch(const std::string &themeId, std::string *error) const
{
    SwitchState state = load();
    if (state.currentTheme != themeId)
    {
        state.previousTheme = state.currentTheme;
        state.currentTheme = themeId;
    }

    using namespace std::chrono;
    state.lastSwitched = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();

    if (!save(state, error))
        return false;

    // Recent themes are a convenience for the UI; failing them does not fail the record.
    if (!m_preferencesPath.empty() && Glib::file_test(m_preferencesPath, Glib::FileTest::EXISTS))
    {
        std::string prefsError;
        Preferences prefs = Preferences::load(m_preferencesPath, &prefsError);
        if (!prefsError.empty())
        {
            spdlog::warn("[State] Not updating recent themes: {}", prefsError);
            return true;
        }
        prefs.pushRecentTheme(themeId);
        if (!prefs.save(m_preferencesPath, &prefsError))
            spdlog::warn("[State] Could not update recent themes: {}", prefsError);
    }

    return true;
}
