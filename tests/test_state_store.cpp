#include "preferences.hpp"
#include "state_store.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>

class StateStoreTest : public TempDirTest
{
};

TEST_F(StateStoreTest, MissingFileIsEmptyState)
{
    StateStore store(path("state.json"));
    SwitchState state = store.load();
    EXPECT_TRUE(state.currentTheme.empty());
    EXPECT_TRUE(state.previousTheme.empty());
    EXPECT_EQ(state.lastSwitched, 0);
}

TEST_F(StateStoreTest, CorruptedFileIsEmptyState)
{
    writeFile(path("state.json"), "[[[");
    StateStore store(path("state.json"));
    EXPECT_TRUE(store.load().currentTheme.empty());
}

TEST_F(StateStoreTest, RecordShiftsCurrentToPrevious)
{
    StateStore store(path("state.json"));

    ASSERT_TRUE(store.recordSwitch("nord"));
    ASSERT_TRUE(store.recordSwitch("tokyo-night"));

    SwitchState state = store.load();
    EXPECT_EQ(state.currentTheme, "tokyo-night");
    EXPECT_EQ(state.previousTheme, "nord");
    EXPECT_GT(state.lastSwitched, 0);

    auto j = nlohmann::json::parse(readFile(path("state.json")));
    EXPECT_EQ(j["currentTheme"], "tokyo-night");
    EXPECT_EQ(j["previousTheme"], "nord");
}

TEST_F(StateStoreTest, RepeatedSwitchKeepsPrevious)
{
    StateStore store(path("state.json"));
    ASSERT_TRUE(store.recordSwitch("nord"));
    ASSERT_TRUE(store.recordSwitch("tokyo-night"));
    ASSERT_TRUE(store.recordSwitch("tokyo-night"));

    SwitchState state = store.load();
    EXPECT_EQ(state.currentTheme, "tokyo-night");
    EXPECT_EQ(state.previousTheme, "nord");
}

TEST_F(StateStoreTest, RecentThemesGoToExistingPreferences)
{
    writeFile(path("preferences.json"), R"({"hookScript": "/bin/true"})");
    StateStore store(path("state.json"), path("preferences.json"));

    ASSERT_TRUE(store.recordSwitch("nord"));
    ASSERT_TRUE(store.recordSwitch("gruvbox"));

    Preferences prefs = Preferences::load(path("preferences.json"));
    ASSERT_EQ(prefs.recentThemes.size(), 2u);
    EXPECT_EQ(prefs.recentThemes[0], "gruvbox");
    EXPECT_EQ(prefs.recentThemes[1], "nord");
    EXPECT_EQ(prefs.hook.script, "/bin/true");
}

TEST_F(StateStoreTest, RejectedPreferenceValuesSurviveSwitch)
{
    writeFile(path("preferences.json"), R"({
        "hookScript": 42,
        "hookTimeoutMs": "fast",
        "hookMaxOutputBytes": 0,
        "bundleFiles": {"alacritty.toml": "sometimes", "kitty.conf": "required"},
        "theme": "dark"
    })");
    StateStore store(path("state.json"), path("preferences.json"));

    ASSERT_TRUE(store.recordSwitch("nord"));

    auto j = nlohmann::json::parse(readFile(path("preferences.json")));
    EXPECT_EQ(j["hookScript"], 42);
    EXPECT_EQ(j["hookTimeoutMs"], "fast");
    EXPECT_EQ(j["hookMaxOutputBytes"], 0);
    EXPECT_EQ(j["bundleFiles"]["alacritty.toml"], "sometimes");
    EXPECT_EQ(j["bundleFiles"]["kitty.conf"], "required");
    EXPECT_FALSE(j["bundleFiles"].contains("theme.json"));
    EXPECT_EQ(j["theme"], "dark");
    EXPECT_EQ(j["recentThemes"], nlohmann::json::array({"nord"}));
}

TEST_F(StateStoreTest, NoPreferencesFileIsCreated)
{
    StateStore store(path("state.json"), path("preferences.json"));
    ASSERT_TRUE(store.recordSwitch("nord"));
    EXPECT_FALSE(fs::exists(path("preferences.json")));
}

TEST_F(StateStoreTest, UnwritableLocationReportsError)
{
    StateStore store(path("missing-dir/state.json"));
    std::string error;
    EXPECT_FALSE(store.recordSwitch("nord", &error));
    EXPECT_FALSE(error.empty());
}
