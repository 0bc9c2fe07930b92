#include "application.hpp"
#include "current_pointer.hpp"
#include "test_support.hpp"
#include <chrono>
#include <sstream>
#include <thread>

class ApplicationTest : public TempDirTest
{
  protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        data = path("flowstate");
        makeBundle(data + "/themes", "tokyo-night", "Tokyo Night");
        makeBundle(data + "/themes", "nord", "Nord");
        makeBundle(data + "/themes", "broken-theme", "Broken", false);
    }

    int run(const std::string &command, const std::vector<std::string> &args = {})
    {
        out.str("");
        Application app{Paths(data), channel, out};
        return app.run(command, args);
    }

    std::string data;
    RecordingActivationChannel channel;
    std::ostringstream out;
};

TEST_F(ApplicationTest, SwitchThenCurrent)
{
    EXPECT_EQ(run("switch", {"tokyo-night"}), ExitStatus::OK);
    EXPECT_EQ(out.str(), "Switched to tokyo-night\n");

    EXPECT_EQ(run("switch", {"nord"}), ExitStatus::OK);
    EXPECT_EQ(out.str(), "Switched to nord (was tokyo-night)\n");

    EXPECT_EQ(run("current"), ExitStatus::OK);
    EXPECT_EQ(out.str(), "nord\t" + data + "/themes/nord\n");
    EXPECT_TRUE(channel.requests.empty());
}

TEST_F(ApplicationTest, SwitchRunsConfiguredHook)
{
    std::string log = path("hook.log");
    std::string hook = writeScript("hook.sh", "echo \"$1\" >> " + log);
    writeFile(data + "/preferences.json", "{\"hookScript\": \"" + hook + "\"}");

    EXPECT_EQ(run("switch", {"nord"}), ExitStatus::OK);
    EXPECT_EQ(readFile(log), "nord\n");
    EXPECT_NE(out.str().find("hook: "), std::string::npos);
}

TEST_F(ApplicationTest, FailedSwitchReportsCode)
{
    EXPECT_EQ(run("switch", {"nonexistent-id"}), ExitStatus::FAILED);
    EXPECT_EQ(out.str().rfind("THEME_NOT_FOUND", 0), 0u);

    EXPECT_EQ(run("switch", {"broken-theme"}), ExitStatus::FAILED);
    EXPECT_EQ(out.str().rfind("THEME_INVALID", 0), 0u);
    EXPECT_FALSE(fs::exists(fs::symlink_status(data + "/current/theme")));
}

TEST_F(ApplicationTest, ListMarksCurrentTheme)
{
    ASSERT_EQ(run("switch", {"nord"}), ExitStatus::OK);
    EXPECT_EQ(run("list"), ExitStatus::OK);

    EXPECT_EQ(out.str(), "  broken-theme\tBroken\tdark\tbundled\tinvalid (missing: alacritty.toml)\n"
                         "* nord\tNord\tdark\tbundled\tok\n"
                         "  tokyo-night\tTokyo Night\tdark\tbundled\tok\n");
}

TEST_F(ApplicationTest, CustomThemesAreListedAndSwitchable)
{
    makeBundle(data + "/custom-themes", "my-theme", "Mine");
    makeBundle(data + "/custom-themes", "nord", "Not The Real Nord");

    EXPECT_EQ(run("list"), ExitStatus::OK);
    EXPECT_NE(out.str().find("  my-theme\tMine\tdark\tcustom\tok\n"), std::string::npos);
    EXPECT_NE(out.str().find("  nord\tNord\tdark\tbundled\tok\n"), std::string::npos);
    EXPECT_EQ(out.str().find("Not The Real Nord"), std::string::npos);

    EXPECT_EQ(run("switch", {"my-theme"}), ExitStatus::OK);
    EXPECT_EQ(run("current"), ExitStatus::OK);
    EXPECT_EQ(out.str(), "my-theme\t" + data + "/custom-themes/my-theme\n");
}

TEST_F(ApplicationTest, Validate)
{
    EXPECT_EQ(run("validate", {"nord"}), ExitStatus::OK);
    EXPECT_EQ(out.str(), "ok\t" + data + "/themes/nord\n");

    EXPECT_EQ(run("validate", {"../etc"}), ExitStatus::FAILED);
    EXPECT_EQ(out.str().rfind("INVALID_THEME_ID", 0), 0u);
}

TEST_F(ApplicationTest, CurrentUnsetAndBroken)
{
    EXPECT_EQ(run("current"), ExitStatus::OK);
    EXPECT_EQ(out.str(), "unset\n");

    ASSERT_EQ(run("switch", {"nord"}), ExitStatus::OK);
    fs::remove_all(data + "/themes/nord");
    EXPECT_EQ(run("current"), ExitStatus::FAILED);
    EXPECT_EQ(out.str().rfind("BROKEN_POINTER", 0), 0u);

    // Switching elsewhere recovers.
    EXPECT_EQ(run("switch", {"tokyo-night"}), ExitStatus::OK);
    EXPECT_EQ(run("current"), ExitStatus::OK);
}

TEST_F(ApplicationTest, ResetClearsPointer)
{
    ASSERT_EQ(run("switch", {"nord"}), ExitStatus::OK);
    EXPECT_EQ(run("reset"), ExitStatus::OK);
    EXPECT_EQ(out.str(), "unset\n");
    EXPECT_FALSE(fs::exists(fs::symlink_status(data + "/current/theme")));
    EXPECT_TRUE(fs::is_directory(data + "/themes/nord"));

    EXPECT_EQ(run("reset"), ExitStatus::OK);
}

TEST_F(ApplicationTest, UsageErrors)
{
    EXPECT_EQ(run("frobnicate"), ExitStatus::USAGE);
    EXPECT_EQ(run("switch"), ExitStatus::USAGE);
    EXPECT_EQ(run("switch", {"a", "b"}), ExitStatus::USAGE);
    EXPECT_EQ(run("list", {"extra"}), ExitStatus::USAGE);
    EXPECT_FALSE(fs::exists(data + "/instance.lock"));
}

TEST_F(ApplicationTest, YieldingSwitchIsForwardedToOwner)
{
    RecordingActivationChannel ownerChannel;
    InstanceCoordinator owner(data + "/instance.lock", ownerChannel);
    ASSERT_TRUE(owner.acquire().owned());

    EXPECT_EQ(run("switch", {"nord"}), ExitStatus::YIELDED);
    EXPECT_NE(out.str().find("Another instance is already running"), std::string::npos);
    EXPECT_NE(out.str().find("asked it to switch to nord"), std::string::npos);
    ASSERT_EQ(channel.switchRequests.size(), 1u);
    EXPECT_EQ(channel.switchRequests[0].first, ::getpid());
    EXPECT_EQ(channel.switchRequests[0].second, "nord");
    EXPECT_TRUE(channel.requests.empty());

    // The yielding run never touched theme state.
    EXPECT_FALSE(fs::exists(fs::symlink_status(data + "/current/theme")));
    EXPECT_FALSE(fs::exists(data + "/state.json"));
}

TEST_F(ApplicationTest, YieldingCommandAsksOwnerToComeForward)
{
    RecordingActivationChannel ownerChannel;
    InstanceCoordinator owner(data + "/instance.lock", ownerChannel);
    ASSERT_TRUE(owner.acquire().owned());

    EXPECT_EQ(run("list"), ExitStatus::YIELDED);
    EXPECT_NE(out.str().find("asked it to come forward"), std::string::npos);
    ASSERT_EQ(channel.requests.size(), 1u);
    EXPECT_EQ(channel.requests[0], ::getpid());
    EXPECT_TRUE(channel.switchRequests.empty());
}

TEST_F(ApplicationTest, ServePerformsForwardedSwitch)
{
    std::string log = path("hook.log");
    std::string hook = writeScript("hook.sh", "echo \"$1\" >> " + log);
    writeFile(data + "/preferences.json", "{\"hookScript\": \"" + hook + "\"}");

    Application app{Paths(data), channel, out};
    int status = -1;
    std::thread server([&app, &status] { status = app.run("serve", {}); });

    bool listening = channel.waitForListener(std::chrono::seconds(10));
    EXPECT_TRUE(listening);

    bool switched = false;
    if (listening)
    {
        channel.deliverSwitch("tokyo-night");

        CurrentThemePointer pointer(data + "/current/theme");
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pointer.read().themeId == "tokyo-night" && readFile(log) == "tokyo-night\n")
            {
                switched = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    app.quit();
    server.join();

    EXPECT_TRUE(switched);
    EXPECT_EQ(status, ExitStatus::OK);
}

TEST_F(ApplicationTest, QuitBeforeServeReturnsImmediately)
{
    Application app{Paths(data), channel, out};
    app.quit();
    EXPECT_EQ(app.run("serve", {}), ExitStatus::OK);
}

TEST(ApplicationCommandTest, KnownCommands)
{
    for (const char *command : {"list", "current", "validate", "switch", "reset", "serve"})
        EXPECT_TRUE(Application::isKnownCommand(command));
    EXPECT_FALSE(Application::isKnownCommand("apply"));
}
