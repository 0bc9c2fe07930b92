#ifndef APPLICATION_HPP
#define APPLICATION_HPP

#include "instance_coordinator.hpp"
#include "paths.hpp"
#include <glibmm.h>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

class CurrentThemePointer;
class SwitchEngine;
class ThemeRepository;

/** Process exit statuses of the flowstate host. */
namespace ExitStatus
{
constexpr int OK = 0;
constexpr int FAILED = 1;
constexpr int USAGE = 2;
constexpr int YIELDED = 3;
} // namespace ExitStatus

/**
 * Command-line host for the theme store: takes ownership, builds the
 * repository, pointer and engine, and runs one command against them.
 */
class Application
{
  public:
    static constexpr const char *APP_ID = "org.flowstate.ThemeStore";

    Application(Paths paths, ActivationChannel &channel, std::ostream &out = std::cout);

    /** Returns one of ExitStatus. */
    int run(const std::string &command, const std::vector<std::string> &args);

    static bool isKnownCommand(const std::string &command);

    /** Stop a running serve from any thread. Before serve starts, it returns at once. */
    void quit();

  private:
    int listThemes(ThemeRepository &repository, CurrentThemePointer &pointer);
    int showCurrent(CurrentThemePointer &pointer);
    int validateTheme(ThemeRepository &repository, const std::string &themeId);
    int switchTheme(SwitchEngine &engine, const std::string &themeId);
    int resetPointer(CurrentThemePointer &pointer);
    int serve(ThemeRepository &repository, CurrentThemePointer &pointer, SwitchEngine &engine);

    Paths m_paths;
    ActivationChannel &m_channel;
    std::ostream &m_out;

    std::mutex m_loopMutex;
    Glib::RefPtr<Glib::MainLoop> m_loop;
    bool m_quitRequested = false;
};

#endif // APPLICATION_HPP
