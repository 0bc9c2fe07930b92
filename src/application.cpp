#include "application.hpp"
#include "current_pointer.hpp"
#include "hook_runner.hpp"
#include "preferences.hpp"
#include "state_store.hpp"
#include "switch_engine.hpp"
#include "theme_repository.hpp"
#include <csignal>
#include <glib-unix.h>
#include <giomm.h>
#include <glibmm.h>
#include <spdlog/spdlog.h>

namespace
{
gboolean onTerminationSignal(gpointer data)
{
    spdlog::info("[App] Shutting down");
    g_main_loop_quit(static_cast<GMainLoop *>(data));
    return G_SOURCE_CONTINUE;
}

std::string joinMissing(const std::vector<std::string> &names)
{
    std::string out;
    for (const auto &n : names)
        out += (out.empty() ? "" : ", ") + n;
    return out;
}
} // namespace

Application::Application(Paths paths, ActivationChannel &channel, std::ostream &out)
    : m_paths(std::move(paths)), m_channel(channel), m_out(out)
{
}

bool Application::isKnownCommand(const std::string &command)
{
    return command == "list" || command == "current" || command == "validate" || command == "switch" ||
           command == "reset" || command == "serve";
}

int Application::run(const std::string &command, const std::vector<std::string> &args)
{
    if (!isKnownCommand(command))
    {
        spdlog::error("[App] Unknown command '{}'", command);
        return ExitStatus::USAGE;
    }

    const bool needsTheme = command == "validate" || command == "switch";
    if (args.size() != (needsTheme ? 1u : 0u))
    {
        spdlog::error("[App] '{}' expects {}", command, needsTheme ? "a theme id" : "no arguments");
        return ExitStatus::USAGE;
    }

    if (m_paths.dataDir().empty())
    {
        spdlog::error("[App] Cannot determine the data directory (HOME is not set)");
        return ExitStatus::FAILED;
    }

    // Nothing below may run unless this process owns the store. A switch that
    // finds an owner is handed to it instead of being dropped.
    const std::string forwardThemeId = command == "switch" ? args[0] : "";
    InstanceCoordinator coordinator(m_paths.lockPath(), m_channel);
    AcquireResult ownership = coordinator.acquire(forwardThemeId);
    if (ownership.status == AcquireResult::Status::AlreadyOwned)
    {
        m_out << "Another instance is already running (pid " << ownership.ownerPid << ")";
        if (ownership.signalled)
        {
            if (forwardThemeId.empty())
                m_out << ", asked it to come forward";
            else
                m_out << ", asked it to switch to " << forwardThemeId;
        }
        m_out << "\n";
        return ExitStatus::YIELDED;
    }
    if (!ownership.owned())
    {
        spdlog::error("[App] {}", ownership.message);
        return ExitStatus::FAILED;
    }

    std::string prefsError;
    Preferences prefs = Preferences::load(m_paths.preferencesPath(), &prefsError);
    if (!prefsError.empty())
        spdlog::warn("[App] Using default preferences: {}", prefsError);

    ThemeRepository repository(m_paths.themesDir(), prefs.bundleFiles, m_paths.customThemesDir());
    CurrentThemePointer pointer(m_paths.pointerPath());

    if (command == "list")
        return listThemes(repository, pointer);
    if (command == "current")
        return showCurrent(pointer);
    if (command == "validate")
        return validateTheme(repository, args[0]);
    if (command == "reset")
        return resetPointer(pointer);

    // Hook settings are re-read for every run so edits apply without a restart.
    const std::string prefsPath = m_paths.preferencesPath();
    HookRunner hooks(
        [prefsPath]
        {
            std::string error;
            Preferences current = Preferences::load(prefsPath, &error);
            if (!error.empty())
                spdlog::warn("[App] Hook settings fall back to defaults: {}", error);
            return current.hook;
        });
    StateStore state(m_paths.statePath(), prefsPath);
    SwitchEngine engine(repository, pointer, hooks, &state);
    if (command == "serve")
        return serve(repository, pointer, engine);
    return switchTheme(engine, args[0]);
}

int Application::listThemes(ThemeRepository &repository, CurrentThemePointer &pointer)
{
    PointerState current = pointer.read();

    for (const auto &bundle : repository.list())
    {
        const bool active = current.isResolved() && current.themeId == bundle.id;
        m_out << (active ? "* " : "  ") << bundle.id << "\t" << bundle.manifest.name << "\t"
              << (bundle.isLight ? "light" : "dark") << "\t" << (bundle.isCustom ? "custom" : "bundled") << "\t";
        if (bundle.isComplete())
            m_out << "ok";
        else
            m_out << "invalid (missing: " << joinMissing(bundle.missingFiles) << ")";
        m_out << "\n";
    }
    return ExitStatus::OK;
}

int Application::showCurrent(CurrentThemePointer &pointer)
{
    PointerState current = pointer.read();
    switch (current.status)
    {
    case PointerState::Status::Unset:
        m_out << "unset\n";
        return ExitStatus::OK;
    case PointerState::Status::Resolved:
        m_out << current.themeId << "\t" << current.target << "\n";
        return ExitStatus::OK;
    case PointerState::Status::Broken:
        m_out << formatError(ErrorCode::BrokenPointer, current.message) << "\n";
        return ExitStatus::FAILED;
    }
    return ExitStatus::FAILED;
}

int Application::validateTheme(ThemeRepository &repository, const std::string &themeId)
{
    ValidationResult result = repository.validate(themeId);
    if (!result.ok())
    {
        m_out << formatError(result.error, result.message) << "\n";
        return ExitStatus::FAILED;
    }
    m_out << "ok\t" << result.bundle.path << "\n";
    return ExitStatus::OK;
}

int Application::resetPointer(CurrentThemePointer &pointer)
{
    PointerWriteResult result = pointer.clear();
    if (!result.ok())
    {
        m_out << formatError(result.error, result.message) << "\n";
        return ExitStatus::FAILED;
    }
    spdlog::info("[App] Current theme cleared");
    m_out << "unset\n";
    return ExitStatus::OK;
}

int Application::switchTheme(SwitchEngine &engine, const std::string &themeId)
{
    SwitchResult result = engine.switchTo(themeId);
    if (!result.success)
    {
        m_out << formatError(result.error, result.message) << "\n";
        return ExitStatus::FAILED;
    }

    m_out << "Switched to " << result.appliedThemeId;
    if (!result.previousThemeId.empty())
        m_out << " (was " << result.previousThemeId << ")";
    m_out << "\n";

    const HookInvocation &hook = result.hookOutcome;
    if (!hook.skipped)
        m_out << (hook.success ? "hook: " : "hook failed: ") << hook.describe() << "\n";
    return ExitStatus::OK;
}

void Application::quit()
{
    std::lock_guard<std::mutex> lock(m_loopMutex);
    if (!m_loop)
    {
        m_quitRequested = true;
        return;
    }

    // Queued on the loop's own context so it also lands if run() has not started yet.
    auto loop = m_loop;
    Glib::MainContext::get_default()->signal_idle().connect_once([loop] { loop->quit(); });
}

int Application::serve(ThemeRepository &repository, CurrentThemePointer &pointer, SwitchEngine &engine)
{
    // The catalog monitor needs the giomm wrappers whichever channel is in use.
    Gio::init();
    auto loop = Glib::MainLoop::create();
    {
        std::lock_guard<std::mutex> lock(m_loopMutex);
        if (m_quitRequested)
            return ExitStatus::OK;
        m_loop = loop;
    }

    auto reportPointer = [&pointer]
    {
        PointerState current = pointer.read();
        if (current.status == PointerState::Status::Broken)
            spdlog::warn("[App] {} (switch to another theme to recover)", current.message);
        else if (current.isResolved())
            spdlog::info("[App] Current theme: {}", current.themeId);
        else
            spdlog::info("[App] No current theme");
    };

    reportPointer();

    repository.watch(
        [&repository, &reportPointer]
        {
            spdlog::info("[App] Theme catalog changed: {} bundles", repository.list().size());
            reportPointer();
        });

    // Forwarded switches run on the engine's worker, in the order they arrive,
    // so the loop keeps answering while a hook runs.
    auto onSwitch = [&engine](const std::string &themeId)
    {
        engine.submit(themeId,
                      [](const SwitchResult &result)
                      {
                          if (!result.success)
                              spdlog::warn("[App] Forwarded switch to \"{}\" failed: {}", result.requestedThemeId,
                                           formatError(result.error, result.message));
                          else if (!result.hookOutcome.success)
                              spdlog::warn("[App] Switched to \"{}\"; {}", result.appliedThemeId, result.message);
                          else
                              spdlog::info("[App] Switched to \"{}\" on request", result.appliedThemeId);
                      });
    };

    if (!m_channel.listen([&reportPointer] { reportPointer(); }, onSwitch))
        spdlog::info("[App] Running without an activation listener");

    guint intId = g_unix_signal_add(SIGINT, onTerminationSignal, loop->gobj());
    guint termId = g_unix_signal_add(SIGTERM, onTerminationSignal, loop->gobj());

    spdlog::info("[App] Serving theme store at {}", m_paths.dataDir());
    loop->run();

    g_source_remove(intId);
    g_source_remove(termId);
    repository.unwatch();

    // Requests that never started are dropped; the one in progress finishes.
    std::size_t dropped = engine.cancelPending();
    if (dropped > 0)
        spdlog::info("[App] Dropped {} queued switch request(s)", dropped);

    std::lock_guard<std::mutex> lock(m_loopMutex);
    m_loop.reset();
    return ExitStatus::OK;
}
