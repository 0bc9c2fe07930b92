#include "instance_coordinator.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <glib/gstdio.h>
#include <glibmm.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <typeinfo>
#include <unistd.h>

// ============================================================================
// GioActivationChannel
// ============================================================================

GioActivationChannel::GioActivationChannel(std::string appId) : m_appId(std::move(appId))
{
    Gio::init();
}

bool GioActivationChannel::listen(ActivatedCallback onActivate, SwitchRequestedCallback onSwitch)
{
    m_onActivate = std::move(onActivate);
    m_onSwitch = std::move(onSwitch);

    try
    {
        m_app = Gio::Application::create(m_appId, Gio::Application::Flags::NONE);
        m_app->signal_activate().connect(
            [this]
            {
                spdlog::info("[Instance] Activation requested by another launch");
                if (m_onActivate)
                    m_onActivate();
            });

        // Actions must be in place before registration so that they are
        // exported on the bus together with the application.
        m_switchAction = Gio::SimpleAction::create(SWITCH_ACTION, Glib::VARIANT_TYPE_STRING);
        m_switchAction->signal_activate().connect(
            [this](const Glib::VariantBase &parameter)
            {
                std::string themeId;
                try
                {
                    themeId =
                        Glib::VariantBase::cast_dynamic<Glib::Variant<Glib::ustring>>(parameter).get().raw();
                }
                catch (const std::bad_cast &)
                {
                    spdlog::warn("[Instance] Ignoring switch request without a theme id");
                    return;
                }

                spdlog::info("[Instance] Switch to \"{}\" requested by another launch", themeId);
                if (m_onSwitch)
                    m_onSwitch(themeId);
            });
        m_app->add_action(m_switchAction);

        if (!m_app->register_application())
        {
            spdlog::warn("[Instance] Could not register {} on the session bus", m_appId);
            return false;
        }
        if (m_app->is_remote())
        {
            spdlog::warn("[Instance] {} already has a primary instance on the bus", m_appId);
            return false;
        }
    }
    catch (const Glib::Error &e)
    {
        spdlog::warn("[Instance] Activation listener unavailable: {}", e.what());
        m_app.reset();
        return false;
    }

    return true;
}

Glib::RefPtr<Gio::Application> GioActivationChannel::connectToOwner(pid_t ownerPid)
{
    auto app = Gio::Application::create(m_appId, Gio::Application::Flags::NONE);
    if (!app->register_application())
        return {};

    if (!app->is_remote())
    {
        // Nobody answers for this id; the owner is not listening.
        spdlog::debug("[Instance] Owner {} has no activation listener", ownerPid);
        return {};
    }
    return app;
}

bool GioActivationChannel::requestActivation(pid_t ownerPid)
{
    try
    {
        auto app = connectToOwner(ownerPid);
        if (!app)
            return false;

        app->activate();
        auto connection = app->get_dbus_connection();
        if (connection)
            connection->flush_sync();
    }
    catch (const Glib::Error &e)
    {
        spdlog::warn("[Instance] Could not signal owner {}: {}", ownerPid, e.what());
        return false;
    }

    return true;
}

bool GioActivationChannel::requestSwitch(pid_t ownerPid, const std::string &themeId)
{
    try
    {
        auto app = connectToOwner(ownerPid);
        if (!app)
            return false;

        app->activate_action(SWITCH_ACTION, Glib::Variant<Glib::ustring>::create(themeId));
        auto connection = app->get_dbus_connection();
        if (connection)
            connection->flush_sync();
    }
    catch (const Glib::Error &e)
    {
        spdlog::warn("[Instance] Could not forward switch to owner {}: {}", ownerPid, e.what());
        return false;
    }

    return true;
}

// ============================================================================
// InstanceCoordinator
// ============================================================================

InstanceCoordinator::InstanceCoordinator(std::string lockPath, ActivationChannel &channel)
    : m_lockPath(std::move(lockPath)), m_channel(channel)
{
}

InstanceCoordinator::~InstanceCoordinator()
{
    if (m_fd >= 0)
        ::close(m_fd);
}

bool InstanceCoordinator::isProcessAlive(pid_t pid)
{
    if (pid <= 0)
        return false;
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

pid_t InstanceCoordinator::readOwnerPid(const std::string &lockPath)
{
    std::string contents;
    try
    {
        contents = Glib::file_get_contents(lockPath);
    }
    catch (const Glib::FileError &)
    {
        return 0;
    }

    char *end = nullptr;
    long value = std::strtol(contents.c_str(), &end, 10);
    if (end == contents.c_str() || value <= 0)
        return 0;
    return static_cast<pid_t>(value);
}

AcquireResult InstanceCoordinator::acquire(const std::string &forwardThemeId)
{
    AcquireResult result;

    if (m_fd >= 0)
    {
        result.status = AcquireResult::Status::Owned;
        result.ownerPid = ::getpid();
        return result;
    }

    std::string dir = Glib::path_get_dirname(m_lockPath);
    if (g_mkdir_with_parents(dir.c_str(), 0700) != 0)
    {
        result.message = "cannot create " + dir + ": " + std::strerror(errno);
        return result;
    }

    int fd = ::open(m_lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        result.message = "cannot open " + m_lockPath + ": " + std::strerror(errno);
        return result;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int lockErrno = errno;
        ::close(fd);

        if (lockErrno != EWOULDBLOCK)
        {
            result.message = "cannot lock " + m_lockPath + ": " + std::strerror(lockErrno);
            return result;
        }

        result.status = AcquireResult::Status::AlreadyOwned;
        result.ownerPid = readOwnerPid(m_lockPath);
        if (!isProcessAlive(result.ownerPid))
            spdlog::debug("[Instance] Lock is held but recorded owner {} is not visible", result.ownerPid);

        spdlog::info("[Instance] Another instance is already running (pid {}), yielding", result.ownerPid);
        if (forwardThemeId.empty())
            result.signalled = m_channel.requestActivation(result.ownerPid);
        else
            result.signalled = m_channel.requestSwitch(result.ownerPid, forwardThemeId);
        result.message = "theme store is owned by pid " + std::to_string(result.ownerPid);
        return result;
    }

    pid_t previous = readOwnerPid(m_lockPath);
    if (previous > 0 && previous != ::getpid())
    {
        result.reclaimedStale = true;
        spdlog::info("[Instance] Reclaiming marker left by {} process {}",
                     isProcessAlive(previous) ? "unlocked" : "dead", previous);
    }

    const std::string pidText = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::pwrite(fd, pidText.data(), pidText.size(), 0) < 0)
    {
        // The lock is what excludes others; the pid is only for reporting.
        spdlog::warn("[Instance] Could not record pid in {}: {}", m_lockPath, std::strerror(errno));
    }

    m_fd = fd;
    result.status = AcquireResult::Status::Owned;
    result.ownerPid = ::getpid();
    spdlog::debug("[Instance] Acquired {}", m_lockPath);
    return result;
}
