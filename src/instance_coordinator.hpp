#ifndef INSTANCE_COORDINATOR_HPP
#define INSTANCE_COORDINATOR_HPP

#include <functional>
#include <giomm.h>
#include <string>
#include <sys/types.h>

/**
 * Out-of-band way for a yielding process to reach the owner: either a plain
 * "come forward" or a theme switch the owner should perform on its behalf.
 */
class ActivationChannel
{
  public:
    using ActivatedCallback = std::function<void()>;
    using SwitchRequestedCallback = std::function<void(const std::string &themeId)>;

    virtual ~ActivationChannel() = default;

    /** Ask the owner to activate. ownerPid may be 0 if unknown. */
    virtual bool requestActivation(pid_t ownerPid) = 0;

    /** Ask the owner to switch to themeId. False if the request was not delivered. */
    virtual bool requestSwitch(pid_t ownerPid, const std::string &themeId)
    {
        (void) ownerPid;
        (void) themeId;
        return false;
    }

    /**
     * Owner side: run onActivate for each activation and onSwitch for each
     * forwarded switch. False if unsupported.
     */
    virtual bool listen(ActivatedCallback onActivate, SwitchRequestedCallback onSwitch)
    {
        (void) onActivate;
        (void) onSwitch;
        return false;
    }
};

/**
 * Activation over the session bus using GApplication uniqueness.
 *
 * The owner calls listen(), registering as the primary instance of appId.
 * A yielding process registers the same id, finds itself remote and sends
 * "activate", or the "switch" action with the theme id as its string
 * parameter. D-Bus delivers either to the owner's handlers.
 */
class GioActivationChannel : public ActivationChannel
{
  public:
    static constexpr const char *SWITCH_ACTION = "switch";

    explicit GioActivationChannel(std::string appId);

    /** Become the primary instance and dispatch incoming requests. */
    bool listen(ActivatedCallback onActivate, SwitchRequestedCallback onSwitch) override;

    bool requestActivation(pid_t ownerPid) override;
    bool requestSwitch(pid_t ownerPid, const std::string &themeId) override;

  private:
    /** Register appId as a client; null unless a primary instance answers for it. */
    Glib::RefPtr<Gio::Application> connectToOwner(pid_t ownerPid);

    std::string m_appId;
    Glib::RefPtr<Gio::Application> m_app;
    Glib::RefPtr<Gio::SimpleAction> m_switchAction;
    ActivatedCallback m_onActivate;
    SwitchRequestedCallback m_onSwitch;
};

struct AcquireResult
{
    enum class Status
    {
        Owned,
        AlreadyOwned,
        Failed,
    };

    Status status = Status::Failed;
    pid_t ownerPid = 0;
    /** AlreadyOwned only: whether the request to the owner went through. */
    bool signalled = false;
    /** Owned only: a marker left by a dead process was taken over. */
    bool reclaimedStale = false;
    std::string message;

    bool owned() const { return status == Status::Owned; }
};

/**
 * Process-wide ownership of the theme store.
 *
 * The marker is a lock file holding the owner's pid under an exclusive
 * flock(2). The kernel drops the lock when the owner exits, however it exits,
 * so a marker left behind by a crash is simply taken over.
 */
class InstanceCoordinator
{
  public:
    InstanceCoordinator(std::string lockPath, ActivationChannel &channel);
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator &) = delete;
    InstanceCoordinator &operator=(const InstanceCoordinator &) = delete;

    /**
     * Claim ownership. If another live process holds it, signal that process
     * once and return AlreadyOwned; the caller must then exit without touching
     * theme state.
     *
     * @param forwardThemeId If non-empty, the signal to the owner is a request
     *        to switch to this theme instead of a plain activation
     */
    AcquireResult acquire(const std::string &forwardThemeId = "");

    bool isOwner() const { return m_fd >= 0; }

    /** Pid recorded in the marker, 0 if none or unreadable. */
    static pid_t readOwnerPid(const std::string &lockPath);

    static bool isProcessAlive(pid_t pid);

  private:
    std::string m_lockPath;
    ActivationChannel &m_channel;
    int m_fd = -1;
};

#endif // INSTANCE_COORDINATOR_HPP
