#ifndef SWITCH_ENGINE_HPP
#define SWITCH_ENGINE_HPP

#include "current_pointer.hpp"
#include "errors.hpp"
#include "hook_runner.hpp"
#include "state_store.hpp"
#include "theme_repository.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

enum class SwitchPhase
{
    Idle,
    Validating,
    Repointing,
    HookPending,
    Done,
};

const char *switchPhaseName(SwitchPhase phase);

struct SwitchResult
{
    /** True once the pointer names the requested theme, whatever the hook did. */
    bool success = false;
    std::string requestedThemeId;
    std::string appliedThemeId;
    std::string previousThemeId;
    std::string bundlePath;
    HookInvocation hookOutcome;
    ErrorCode error = ErrorCode::None;
    std::string message;
};

/**
 * Validates a theme, repoints the current-theme link at it and runs the hook.
 *
 * Switches never overlap. switchTo() calls from several threads are admitted
 * in arrival order, and submit() queues onto a worker that drains FIFO.
 * Callers must already own the store through InstanceCoordinator.
 */
class SwitchEngine
{
  public:
    using PhaseObserver = std::function<void(const std::string &themeId, SwitchPhase phase)>;
    using CompletionCallback = std::function<void(const SwitchResult &result)>;

    /** state may be null, in which case no switch history is written. */
    SwitchEngine(ThemeRepository &repository, CurrentThemePointer &pointer, HookRunner &hooks,
                 StateStore *state = nullptr);
    ~SwitchEngine();

    SwitchEngine(const SwitchEngine &) = delete;
    SwitchEngine &operator=(const SwitchEngine &) = delete;

    /** Blocks until this request and every earlier one have completed. */
    SwitchResult switchTo(const std::string &themeId);

    /**
     * Queue a switch; the future resolves when it has run or been cancelled.
     * onDone, if set, sees the same result first, on the worker thread (or on
     * the cancelling thread for a cancelled request).
     */
    std::future<SwitchResult> submit(const std::string &themeId, CompletionCallback onDone = nullptr);

    /**
     * Drop queued requests that have not started. Their futures resolve with
     * ErrorCode::Cancelled. Returns how many were dropped.
     */
    std::size_t cancelPending();

    PointerState current() const { return m_pointer.read(); }

    /** Called on the switching thread at every phase change. */
    void setPhaseObserver(PhaseObserver observer);

  private:
    struct Pending
    {
        std::string themeId;
        std::promise<SwitchResult> promise;
        CompletionCallback onDone;

        void resolve(SwitchResult result);
    };

    SwitchResult execute(const std::string &themeId);
    void enterPhase(const std::string &themeId, SwitchPhase phase);
    void workerLoop();
    static SwitchResult cancelledResult(const std::string &themeId);

    ThemeRepository &m_repository;
    CurrentThemePointer &m_pointer;
    HookRunner &m_hooks;
    StateStore *m_state;
    PhaseObserver m_observer;

    // Ticket admission: each switchTo() takes a number and waits its turn.
    std::mutex m_turnMutex;
    std::condition_variable m_turnCv;
    std::uint64_t m_nextTicket = 0;
    std::uint64_t m_serving = 0;

    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<Pending> m_queue;
    bool m_stopping = false;
    std::thread m_worker;
};

#endif // SWITCH_ENGINE_HPP
