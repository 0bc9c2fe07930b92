#include "switch_engine.hpp"
#include <spdlog/spdlog.h>

const char *switchPhaseName(SwitchPhase phase)
{
    switch (phase)
    {
    case SwitchPhase::Idle:
        return "idle";
    case SwitchPhase::Validating:
        return "validating";
    case SwitchPhase::Repointing:
        return "repointing";
    case SwitchPhase::HookPending:
        return "hook-pending";
    case SwitchPhase::Done:
        return "done";
    }
    return "unknown";
}

// ============================================================================
// SwitchEngine Implementation
// ============================================================================

SwitchEngine::SwitchEngine(ThemeRepository &repository, CurrentThemePointer &pointer, HookRunner &hooks,
                           StateStore *state)
    : m_repository(repository), m_pointer(pointer), m_hooks(hooks), m_state(state)
{
}

SwitchEngine::~SwitchEngine()
{
    // Queued requests are resolved as cancelled; a switch already running on
    // the worker is allowed to finish before the join returns.
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopping = true;
    }
    cancelPending();
    m_queueCv.notify_all();
    if (m_worker.joinable())
        m_worker.join();
}

void SwitchEngine::setPhaseObserver(PhaseObserver observer)
{
    m_observer = std::move(observer);
}

void SwitchEngine::enterPhase(const std::string &themeId, SwitchPhase phase)
{
    spdlog::debug("[Switch] {}: {}", themeId, switchPhaseName(phase));
    if (m_observer)
        m_observer(themeId, phase);
}

/**
 * Result handed to a queued request that never ran.
 *
 * The hook is marked skipped so callers that only look at hookOutcome do not
 * mistake a cancellation for a hook failure.
 */
SwitchResult SwitchEngine::cancelledResult(const std::string &themeId)
{
    SwitchResult result;
    result.requestedThemeId = themeId;
    result.error = ErrorCode::Cancelled;
    result.message = "switch to \"" + themeId + "\" was cancelled before it started";
    result.hookOutcome.skipped = true;
    return result;
}

SwitchResult SwitchEngine::switchTo(const std::string &themeId)
{
    std::unique_lock<std::mutex> lock(m_turnMutex);
    const std::uint64_t ticket = m_nextTicket++;
    m_turnCv.wait(lock, [this, ticket] { return m_serving == ticket; });
    lock.unlock();

    // Hands the turn to the next ticket however execute() leaves.
    struct TurnRelease
    {
        SwitchEngine &engine;
        ~TurnRelease()
        {
            std::lock_guard<std::mutex> guard(engine.m_turnMutex);
            ++engine.m_serving;
            engine.m_turnCv.notify_all();
        }
    } release{*this};

    return execute(themeId);
}

/**
 * One complete switch. Only called while holding the turn from switchTo().
 *
 * Validation and pointer failures end the switch before the hook; once the
 * pointer has moved, the switch has succeeded whatever the hook does.
 */
SwitchResult SwitchEngine::execute(const std::string &themeId)
{
    SwitchResult result;
    result.requestedThemeId = themeId;
    result.hookOutcome.skipped = true;

    enterPhase(themeId, SwitchPhase::Validating);
    ValidationResult validation = m_repository.validate(themeId);
    if (!validation.ok())
    {
        result.error = validation.error;
        result.message = validation.message;
        spdlog::warn("[Switch] Rejected: {}", formatError(result.error, result.message));
        enterPhase(themeId, SwitchPhase::Done);
        return result;
    }

    enterPhase(themeId, SwitchPhase::Repointing);
    PointerState before = m_pointer.read();
    if (before.isResolved())
        result.previousThemeId = before.themeId;

    PointerWriteResult write = m_pointer.atomicSet(validation.bundle.path);
    if (!write.ok())
    {
        result.error = write.error;
        result.message = write.message;
        spdlog::error("[Switch] {}", formatError(result.error, result.message));
        enterPhase(themeId, SwitchPhase::Done);
        return result;
    }

    result.appliedThemeId = themeId;
    result.bundlePath = validation.bundle.path;
    spdlog::info("[Switch] Current theme is now \"{}\"{}", themeId,
                 result.previousThemeId.empty() ? "" : " (was \"" + result.previousThemeId + "\")");

    // History is best effort: the pointer already says which theme is active.
    if (m_state)
    {
        std::string error;
        if (!m_state->recordSwitch(themeId, &error))
            spdlog::warn("[Switch] Could not record switch state: {}", error);
    }

    enterPhase(themeId, SwitchPhase::HookPending);
    result.hookOutcome = m_hooks.invoke(themeId, validation.bundle.path);
    result.success = true;
    if (!result.hookOutcome.success)
        result.message = formatError(result.hookOutcome.error(), result.hookOutcome.describe());

    enterPhase(themeId, SwitchPhase::Done);
    return result;
}

void SwitchEngine::Pending::resolve(SwitchResult result)
{
    if (onDone)
    {
        try
        {
            onDone(result);
        }
        catch (const std::exception &e)
        {
            spdlog::error("[Switch] Completion callback for \"{}\" failed: {}", themeId, e.what());
        }
    }
    promise.set_value(std::move(result));
}

std::future<SwitchResult> SwitchEngine::submit(const std::string &themeId, CompletionCallback onDone)
{
    Pending pending;
    pending.themeId = themeId;
    pending.onDone = std::move(onDone);
    std::future<SwitchResult> future = pending.promise.get_future();

    std::unique_lock<std::mutex> lock(m_queueMutex);
    if (m_stopping)
    {
        lock.unlock();
        pending.resolve(cancelledResult(themeId));
        return future;
    }

    m_queue.push_back(std::move(pending));
    if (!m_worker.joinable())
        m_worker = std::thread(&SwitchEngine::workerLoop, this);
    m_queueCv.notify_one();
    return future;
}

std::size_t SwitchEngine::cancelPending()
{
    std::deque<Pending> dropped;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        dropped.swap(m_queue);
    }

    for (auto &pending : dropped)
    {
        spdlog::info("[Switch] Cancelled queued switch to \"{}\"", pending.themeId);
        pending.resolve(cancelledResult(pending.themeId));
    }
    return dropped.size();
}

/**
 * Drains the submit() queue in FIFO order.
 *
 * Each request goes through switchTo(), so queued requests and direct callers
 * share one admission order. Exits when stopping and the queue is empty.
 */
void SwitchEngine::workerLoop()
{
    for (;;)
    {
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty())
                return;
            pending = std::move(m_queue.front());
            m_queue.pop_front();
        }

        pending.resolve(switchTo(pending.themeId));
    }
}
