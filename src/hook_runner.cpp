#include "hook_runner.hpp"
#include "paths.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <glibmm.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

// ============================================================================
// Internal Helpers
// ============================================================================

namespace
{
/** Grace period for pipes to drain once the hook itself has exited. */
constexpr unsigned PIPE_DRAIN_MS = 200;

/**
 * Removes leading and trailing whitespace.
 *
 * Hook paths come from a hand-edited preferences file and hook output ends in
 * newlines; both are compared and logged trimmed.
 *
 * @param s The string to trim
 * @return s without surrounding whitespace, empty if it was all whitespace
 */
std::string trim(const std::string &s)
{
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/**
 * Puts a pipe into non-blocking mode.
 *
 * The read loop drains a pipe until EAGAIN, so a blocking read would stall
 * the private main loop and with it the timeout.
 */
void setNonBlocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/** One captured pipe. */
struct Stream
{
    int fd = -1;
    std::string *sink = nullptr;
    bool eof = false;
    sigc::connection conn;

    void close()
    {
        conn.disconnect();
        if (fd >= 0)
            ::close(fd);
        fd = -1;
        eof = true;
    }
};

/** Shared state of one run, driven by a private main loop. */
struct Run
{
    Glib::RefPtr<Glib::MainContext> context;
    Glib::RefPtr<Glib::MainLoop> loop;
    HookInvocation *record = nullptr;
    std::size_t budget = 0;
    std::size_t captured = 0;
    Stream out;
    Stream err;
    bool exited = false;
    sigc::connection timeoutConn;
    sigc::connection childConn;
    sigc::connection drainConn;

    /**
     * Ends the run once the child is reaped and both pipes are at EOF. After a
     * timeout nothing more is waited for; otherwise pipes still held open by
     * a grandchild get PIPE_DRAIN_MS before they are abandoned.
     */
    void maybeFinish()
    {
        if (!exited)
            return;
        if (record->timedOut || (out.eof && err.eof))
        {
            loop->quit();
            return;
        }
        if (!drainConn.connected())
        {
            drainConn = context->signal_timeout().connect(
                [this]
                {
                    spdlog::debug("[Hook] Output pipes still open after exit, giving up on them");
                    loop->quit();
                    return false;
                },
                PIPE_DRAIN_MS);
        }
    }

    /**
     * Reads everything currently available on one pipe.
     *
     * Bytes past the shared budget are still read, so the child never blocks
     * on a full pipe, but they are dropped and the record marked truncated.
     *
     * @return False once the pipe is finished, which removes the watch
     */
    bool onReadable(Stream &stream)
    {
        char chunk[4096];
        for (;;)
        {
            ssize_t n = ::read(stream.fd, chunk, sizeof(chunk));
            if (n > 0)
            {
                std::size_t room = budget > captured ? budget - captured : 0;
                std::size_t take = std::min(room, static_cast<std::size_t>(n));
                stream.sink->append(chunk, take);
                captured += take;
                if (take < static_cast<std::size_t>(n))
                    record->outputTruncated = true;
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return true;

            // EOF or a read error: this pipe is finished.
            if (stream.fd >= 0)
                ::close(stream.fd);
            stream.fd = -1;
            stream.eof = true;
            maybeFinish();
            return false;
        }
    }

    void watch(Stream &stream)
    {
        setNonBlocking(stream.fd);
        stream.conn = context->signal_io().connect(
            [this, &stream](Glib::IOCondition) { return onReadable(stream); }, stream.fd,
            Glib::IOCondition::IO_IN | Glib::IOCondition::IO_HUP | Glib::IOCondition::IO_ERR);
    }
};
} // namespace

// ============================================================================
// HookInvocation
// ============================================================================

ErrorCode HookInvocation::error() const
{
    if (skipped || success)
        return ErrorCode::None;
    return timedOut ? ErrorCode::HookTimeout : ErrorCode::HookFailure;
}

std::string HookInvocation::describe() const
{
    if (skipped)
        return "no hook configured";
    if (!spawnError.empty())
        return "could not start " + command + ": " + spawnError;
    if (timedOut)
        return command + " timed out after " + std::to_string(durationMs) + " ms";
    if (termSignal != 0)
        return command + " killed by signal " + std::to_string(termSignal);
    if (exitCode != 0)
        return command + " exited with status " + std::to_string(exitCode);
    return command + " completed in " + std::to_string(durationMs) + " ms";
}

// ============================================================================
// HookRunner
// ============================================================================

HookRunner::HookRunner(SettingsSource source) : m_source(std::move(source)) {}

HookInvocation HookRunner::invoke(const std::string &themeId, const std::string &bundlePath) const
{
    HookInvocation record;
    record.args = {themeId, bundlePath};

    HookSettings settings;
    if (m_source)
    {
        try
        {
            settings = m_source();
        }
        catch (const std::exception &e)
        {
            spdlog::warn("[Hook] Cannot read hook settings: {}", e.what());
            record.spawnError = std::string("cannot read hook settings: ") + e.what();
            return record;
        }
    }

    const std::string script = trim(settings.script);
    if (script.empty())
    {
        record.skipped = true;
        record.success = true;
        spdlog::debug("[Hook] No hook configured");
        return record;
    }
    record.command = expandHome(script);

    std::vector<std::string> argv = {record.command, themeId, bundlePath};

    // A bare name is looked up on PATH; anything with a slash is taken as given.
    Glib::SpawnFlags flags = Glib::SpawnFlags::DO_NOT_REAP_CHILD;
    if (record.command.find('/') == std::string::npos)
        flags |= Glib::SpawnFlags::SEARCH_PATH;

    Run run;
    run.context = Glib::MainContext::create();
    run.loop = Glib::MainLoop::create(run.context);
    run.record = &record;
    run.budget = settings.maxOutputBytes;
    run.out.sink = &record.stdoutText;
    run.err.sink = &record.stderrText;

    Glib::Pid pid = 0;
    const auto started = std::chrono::steady_clock::now();

    spdlog::info("[Hook] Running {} {} {}", record.command, themeId, bundlePath);
    try
    {
        Glib::spawn_async_with_pipes(
            "",                         // Inherit working directory
            argv,
            flags,
            [] { ::setpgid(0, 0); },    // Own process group, so a timeout can kill the tree
            &pid,
            nullptr,                    // stdin from /dev/null
            &run.out.fd,
            &run.err.fd);
    }
    catch (const Glib::Error &e)
    {
        record.spawnError = e.what();
        record.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();
        spdlog::warn("[Hook] {}", record.describe());
        return record;
    }
    record.pid = static_cast<int>(pid);

    run.watch(run.out);
    run.watch(run.err);

    // Reaping through the child watch is what keeps a timed-out hook from
    // lingering as a zombie; spawn_close_pid releases the pid afterwards.
    run.childConn = run.context->signal_child_watch().connect(
        [&run, &record](GPid child, int status)
        {
            if (WIFEXITED(status))
                record.exitCode = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                record.termSignal = WTERMSIG(status);
            Glib::spawn_close_pid(child);
            run.exited = true;
            run.maybeFinish();
        },
        pid);

    run.timeoutConn = run.context->signal_timeout().connect(
        [&run, &record, pid]
        {
            if (run.exited)
            {
                // Only the drain is pending; the hook itself finished in time.
                run.loop->quit();
                return false;
            }
            record.timedOut = true;
            spdlog::warn("[Hook] {} exceeded its timeout, killing process group {}", record.command, pid);
            if (::kill(-pid, SIGKILL) != 0)
                ::kill(pid, SIGKILL);
            return false;
        },
        static_cast<unsigned>(settings.timeoutMs > 0 ? settings.timeoutMs : 1));

    // Returns once maybeFinish() or the timeout quits the loop.
    run.loop->run();

    run.timeoutConn.disconnect();
    run.childConn.disconnect();
    run.drainConn.disconnect();
    run.out.close();
    run.err.close();

    record.durationMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
            .count();
    // Anything short of a clean exit within the deadline counts as failure.
    record.success = !record.timedOut && record.termSignal == 0 && record.exitCode == 0;

    if (!trim(record.stdoutText).empty())
        spdlog::info("[Hook] {}", trim(record.stdoutText));
    if (record.success)
        spdlog::info("[Hook] {}", record.describe());
    else
        spdlog::warn("[Hook] {}{}", record.describe(),
                     record.stderrText.empty() ? "" : ": " + trim(record.stderrText));

    return record;
}
