#ifndef HOOK_RUNNER_HPP
#define HOOK_RUNNER_HPP

#include "errors.hpp"
#include "preferences.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/** Record of one hook run. */
struct HookInvocation
{
    std::string command;
    /** Positional arguments: theme id, then bundle path. */
    std::vector<std::string> args;
    int pid = -1;
    int exitCode = -1;
    /** Signal that ended the process, 0 if it exited normally. */
    int termSignal = 0;
    std::string stdoutText;
    std::string stderrText;
    bool outputTruncated = false;
    std::int64_t durationMs = 0;
    bool timedOut = false;
    /** No hook configured; nothing was run. */
    bool skipped = false;
    /** Set when the process could not be started at all. */
    std::string spawnError;
    bool success = false;

    /** HookFailure / HookTimeout for a failed run, None otherwise. */
    ErrorCode error() const;
    std::string describe() const;
};

/**
 * Runs the user's post-switch hook as `<script> <themeId> <bundlePath>`.
 *
 * The child gets its own process group so a timeout can take down anything it
 * started. Output on both pipes is captured up to HookSettings::maxOutputBytes
 * in total; the rest is read and dropped.
 */
class HookRunner
{
  public:
    using SettingsSource = std::function<HookSettings()>;

    /** source is consulted on every invoke(); an empty source means no hook. */
    explicit HookRunner(SettingsSource source);

    /** Never throws. Failures are reported in the returned record. */
    HookInvocation invoke(const std::string &themeId, const std::string &bundlePath) const;

  private:
    SettingsSource m_source;
};

#endif // HOOK_RUNNER_HPP
