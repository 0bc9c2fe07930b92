#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <cstddef>
#include <string>

namespace Logging
{
/** Rotation policy for the log file. */
constexpr std::size_t MAX_LOG_SIZE = 5 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 3;

/**
 * Install the default spdlog logger: colour stderr plus a rotating file under
 * logFile (skipped if logFile is empty or its directory cannot be created).
 */
void init(const std::string &logFile, bool verbose);

/** Flush and drop all sinks. */
void shutdown();
} // namespace Logging

#endif // LOGGING_HPP
