#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>

/**
 * Failure taxonomy shared by every theme store component.
 * Operations return these inside result structs; nothing here is thrown.
 */
enum class ErrorCode
{
    None,
    NotFound,
    InvalidBundle,
    InvalidThemeId,
    PointerWriteFailure,
    BrokenPointer,
    HookFailure,
    HookTimeout,
    InstanceConflict,
    Cancelled,
};

/** Stable identifier a UI can map to a message, e.g. "THEME_NOT_FOUND". */
const char *errorCodeName(ErrorCode code);

/** Formats "CODE: message", or just the code name if message is empty. */
std::string formatError(ErrorCode code, const std::string &message);

#endif // ERRORS_HPP
