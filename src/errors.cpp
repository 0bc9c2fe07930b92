#include "errors.hpp"

const char *errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::None:
        return "OK";
    case ErrorCode::NotFound:
        return "THEME_NOT_FOUND";
    case ErrorCode::InvalidBundle:
        return "THEME_INVALID";
    case ErrorCode::InvalidThemeId:
        return "INVALID_THEME_ID";
    case ErrorCode::PointerWriteFailure:
        return "SYMLINK_ERROR";
    case ErrorCode::BrokenPointer:
        return "BROKEN_POINTER";
    case ErrorCode::HookFailure:
        return "HOOK_ERROR";
    case ErrorCode::HookTimeout:
        return "HOOK_TIMEOUT";
    case ErrorCode::InstanceConflict:
        return "INSTANCE_CONFLICT";
    case ErrorCode::Cancelled:
        return "CANCELLED";
    }
    return "UNEXPECTED_ERROR";
}

std::string formatError(ErrorCode code, const std::string &message)
{
    std::string out = errorCodeName(code);
    if (!message.empty())
    {
        out += ": ";
        out += message;
    }
    return out;
}
