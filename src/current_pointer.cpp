#include "current_pointer.hpp"
#include <atomic>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
std::atomic<unsigned> g_tempCounter{0};
}

CurrentThemePointer::CurrentThemePointer(std::string linkPath) : m_linkPath(std::move(linkPath)) {}

std::string CurrentThemePointer::temporaryLinkPath() const
{
    fs::path link(m_linkPath);
    std::string name = "." + link.filename().string() + ".tmp-" + std::to_string(::getpid()) + "-" +
                       std::to_string(g_tempCounter.fetch_add(1));
    return (link.parent_path() / name).string();
}

PointerState CurrentThemePointer::read() const
{
    PointerState state;
    std::error_code ec;

    fs::path target = fs::read_symlink(m_linkPath, ec);
    if (ec)
    {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            return state;

        // Exists but is not a link (EINVAL), or unreadable.
        state.status = PointerState::Status::Broken;
        state.message = m_linkPath + ": " + ec.message();
        return state;
    }

    state.target = target.string();
    state.themeId = target.lexically_normal().filename().string();
    if (state.themeId.empty())
        state.themeId = target.lexically_normal().parent_path().filename().string();

    fs::path resolved = target.is_absolute() ? target : fs::path(m_linkPath).parent_path() / target;
    if (!fs::is_directory(resolved, ec))
    {
        state.status = PointerState::Status::Broken;
        state.message = "current theme target " + state.target + " no longer exists";
        return state;
    }

    state.status = PointerState::Status::Resolved;
    return state;
}

PointerWriteResult CurrentThemePointer::atomicSet(const std::string &bundlePath)
{
    PointerWriteResult result;
    std::error_code ec;

    if (bundlePath.empty())
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = "refusing to point " + m_linkPath + " at an empty path";
        return result;
    }

    fs::path link(m_linkPath);
    fs::create_directories(link.parent_path(), ec);
    if (ec)
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = "cannot create " + link.parent_path().string() + ": " + ec.message();
        return result;
    }

    const std::string tmp = temporaryLinkPath();
    fs::remove(tmp, ec);

    fs::create_directory_symlink(bundlePath, tmp, ec);
    if (ec)
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = "cannot create symlink " + tmp + ": " + ec.message();
        return result;
    }

    fs::rename(tmp, link, ec);
    if (ec)
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = "cannot replace " + m_linkPath + ": " + ec.message();

        std::error_code cleanup;
        fs::remove(tmp, cleanup);
        if (cleanup)
            spdlog::warn("[Pointer] Leaving stray temporary link {}: {}", tmp, cleanup.message());
        return result;
    }

    spdlog::debug("[Pointer] {} -> {}", m_linkPath, bundlePath);
    return result;
}

PointerWriteResult CurrentThemePointer::clear()
{
    PointerWriteResult result;
    std::error_code ec;

    auto status = fs::symlink_status(m_linkPath, ec);
    if (!fs::exists(status))
        return result;
    if (!fs::is_symlink(status))
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = m_linkPath + " is not a symbolic link";
        return result;
    }

    fs::remove(m_linkPath, ec);
    if (ec)
    {
        result.error = ErrorCode::PointerWriteFailure;
        result.message = "cannot remove " + m_linkPath + ": " + ec.message();
    }
    return result;
}
