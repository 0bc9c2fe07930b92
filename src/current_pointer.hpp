#ifndef CURRENT_POINTER_HPP
#define CURRENT_POINTER_HPP

#include "errors.hpp"
#include <string>

struct PointerState
{
    enum class Status
    {
        Unset,
        Resolved,
        Broken,
    };

    Status status = Status::Unset;
    /** Link target as stored in the symlink (empty when Unset). */
    std::string target;
    /** Final path component of target. */
    std::string themeId;
    std::string message;

    bool isResolved() const { return status == Status::Resolved; }
    ErrorCode error() const { return status == Status::Broken ? ErrorCode::BrokenPointer : ErrorCode::None; }
};

struct PointerWriteResult
{
    ErrorCode error = ErrorCode::None;
    std::string message;

    bool ok() const { return error == ErrorCode::None; }
};

/**
 * The single slot naming the active theme: a symbolic link whose target is
 * the bundle directory.
 *
 * atomicSet() never removes the old link first. A new link is created under a
 * temporary name and rename(2)d over the slot, so a concurrent reader always
 * finds either the old target or the new one.
 */
class CurrentThemePointer
{
  public:
    explicit CurrentThemePointer(std::string linkPath);

    const std::string &linkPath() const { return m_linkPath; }

    PointerState read() const;

    /** Point the slot at bundlePath. On failure the previous link is untouched. */
    PointerWriteResult atomicSet(const std::string &bundlePath);

    /** Remove the slot. Missing slot is not an error. */
    PointerWriteResult clear();

  private:
    std::string temporaryLinkPath() const;

    std::string m_linkPath;
};

#endif // CURRENT_POINTER_HPP
