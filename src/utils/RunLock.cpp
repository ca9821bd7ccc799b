#include "utils/RunLock.hpp"

#include "utils/Log.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sw::utils
{

RunLock::~RunLock()
{
    release();
}

RunLock::Status RunLock::acquire(std::filesystem::path const &path,
                                 std::error_code &ec)
{
    ec.clear();
    if (held())
    {
        return Status::Acquired;
    }
    auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return Status::Failed;
        }
    }
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        ec = std::error_code(errno, std::generic_category());
        return Status::Failed;
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int const err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK)
        {
            return Status::HeldElsewhere;
        }
        ec = std::error_code(err, std::generic_category());
        return Status::Failed;
    }
    fd_ = fd;
    path_ = path;
    if (::ftruncate(fd_, 0) != 0)
    {
        SW_LOG_WARN("failed to truncate lock file {}: {}", path_.string(),
                    std::strerror(errno));
    }
    auto pid = std::to_string(::getpid()) + "\n";
    if (::write(fd_, pid.data(), pid.size()) < 0)
    {
        SW_LOG_WARN("failed to write pid to lock file {}: {}", path_.string(),
                    std::strerror(errno));
    }
    SW_LOG_DEBUG("acquired run lock {}", path_.string());
    return Status::Acquired;
}

void RunLock::release() noexcept
{
    if (fd_ < 0)
    {
        return;
    }
    // The file stays; removing it would race a waiting second instance
    // that already opened the old inode.
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace sw::utils
