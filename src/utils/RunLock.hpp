#pragma once

#include <filesystem>
#include <system_error>

namespace sw::utils
{

// Exclusive advisory lock on a file, held for the lifetime of the object.
// The owning pid is written into the file for operators.
class RunLock
{
  public:
    enum class Status
    {
        Acquired,
        HeldElsewhere,
        Failed,
    };

    RunLock() = default;
    ~RunLock();

    RunLock(RunLock const &) = delete;
    RunLock &operator=(RunLock const &) = delete;

    Status acquire(std::filesystem::path const &path, std::error_code &ec);
    void release() noexcept;

    bool held() const noexcept
    {
        return fd_ >= 0;
    }

  private:
    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace sw::utils
