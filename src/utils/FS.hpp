#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace sw::utils
{

struct FileStat
{
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;
    std::uint64_t device = 0;
    std::uint64_t inode = 0;
    std::uint64_t link_count = 0;
    bool is_regular = false;
};

// Filesystem operations the engine needs. Errors are reported through
// std::error_code and never thrown.
class IFileSystem
{
  public:
    virtual ~IFileSystem() noexcept = default;

    virtual std::optional<FileStat> stat(std::filesystem::path const &path,
                                         std::error_code &ec) const = 0;

    // Makes `target` a hardlink of `existing`. An existing `target` is
    // replaced atomically (link to a temporary name, then rename over it).
    virtual std::error_code
    create_hardlink(std::filesystem::path const &existing,
                    std::filesystem::path const &target) = 0;

    // Hex encoded SHA-1 of the file content.
    virtual std::optional<std::string>
    compute_hash(std::filesystem::path const &path,
                 std::error_code &ec) const = 0;

    // Regular files below root, recursively. Unreadable subdirectories are
    // skipped.
    virtual std::vector<std::filesystem::path>
    walk_files(std::filesystem::path const &root,
               std::error_code &ec) const = 0;
};

class LocalFileSystem final : public IFileSystem
{
  public:
    std::optional<FileStat> stat(std::filesystem::path const &path,
                                 std::error_code &ec) const override;
    std::error_code create_hardlink(std::filesystem::path const &existing,
                                    std::filesystem::path const &target) override;
    std::optional<std::string> compute_hash(std::filesystem::path const &path,
                                            std::error_code &ec) const override;
    std::vector<std::filesystem::path>
    walk_files(std::filesystem::path const &root,
               std::error_code &ec) const override;
};

// True when `path` is `root` or lies below it, compared lexically after
// normalization.
bool is_within(std::filesystem::path const &path,
               std::filesystem::path const &root);

} // namespace sw::utils
