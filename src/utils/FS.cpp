#include "utils/FS.hpp"

#include "engine/TorrentUtils.hpp"

#include <libtorrent/hasher.hpp>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace sw::utils
{

namespace
{

constexpr std::size_t kHashChunkBytes = 1 << 20;

std::error_code last_errno()
{
    return std::error_code(errno, std::generic_category());
}

std::filesystem::path temporary_link_path(std::filesystem::path const &target)
{
    auto tmp = target;
    tmp += ".swlink-" + std::to_string(::getpid());
    return tmp;
}

} // namespace

std::optional<FileStat> LocalFileSystem::stat(std::filesystem::path const &path,
                                              std::error_code &ec) const
{
    ec.clear();
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0)
    {
        ec = last_errno();
        return std::nullopt;
    }
    FileStat result;
    result.size = static_cast<std::uint64_t>(info.st_size);
    result.mtime_ns = static_cast<std::int64_t>(info.st_mtim.tv_sec) *
                          1'000'000'000LL +
                      static_cast<std::int64_t>(info.st_mtim.tv_nsec);
    result.device = static_cast<std::uint64_t>(info.st_dev);
    result.inode = static_cast<std::uint64_t>(info.st_ino);
    result.link_count = static_cast<std::uint64_t>(info.st_nlink);
    result.is_regular = S_ISREG(info.st_mode);
    return result;
}

std::error_code
LocalFileSystem::create_hardlink(std::filesystem::path const &existing,
                                 std::filesystem::path const &target)
{
    std::error_code ec;
    auto source = stat(existing, ec);
    if (!source)
    {
        return ec;
    }
    auto current = stat(target, ec);
    if (!current)
    {
        if (ec != std::errc::no_such_file_or_directory)
        {
            return ec;
        }
        std::filesystem::create_hard_link(existing, target, ec);
        return ec;
    }
    // rename() between two names of one inode is a no-op that would leave
    // the temporary link behind.
    if (current->device == source->device && current->inode == source->inode)
    {
        return {};
    }
    auto tmp = temporary_link_path(target);
    // Left over by a killed run that had the same pid.
    std::filesystem::remove(tmp, ec);
    if (ec)
    {
        return ec;
    }
    std::filesystem::create_hard_link(existing, tmp, ec);
    if (ec)
    {
        return ec;
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        return ec;
    }
    return {};
}

std::optional<std::string>
LocalFileSystem::compute_hash(std::filesystem::path const &path,
                              std::error_code &ec) const
{
    ec.clear();
    auto info = stat(path, ec);
    if (!info)
    {
        return std::nullopt;
    }
    if (!info->is_regular)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        ec = std::make_error_code(std::errc::permission_denied);
        return std::nullopt;
    }
    libtorrent::hasher hasher;
    std::vector<char> buffer(kHashChunkBytes);
    while (input)
    {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto const count = input.gcount();
        if (count > 0)
        {
            hasher.update(buffer.data(), static_cast<int>(count));
        }
    }
    if (input.bad())
    {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return engine::sha1_to_hex(hasher.final());
}

std::vector<std::filesystem::path>
LocalFileSystem::walk_files(std::filesystem::path const &root,
                            std::error_code &ec) const
{
    std::vector<std::filesystem::path> files;
    ec.clear();
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        return files;
    }
    for (; it != std::filesystem::recursive_directory_iterator();)
    {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec))
        {
            files.push_back(it->path());
        }
        it.increment(ec);
        if (ec)
        {
            break;
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool is_within(std::filesystem::path const &path,
               std::filesystem::path const &root)
{
    auto const normal_path = path.lexically_normal();
    auto const normal_root = root.lexically_normal();
    auto path_it = normal_path.begin();
    for (auto root_it = normal_root.begin(); root_it != normal_root.end();
         ++root_it)
    {
        // A trailing separator normalizes to an empty final element.
        if (root_it->empty())
        {
            continue;
        }
        if (path_it == normal_path.end() || *path_it != *root_it)
        {
            return false;
        }
        ++path_it;
    }
    return true;
}

} // namespace sw::utils
