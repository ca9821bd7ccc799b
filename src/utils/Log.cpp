#include "utils/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace sw::log
{

namespace
{

std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::mutex s_mutex;
std::ofstream s_ofs;
std::filesystem::path s_path;

std::string to_upper(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch)
                   { return static_cast<char>(std::toupper(ch)); });
    return out;
}

std::optional<std::time_t> modification_time(std::filesystem::path const &path)
{
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0)
    {
        return std::nullopt;
    }
    return info.st_mtime;
}

} // namespace

std::optional<Level> parse_level(std::string_view value)
{
    auto const upper = to_upper(value);
    if (upper == "DEBUG")
    {
        return Level::Debug;
    }
    if (upper == "INFO")
    {
        return Level::Info;
    }
    if (upper == "WARN" || upper == "WARNING")
    {
        return Level::Warn;
    }
    if (upper == "ERROR" || upper == "CRITICAL")
    {
        return Level::Error;
    }
    return std::nullopt;
}

void set_level(Level level) noexcept
{
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() noexcept
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::move(path);
    if (s_path.empty())
    {
        return;
    }
    std::error_code ec;
    auto parent = s_path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }
    s_ofs.open(s_path.string(), std::ios::app | std::ios::out);
    if (!s_ofs.is_open())
    {
        std::fprintf(stderr, "unable to open log file %s\n",
                     s_path.string().c_str());
    }
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

std::optional<std::filesystem::path>
rotate_log_file(std::filesystem::path const &path, int max_files)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0)
    {
        return std::nullopt;
    }
    auto mtime = modification_time(path);
    if (!mtime)
    {
        return std::nullopt;
    }
    std::tm tm{};
    gmtime_r(&*mtime, &tm);
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);

    auto const stem = path.stem().string();
    auto const extension = path.extension().string();
    auto rotated = path.parent_path() / (stem + "-" + stamp + extension);
    std::filesystem::rename(path, rotated, ec);
    if (ec)
    {
        std::fprintf(stderr, "failed to rotate log file %s: %s\n",
                     path.string().c_str(), ec.message().c_str());
        return std::nullopt;
    }

    if (max_files <= 0)
    {
        return rotated;
    }
    // Timestamps sort lexicographically, so the oldest files come first.
    std::vector<std::filesystem::path> existing;
    auto const prefix = stem + "-";
    for (auto const &entry :
         std::filesystem::directory_iterator(path.parent_path().empty()
                                                 ? std::filesystem::path(".")
                                                 : path.parent_path(),
                                             ec))
    {
        auto name = entry.path().filename().string();
        if (name.size() > prefix.size() + extension.size() &&
            name.rfind(prefix, 0) == 0 &&
            name.compare(name.size() - extension.size(), extension.size(),
                         extension) == 0)
        {
            existing.push_back(entry.path());
        }
    }
    std::sort(existing.begin(), existing.end());
    while (existing.size() > static_cast<std::size_t>(max_files))
    {
        std::error_code remove_ec;
        if (!std::filesystem::remove(existing.front(), remove_ec) && remove_ec)
        {
            std::fprintf(stderr, "failed to remove old log file %s: %s\n",
                         existing.front().string().c_str(),
                         remove_ec.message().c_str());
        }
        existing.erase(existing.begin());
    }
    return rotated;
}

} // namespace sw::log
