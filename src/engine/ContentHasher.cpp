#include "engine/ContentHasher.hpp"

#include "utils/HashStore.hpp"
#include "utils/Log.hpp"

namespace sw::engine
{

ContentHasher::ContentHasher(utils::IFileSystem const &fs,
                             storage::HashStore *cache)
    : fs_(fs), cache_(cache != nullptr && cache->is_valid() ? cache : nullptr)
{
}

std::optional<std::string>
ContentHasher::hash(std::filesystem::path const &path,
                    utils::FileStat const &stat, std::error_code &ec)
{
    ec.clear();
    auto const key = path.string();
    if (cache_ != nullptr)
    {
        if (auto cached = cache_->get(key, stat.size, stat.mtime_ns))
        {
            ++hits_;
            return cached;
        }
    }
    ++misses_;
    auto computed = fs_.compute_hash(path, ec);
    if (!computed)
    {
        SW_LOG_WARN("failed to hash {}: {}", key, ec.message());
        return std::nullopt;
    }
    if (cache_ != nullptr &&
        !cache_->put(key, stat.size, stat.mtime_ns, *computed))
    {
        SW_LOG_DEBUG("hash for {} was not cached", key);
    }
    return computed;
}

} // namespace sw::engine
