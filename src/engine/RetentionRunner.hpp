#pragma once

#include "engine/DecisionEngine.hpp"
#include "engine/RetentionSettings.hpp"
#include "engine/Types.hpp"
#include "utils/FS.hpp"

#include <stdexcept>
#include <vector>

namespace sw::rpc
{
class ITorrentClient;
}

namespace sw::storage
{
class HashStore;
}

namespace sw::engine
{

// The pass cannot start, e.g. the torrent list is unavailable.
class RunAbortedError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// One retention pass: snapshot, hardlink fixer, grouping, aggregation,
// decisions, deletions.
class RetentionRunner
{
  public:
    // cache may be null.
    RetentionRunner(RetentionSettings const &settings,
                    rpc::ITorrentClient &client, utils::IFileSystem &fs,
                    storage::HashStore *cache);

    // Throws RunAbortedError when no snapshot could be taken. Per torrent
    // failures end up in RunSummary::errors.
    RunSummary run();

    // Decisions of the last run, in snapshot order.
    std::vector<Decision> const &decisions() const noexcept
    {
        return decisions_;
    }
    std::vector<TorrentRecord> const &snapshot() const noexcept
    {
        return snapshot_;
    }

  private:
    std::vector<TorrentRecord> take_snapshot(RunSummary &summary);
    void refresh_identities(TorrentRecord &torrent);
    void apply_decisions(RunSummary &summary);

    RetentionSettings const &settings_;
    rpc::ITorrentClient &client_;
    utils::IFileSystem &fs_;
    storage::HashStore *cache_;
    std::vector<TorrentRecord> snapshot_;
    std::vector<Decision> decisions_;
};

} // namespace sw::engine
