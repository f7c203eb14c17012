#pragma once

#include "sanctions/watchlist/i_watchlist_store.hpp"
#include "sanctions/core/types.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sn::watchlist {

struct ListSummary {
    std::string listName;
    std::string source;
    std::size_t activeRecords{0};
};

/**
 * Watchlist store kept in process memory.
 *
 * Writers rebuild the active snapshot under the lock; readers get the
 * current snapshot pointer and never block a screening in progress.
 */
class InMemoryWatchlistStore final : public IWatchlistStore {
public:
    InMemoryWatchlistStore() = default;

    // Inserts or replaces by id. A record with id 0 gets the next free id.
    core::RecordId upsert(core::WatchlistRecord record);
    bool deactivate(core::RecordId id);
    std::optional<core::WatchlistRecord> find(core::RecordId id) const;

    std::size_t size() const;
    std::vector<ListSummary> listNames() const;

    RecordSnapshot activeRecords() const override;

private:
    void rebuildSnapshot();

    mutable std::mutex mutex_;
    std::map<core::RecordId, core::WatchlistRecord> records_;
    RecordSnapshot snapshot_{std::make_shared<const std::vector<core::WatchlistRecord>>()};
    std::atomic<core::RecordId> nextId_{1};
};

} // namespace sn::watchlist
