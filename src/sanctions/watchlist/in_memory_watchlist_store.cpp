#include "sanctions/watchlist/in_memory_watchlist_store.hpp"

#include <algorithm>

namespace sn::watchlist {

core::RecordId InMemoryWatchlistStore::upsert(core::WatchlistRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (record.id == 0) {
        record.id = nextId_++;
    } else if (record.id >= nextId_) {
        // Keep generated ids clear of explicitly assigned ones
        nextId_ = record.id + 1;
    }

    const core::RecordId id = record.id;
    records_[id] = std::move(record);
    rebuildSnapshot();
    return id;
}

bool InMemoryWatchlistStore::deactivate(core::RecordId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end() || !it->second.active) {
        return false;
    }
    it->second.active = false;
    rebuildSnapshot();
    return true;
}

std::optional<core::WatchlistRecord> InMemoryWatchlistStore::find(core::RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryWatchlistStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<ListSummary> InMemoryWatchlistStore::listNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ListSummary> result;
    for (const auto& [id, record] : records_) {
        if (!record.active) continue;
        auto it = std::find_if(result.begin(), result.end(), [&record](const ListSummary& s) {
            return s.listName == record.listName && s.source == record.source;
        });
        if (it == result.end()) {
            result.push_back(ListSummary{record.listName, record.source, 1});
        } else {
            ++it->activeRecords;
        }
    }
    return result;
}

RecordSnapshot InMemoryWatchlistStore::activeRecords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

void InMemoryWatchlistStore::rebuildSnapshot() {
    auto active = std::make_shared<std::vector<core::WatchlistRecord>>();
    active->reserve(records_.size());
    for (const auto& [id, record] : records_) {
        if (record.active) active->push_back(record);
    }
    snapshot_ = std::move(active);
}

} // namespace sn::watchlist
