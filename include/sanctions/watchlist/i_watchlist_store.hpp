#pragma once

#include "sanctions/core/types.hpp"
#include <memory>
#include <vector>

namespace sn::watchlist {

using RecordSnapshot = std::shared_ptr<const std::vector<core::WatchlistRecord>>;

// Read side of the watchlist store (Dependency Inversion Principle).
// A snapshot never changes after it is handed out.
class IWatchlistStore {
public:
    virtual ~IWatchlistStore() = default;
    virtual RecordSnapshot activeRecords() const = 0;
};

} // namespace sn::watchlist
