#include "sanctions/storage/in_memory_result_store.hpp"
#include "sanctions/watchlist/in_memory_watchlist_store.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace sn;

TEST_CASE("Watchlist upsert assigns and keeps ids", "[watchlist]") {
    watchlist::InMemoryWatchlistStore store;

    const auto first = store.upsert(testing::johnSmith());
    const auto second = store.upsert(testing::mariaGarcia());
    REQUIRE(first != 0);
    REQUIRE(second != first);
    REQUIRE(store.size() == 2);

    auto explicitRecord = testing::vladimirPutin();
    explicitRecord.id = 100;
    REQUIRE(store.upsert(explicitRecord) == 100);
    REQUIRE(store.upsert(testing::record("Hamas")) == 101);

    auto replacement = testing::johnSmith();
    replacement.id = first;
    replacement.reason = "updated";
    REQUIRE(store.upsert(replacement) == first);
    REQUIRE(store.size() == 4);
    REQUIRE(store.find(first)->reason == "updated");
    REQUIRE_FALSE(store.find(999));
}

TEST_CASE("Snapshots are immutable once handed out", "[watchlist]") {
    watchlist::InMemoryWatchlistStore store;
    const auto id = store.upsert(testing::johnSmith());
    store.upsert(testing::mariaGarcia());

    const auto before = store.activeRecords();
    REQUIRE(before->size() == 2);

    REQUIRE(store.deactivate(id));
    REQUIRE_FALSE(store.deactivate(id));
    REQUIRE_FALSE(store.deactivate(12345));

    REQUIRE(before->size() == 2);
    const auto after = store.activeRecords();
    REQUIRE(after->size() == 1);
    REQUIRE(after->front().name == "Maria Garcia");
    REQUIRE(store.size() == 2);
}

TEST_CASE("List summary counts active records per list", "[watchlist]") {
    watchlist::InMemoryWatchlistStore store;
    const auto smith = store.upsert(testing::johnSmith());
    store.upsert(testing::record("Hamas"));
    store.upsert(testing::mariaGarcia());
    store.upsert(testing::vladimirPutin());
    store.deactivate(smith);

    const auto lists = store.listNames();
    REQUIRE(lists.size() == 2);
    for (const auto& l : lists) {
        if (l.listName == "OFAC SDN List") {
            REQUIRE(l.source == "OFAC");
            REQUIRE(l.activeRecords == 1);
        } else {
            REQUIRE(l.listName == "EU Sanctions");
            REQUIRE(l.activeRecords == 2);
        }
    }
}

TEST_CASE("Result store keeps the latest payment result", "[storage]") {
    storage::InMemoryResultStore store;

    events::PaymentScreeningResult r;
    r.paymentId = "P1";
    r.riskScore = 0.2;
    store.store(r);
    r.riskScore = 0.9;
    store.store(r);
    store.store(core::ScreeningResult{});

    REQUIRE(store.paymentCount() == 2);
    REQUIRE(store.screeningCount() == 1);
    REQUIRE(store.screenings().size() == 1);
    REQUIRE(store.findPayment("P1")->riskScore == 0.9);
    REQUIRE_FALSE(store.findPayment("P2"));
}
