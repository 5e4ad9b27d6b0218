#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <soulrelay/storage/file_store.hpp>

using namespace soulrelay;
using namespace soulrelay::storage;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

namespace {

    market::ServiceListing makeListing(const std::string &id, market::ListingStatus status) {
        market::ServiceListing listing;
        listing.id = dp::String(id.c_str());
        listing.kind = static_cast<dp::u8>(market::ListingKind::Offer);
        listing.category = dp::String("code");
        listing.price = 42;
        listing.owner_soul = dp::String("owner");
        listing.sequence = 3;
        listing.setStatus(status);
        return listing;
    }

} // namespace

TEST_SUITE("File Store Tests") {

    TEST_CASE("Open creates the record files") {
        TestStore ts("open_creates");
        REQUIRE(ts.store.open(ts.path).is_ok());
        CHECK(ts.store.isOpen());

        for (const char *name : {FileStore::SOULS_FILE, FileStore::REPUTATION_FILE, FileStore::LISTINGS_FILE,
                                 FileStore::TRADES_FILE}) {
            CHECK(std::filesystem::exists(std::filesystem::path(ts.path) / name));
        }

        ts.store.close();
        CHECK_FALSE(ts.store.isOpen());
    }

    TEST_CASE("Writes fail when closed") {
        FileStore store;
        auto key = Key::generate();
        REQUIRE(key.is_ok());
        CHECK(store.appendSoul(Soul(key.value(), "", "", 1)).is_err());
        CHECK(store.loadSouls().empty());
    }

    TEST_CASE("Souls and reputation events survive reopening") {
        TestStore ts("souls_events");
        auto key = Key::generate();
        REQUIRE(key.is_ok());
        Soul soul(key.value(), "engineer", "REAL", 1234);

        reputation::ReputationEvent event("evt-1", "subject", soul.getId(), 2, "HELPFUL");
        event.timestamp = 99;
        event.setSignature({1, 2, 3});

        REQUIRE(ts.store.open(ts.path).is_ok());
        REQUIRE(ts.store.appendSoul(soul).is_ok());
        REQUIRE(ts.store.appendReputationEvent(event).is_ok());
        ts.store.close();

        REQUIRE(ts.store.open(ts.path).is_ok());
        auto souls = ts.store.loadSouls();
        REQUIRE(souls.size() == 1);
        CHECK(souls[0].getId() == soul.getId());
        CHECK(souls[0].getParadigm() == "engineer");
        CHECK(souls[0].getMode() == "REAL");
        CHECK(souls[0].created_at == 1234);
        auto restored_key = souls[0].toKey();
        REQUIRE(restored_key.is_ok());
        CHECK(restored_key.value().getId() == key.value().getId());

        auto events = ts.store.loadReputationEvents();
        REQUIRE(events.size() == 1);
        CHECK(events[0].getEventId() == "evt-1");
        CHECK(events[0].delta == 2);
        CHECK(events[0].timestamp == 99);
        CHECK(events[0].getSignature() == std::vector<uint8_t>{1, 2, 3});
    }

    TEST_CASE("Latest listing record wins") {
        TestStore ts("latest_listing");
        REQUIRE(ts.store.open(ts.path).is_ok());

        REQUIRE(ts.store.appendListing(makeListing("a", market::ListingStatus::Open)).is_ok());
        REQUIRE(ts.store.appendListing(makeListing("b", market::ListingStatus::Open)).is_ok());
        REQUIRE(ts.store.appendListing(makeListing("a", market::ListingStatus::Cancelled)).is_ok());

        auto listings = ts.store.loadListings();
        REQUIRE(listings.size() == 2);
        CHECK(listings[0].getId() == "a");
        CHECK(listings[0].getStatus() == market::ListingStatus::Cancelled);
        CHECK(listings[1].getId() == "b");
        CHECK(listings[1].isOpen());
        CHECK(listings[1].price == 42);
    }

    TEST_CASE("Latest trade record wins") {
        TestStore ts("latest_trade");
        REQUIRE(ts.store.open(ts.path).is_ok());

        market::Trade trade;
        trade.id = dp::String("t1");
        trade.provider_soul = dp::String("p");
        trade.seeker_soul = dp::String("s");
        trade.price = 10;
        trade.status = static_cast<dp::u8>(market::TradeStatus::Proposed);
        REQUIRE(ts.store.appendTrade(trade).is_ok());

        trade.status = static_cast<dp::u8>(market::TradeStatus::Settled);
        REQUIRE(ts.store.appendTrade(trade).is_ok());

        auto trades = ts.store.loadTrades();
        REQUIRE(trades.size() == 1);
        CHECK(trades[0].getStatus() == market::TradeStatus::Settled);
        CHECK(trades[0].getProvider() == "p");
    }

    TEST_CASE("Torn tail is cut on open and later appends survive") {
        TestStore ts("torn_tail");
        auto first = Key::generate();
        auto second = Key::generate();
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        auto souls_file = std::filesystem::path(ts.path) / FileStore::SOULS_FILE;

        REQUIRE(ts.store.open(ts.path).is_ok());
        REQUIRE(ts.store.appendSoul(Soul(first.value(), "", "", 1)).is_ok());
        ts.store.close();
        auto whole = std::filesystem::file_size(souls_file);

        SUBCASE("Length prefix promising more bytes than follow") {
            std::ofstream out(souls_file, std::ios::binary | std::ios::app);
            dp::u32 len = 500;
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write("xx", 2);
        }

        SUBCASE("Huge length prefix") {
            std::ofstream out(souls_file, std::ios::binary | std::ios::app);
            dp::u32 len = 0xFFFFFFFF;
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
        }

        SUBCASE("Partial length prefix") {
            std::ofstream out(souls_file, std::ios::binary | std::ios::app);
            out.write("\x07\x00", 2);
        }

        REQUIRE(std::filesystem::file_size(souls_file) > whole);
        REQUIRE(ts.store.open(ts.path).is_ok());
        CHECK(std::filesystem::file_size(souls_file) == whole);

        REQUIRE(ts.store.appendSoul(Soul(second.value(), "late", "", 2)).is_ok());
        ts.store.close();

        REQUIRE(ts.store.open(ts.path).is_ok());
        auto souls = ts.store.loadSouls();
        REQUIRE(souls.size() == 2);
        CHECK(souls[0].getId() == first.value().getId());
        CHECK(souls[1].getId() == second.value().getId());
        CHECK(souls[1].getParadigm() == "late");
        CHECK(ts.store.skippedRecords() == 0);
    }

    TEST_CASE("Intact files are left alone on open") {
        TestStore ts("intact");
        REQUIRE(ts.store.open(ts.path).is_ok());
        REQUIRE(ts.store.appendListing(makeListing("a", market::ListingStatus::Open)).is_ok());
        REQUIRE(ts.store.appendListing(makeListing("a", market::ListingStatus::Matched)).is_ok());
        ts.store.close();

        auto listings_file = std::filesystem::path(ts.path) / FileStore::LISTINGS_FILE;
        auto size = std::filesystem::file_size(listings_file);
        REQUIRE(ts.store.open(ts.path).is_ok());
        CHECK(std::filesystem::file_size(listings_file) == size);

        auto listings = ts.store.loadListings();
        REQUIRE(listings.size() == 1);
        CHECK(listings[0].getStatus() == market::ListingStatus::Matched);
    }
}
