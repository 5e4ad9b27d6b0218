#pragma once

#include <datapod/datapod.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <soulrelay/auth/soul_authenticator.hpp>
#include <soulrelay/common/config.hpp>
#include <soulrelay/common/error.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <soulrelay/market/listing.hpp>
#include <soulrelay/market/order_book.hpp>
#include <soulrelay/market/trade.hpp>
#include <soulrelay/reputation/reputation_ledger.hpp>
#include <soulrelay/storage/file_store.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace soulrelay::market {

    /// Receives marketplace events; called without marketplace locks held
    class IMarketListener {
      public:
        virtual ~IMarketListener() = default;
        virtual void onTradeProposed(const Trade &trade) = 0;
        virtual void onTradeSettled(const Trade &trade) = 0;
        virtual void onTradeAborted(const Trade &trade) = 0;
        virtual void onListingExpired(const ServiceListing &listing) = 0;
    };

    /// A new listing and the trade it produced, if it matched on arrival
    struct ListingResult {
        ServiceListing listing;
        std::optional<Trade> trade;
    };

    /// What one sweep changed
    struct SweepReport {
        size_t expired_listings = 0;
        size_t aborted_trades = 0;
    };

    /// Most recent closed records by id, oldest dropped past capacity
    template <typename T> class RecentRecords {
      public:
        inline explicit RecentRecords(size_t capacity) : capacity_(capacity) {}

        inline void put(const T &record) {
            auto id = record.getId();
            auto it = records_.find(id);
            if (it != records_.end()) {
                it->second = record;
                return;
            }
            if (capacity_ == 0) {
                return;
            }

            records_.emplace(id, record);
            order_.push_back(id);
            while (order_.size() > capacity_) {
                records_.erase(order_.front());
                order_.pop_front();
            }
        }

        inline std::optional<T> find(const std::string &id) const {
            auto it = records_.find(id);
            if (it == records_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        inline const std::unordered_map<std::string, T> &all() const { return records_; }

        inline size_t size() const { return records_.size(); }

      private:
        size_t capacity_;
        std::unordered_map<std::string, T> records_;
        std::deque<std::string> order_;
    };

    /// Per-category order books, matching on arrival and the two-party trade handshake.
    /// Each category matches under its own lock; live maps hold only OPEN listings, MATCHED ones whose
    /// trade is still running, and non-terminal trades. Closed records live on in the store.
    class Marketplace {
      public:
        Marketplace(const SoulRegistry &registry, const auth::SoulAuthenticator &authenticator,
                    reputation::ReputationLedger &ledger, MarketConfig config = MarketConfig{},
                    storage::FileStore *store = nullptr);

        Marketplace(const Marketplace &) = delete;
        Marketplace &operator=(const Marketplace &) = delete;

        inline void setListener(IMarketListener *listener) { listener_ = listener; }

        /// Replace the comparator used to pick among compatible counterparts
        void setPriority(std::shared_ptr<MatchPriority> priority);

        std::string priorityName() const;

        // === Listings ===

        /// Post an offer or request and match it against the book
        dp::Result<ListingResult, dp::Error> list(SessionId owner_session, const std::string &owner_soul,
                                                  ListingKind kind, const std::string &category, dp::i64 price,
                                                  dp::i64 now = nowMillis());

        /// Owner withdraws an OPEN listing
        dp::Result<ServiceListing, dp::Error> cancel(const std::string &owner_soul, const std::string &listing_id);

        /// Cancel every OPEN listing of a disconnected session, returns how many
        size_t cancelSession(SessionId session);

        // === Trades ===

        /// Record a party's acceptance: its signature over the endorsement it gives the counterparty
        dp::Result<Trade, dp::Error> accept(SessionId session, const std::string &soul_id, const std::string &trade_id,
                                            const std::vector<uint8_t> &endorsement_signature,
                                            dp::i64 now = nowMillis());

        /// Expire stale listings and abort trades past their deadline
        SweepReport sweep(dp::i64 now = nowMillis());

        // === Queries ===

        std::vector<ServiceListing> openListings() const;

        /// Live record, or a closed one still in recent history
        std::optional<ServiceListing> listing(const std::string &listing_id) const;

        std::optional<Trade> trade(const std::string &trade_id) const;

        std::vector<Trade> tradesFor(const std::string &soul_id) const;

        size_t openCountFor(const std::string &soul_id) const;

        /// Listings and trades still held in the live maps
        size_t liveRecordCount() const;

        // === Start-up replay ===

        /// Load persisted listing history. A listing that was OPEN is cancelled: its session is gone.
        void restoreListing(const ServiceListing &listing);

        /// Load persisted trade history. Non-terminal trades keep their deadlines.
        void restoreTrade(const Trade &trade);

        const MarketConfig &config() const { return config_; }

      private:
        /// One category's book and records. mutex guards the state; write_mutex keeps its store
        /// appends in mutation order once mutex is released.
        struct Category {
            inline explicit Category(const std::string &name) : book(name) {}

            OrderBook book;
            std::unordered_map<std::string, ServiceListing> listings;
            std::unordered_map<std::string, Trade> trades;
            std::set<std::pair<dp::i64, std::string>> expiring;  // OPEN listings by expires_at
            std::set<std::pair<dp::i64, std::string>> deadlines; // Live trades by deadline
            std::mutex mutex;
            std::mutex write_mutex;
        };

        /// Records to append once the category lock is handed over
        struct Writes {
            std::vector<ServiceListing> listings;
            std::vector<Trade> trades;
        };

        Category &categoryFor(const std::string &name);
        Category *findCategory(const std::string &name) const;
        std::vector<Category *> allCategories() const;

        Category *homeOfListing(const std::string &listing_id) const;
        Category *homeOfTrade(const std::string &trade_id) const;

        // Caller holds the category's mutex
        bool admitLocked(const ServiceListing &listing, size_t &held);
        void closeOpenLocked(Category &category, ServiceListing &listing, ListingStatus status);
        void evictListingLocked(Category &category, const std::string &listing_id);
        Trade retireTradeLocked(Category &category, const std::string &trade_id, TradeStatus status,
                                Writes &writes);
        dp::Result<Trade, dp::Error> abortOnAcceptLocked(Category &category, std::unique_lock<std::mutex> &lock,
                                                         const std::string &trade_id);

        /// Release lock and append writes, still ordered against the category's other writers
        void commit(Category &category, std::unique_lock<std::mutex> &lock, const Writes &writes);
        void persist(const ServiceListing &listing);
        void persist(const Trade &trade);

        dp::Result<Trade, dp::Error> closedTradeResult(const std::string &trade_id) const;
        bool withdraw(const std::string &listing_id, ListingStatus status, ServiceListing *out);

        void settle(const Trade &trade);

        const SoulRegistry &registry_;
        const auth::SoulAuthenticator &authenticator_;
        reputation::ReputationLedger &ledger_;
        MarketConfig config_;
        storage::FileStore *store_;
        IMarketListener *listener_ = nullptr;

        std::unordered_map<std::string, std::unique_ptr<Category>> categories_;
        std::shared_ptr<MatchPriority> priority_;
        mutable std::shared_mutex categories_mutex_;

        // Cross-category indexes. Lock order: a category's mutex, then index_mutex_; never two categories.
        std::unordered_map<std::string, std::string> listing_home_; // Live listing id -> category
        std::unordered_map<std::string, std::string> trade_home_;   // Live trade id -> category
        std::unordered_map<std::string, size_t> open_by_soul_;
        std::unordered_map<SessionId, std::unordered_set<std::string>> open_by_session_;
        RecentRecords<ServiceListing> closed_listings_;
        RecentRecords<Trade> closed_trades_;
        mutable std::mutex index_mutex_;
    };

} // namespace soulrelay::market
