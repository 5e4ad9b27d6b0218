#include <algorithm>
#include <iostream>
#include <soulrelay/common/random.hpp>
#include <soulrelay/identity/signer.hpp>
#include <soulrelay/market/marketplace.hpp>

namespace soulrelay::market {

    Marketplace::Marketplace(const SoulRegistry &registry, const auth::SoulAuthenticator &authenticator,
                             reputation::ReputationLedger &ledger, MarketConfig config, storage::FileStore *store)
        : registry_(registry), authenticator_(authenticator), ledger_(ledger), config_(config), store_(store),
          priority_(std::make_shared<PriceTimePriority>()), closed_listings_(config.closed_history),
          closed_trades_(config.closed_history) {}

    void Marketplace::setPriority(std::shared_ptr<MatchPriority> priority) {
        if (!priority) {
            return;
        }
        std::unique_lock lock(categories_mutex_);
        priority_ = std::move(priority);
    }

    std::string Marketplace::priorityName() const {
        std::shared_lock lock(categories_mutex_);
        return priority_->name();
    }

    // ===========================================
    // Categories
    // ===========================================

    Marketplace::Category &Marketplace::categoryFor(const std::string &name) {
        if (auto *existing = findCategory(name)) {
            return *existing;
        }

        std::unique_lock lock(categories_mutex_);
        auto &category = categories_[name];
        if (!category) {
            category = std::make_unique<Category>(name);
        }
        return *category;
    }

    Marketplace::Category *Marketplace::findCategory(const std::string &name) const {
        std::shared_lock lock(categories_mutex_);
        auto it = categories_.find(name);
        return it == categories_.end() ? nullptr : it->second.get();
    }

    std::vector<Marketplace::Category *> Marketplace::allCategories() const {
        std::shared_lock lock(categories_mutex_);
        std::vector<Category *> all;
        all.reserve(categories_.size());
        for (const auto &[name, category] : categories_) {
            all.push_back(category.get());
        }
        return all;
    }

    Marketplace::Category *Marketplace::homeOfListing(const std::string &listing_id) const {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            auto it = listing_home_.find(listing_id);
            if (it == listing_home_.end()) {
                return nullptr;
            }
            name = it->second;
        }
        return findCategory(name);
    }

    Marketplace::Category *Marketplace::homeOfTrade(const std::string &trade_id) const {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            auto it = trade_home_.find(trade_id);
            if (it == trade_home_.end()) {
                return nullptr;
            }
            name = it->second;
        }
        return findCategory(name);
    }

    // ===========================================
    // Listings
    // ===========================================

    dp::Result<ListingResult, dp::Error> Marketplace::list(SessionId owner_session, const std::string &owner_soul,
                                                           ListingKind kind, const std::string &category,
                                                           dp::i64 price, dp::i64 now) {
        if (price <= 0 || price > config_.max_price) {
            return dp::Result<ListingResult, dp::Error>::err(invalid_price());
        }
        if (category.empty()) {
            return dp::Result<ListingResult, dp::Error>::err(syntax_error("Missing service category"));
        }

        auto bound = authenticator_.boundSoul(owner_session);
        if (!bound || *bound != owner_soul) {
            return dp::Result<ListingResult, dp::Error>::err(not_authenticated());
        }

        std::shared_ptr<MatchPriority> priority;
        {
            std::shared_lock lock(categories_mutex_);
            priority = priority_;
        }

        auto &home = categoryFor(category);
        ListingResult result;
        {
            std::unique_lock<std::mutex> lock(home.mutex);

            ServiceListing listing;
            listing.id = dp::String(randomHex(8).c_str());
            listing.kind = static_cast<dp::u8>(kind);
            listing.category = dp::String(category.c_str());
            listing.price = price;
            listing.owner_soul = dp::String(owner_soul.c_str());
            listing.owner_session = owner_session;
            listing.created_at = now;
            listing.expires_at = now + config_.listing_ttl_ms;
            listing.setStatus(ListingStatus::Open);

            size_t held = 0;
            if (!admitLocked(listing, held)) {
                auto message = "Soul already holds " + std::to_string(held) + " open listings";
                return dp::Result<ListingResult, dp::Error>::err(limit_exceeded(message.c_str()));
            }
            listing.sequence = home.book.nextSequence();

            auto listing_id = listing.getId();
            home.listings[listing_id] = listing;
            home.expiring.emplace(listing.expires_at, listing_id);

            Writes writes;
            auto match = home.book.bestMatch(listing, *priority, now);
            if (match) {
                auto &incoming = home.listings.at(listing_id);
                auto &resting = home.listings.at(match->getId());

                const auto &offer = incoming.getKind() == ListingKind::Offer ? incoming : resting;
                const auto &request = incoming.getKind() == ListingKind::Offer ? resting : incoming;

                Trade trade;
                trade.id = dp::String(randomHex(8).c_str());
                trade.category = listing.category;
                trade.offer_id = offer.id;
                trade.request_id = request.id;
                trade.provider_soul = offer.owner_soul;
                trade.seeker_soul = request.owner_soul;
                trade.price = resting.price;
                trade.credit = config_.settlement_credit;
                trade.setStatus(TradeStatus::Proposed);
                trade.created_at = now;
                trade.deadline = now + config_.trade_deadline_ms;

                closeOpenLocked(home, incoming, ListingStatus::Matched);
                closeOpenLocked(home, resting, ListingStatus::Matched);
                incoming.trade_id = trade.id;
                resting.trade_id = trade.id;

                auto trade_id = trade.getId();
                home.trades[trade_id] = trade;
                home.deadlines.emplace(trade.deadline, trade_id);
                {
                    std::lock_guard<std::mutex> index_lock(index_mutex_);
                    trade_home_[trade_id] = category;
                }

                writes.listings.push_back(incoming);
                writes.listings.push_back(resting);
                writes.trades.push_back(trade);
                result.trade = trade;
            } else {
                home.book.add(listing);
                writes.listings.push_back(listing);
            }

            result.listing = home.listings.at(listing_id);
            commit(home, lock, writes);
        }

        std::cout << "Listing " << result.listing.getId() << " " << listingKindToString(kind) << " " << category
                  << " @" << price << " by " << owner_soul << std::endl;

        if (result.trade) {
            std::cout << "Trade " << result.trade->getId() << " proposed: " << result.trade->getProvider() << " -> "
                      << result.trade->getSeeker() << " @" << result.trade->price << std::endl;
            if (listener_ != nullptr) {
                listener_->onTradeProposed(*result.trade);
            }
        }

        return dp::Result<ListingResult, dp::Error>::ok(result);
    }

    bool Marketplace::withdraw(const std::string &listing_id, ListingStatus status, ServiceListing *out) {
        auto *home = homeOfListing(listing_id);
        if (home == nullptr) {
            return false;
        }

        std::unique_lock<std::mutex> lock(home->mutex);
        // It may have matched or closed since the index lookup
        auto it = home->listings.find(listing_id);
        if (it == home->listings.end() || !it->second.isOpen()) {
            return false;
        }

        closeOpenLocked(*home, it->second, status);
        Writes writes;
        writes.listings.push_back(it->second);
        if (out != nullptr) {
            *out = it->second;
        }
        evictListingLocked(*home, listing_id);
        commit(*home, lock, writes);
        return true;
    }

    dp::Result<ServiceListing, dp::Error> Marketplace::cancel(const std::string &owner_soul,
                                                              const std::string &listing_id) {
        auto current = listing(listing_id);
        if (!current) {
            return dp::Result<ServiceListing, dp::Error>::err(no_such_listing());
        }
        if (current->getOwner() != owner_soul) {
            return dp::Result<ServiceListing, dp::Error>::err(not_party("Not the owner of this listing"));
        }

        ServiceListing cancelled;
        if (!withdraw(listing_id, ListingStatus::Cancelled, &cancelled)) {
            return dp::Result<ServiceListing, dp::Error>::err(invalid_state("Listing is not open"));
        }

        std::cout << "Listing " << listing_id << " cancelled by " << owner_soul << std::endl;
        return dp::Result<ServiceListing, dp::Error>::ok(cancelled);
    }

    size_t Marketplace::cancelSession(SessionId session) {
        std::vector<std::string> owned;
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            auto it = open_by_session_.find(session);
            if (it != open_by_session_.end()) {
                owned.assign(it->second.begin(), it->second.end());
            }
        }

        size_t cancelled = 0;
        for (const auto &id : owned) {
            if (withdraw(id, ListingStatus::Cancelled, nullptr)) {
                cancelled++;
            }
        }

        if (cancelled > 0) {
            std::cout << "Cancelled " << cancelled << " open listings of session " << session << std::endl;
        }
        return cancelled;
    }

    // ===========================================
    // Trades
    // ===========================================

    dp::Result<Trade, dp::Error> Marketplace::accept(SessionId session, const std::string &soul_id,
                                                     const std::string &trade_id,
                                                     const std::vector<uint8_t> &endorsement_signature, dp::i64 now) {
        auto bound = authenticator_.boundSoul(session);
        if (!bound || *bound != soul_id) {
            return dp::Result<Trade, dp::Error>::err(not_authenticated());
        }

        auto *home = homeOfTrade(trade_id);
        if (home == nullptr) {
            return closedTradeResult(trade_id);
        }

        std::unique_lock<std::mutex> lock(home->mutex);
        auto it = home->trades.find(trade_id);
        if (it == home->trades.end()) {
            return closedTradeResult(trade_id);
        }
        if (!it->second.isParty(soul_id)) {
            return dp::Result<Trade, dp::Error>::err(not_party());
        }
        if (now > it->second.deadline) {
            return abortOnAcceptLocked(*home, lock, trade_id);
        }
        if (it->second.hasAccepted(soul_id)) {
            return dp::Result<Trade, dp::Error>::ok(it->second);
        }

        auto endorsement = it->second.endorsementFor(soul_id);
        lock.unlock();

        if (!verifySignature(registry_, soul_id, endorsement.canonicalBytes(), endorsement_signature)) {
            return dp::Result<Trade, dp::Error>::err(auth_failed("Endorsement signature does not verify"));
        }

        lock.lock();
        // Settled, aborted or accepted by this soul while the signature was checked
        it = home->trades.find(trade_id);
        if (it == home->trades.end()) {
            return closedTradeResult(trade_id);
        }
        if (now > it->second.deadline) {
            return abortOnAcceptLocked(*home, lock, trade_id);
        }
        if (it->second.hasAccepted(soul_id)) {
            return dp::Result<Trade, dp::Error>::ok(it->second);
        }

        Trade &trade = it->second;
        bool is_provider = soul_id == trade.getProvider();
        auto signature = dp::Vector<dp::u8>(endorsement_signature.begin(), endorsement_signature.end());
        if (is_provider) {
            trade.provider_signature = signature;
        } else {
            trade.seeker_signature = signature;
        }

        Writes writes;
        Trade snapshot;
        if (!trade.provider_signature.empty() && !trade.seeker_signature.empty()) {
            snapshot = retireTradeLocked(*home, trade_id, TradeStatus::Settled, writes);
        } else {
            trade.setStatus(is_provider ? TradeStatus::AcceptedByProvider : TradeStatus::AcceptedBySeeker);
            writes.trades.push_back(trade);
            snapshot = trade;
        }
        commit(*home, lock, writes);

        std::cout << "Trade " << trade_id << " accepted by " << soul_id << " ("
                  << tradeStatusToString(snapshot.getStatus()) << ")" << std::endl;

        if (snapshot.getStatus() == TradeStatus::Settled) {
            settle(snapshot);
        }
        return dp::Result<Trade, dp::Error>::ok(snapshot);
    }

    dp::Result<Trade, dp::Error> Marketplace::abortOnAcceptLocked(Category &category,
                                                                  std::unique_lock<std::mutex> &lock,
                                                                  const std::string &trade_id) {
        Writes writes;
        auto aborted = retireTradeLocked(category, trade_id, TradeStatus::Aborted, writes);
        commit(category, lock, writes);

        std::cout << "Trade " << trade_id << " aborted: deadline passed" << std::endl;
        if (listener_ != nullptr) {
            listener_->onTradeAborted(aborted);
        }
        return dp::Result<Trade, dp::Error>::err(invalid_state("Trade deadline passed"));
    }

    dp::Result<Trade, dp::Error> Marketplace::closedTradeResult(const std::string &trade_id) const {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto closed = closed_trades_.find(trade_id);
        if (!closed) {
            return dp::Result<Trade, dp::Error>::err(no_such_trade());
        }
        return dp::Result<Trade, dp::Error>::err(
            invalid_state(("Trade is " + tradeStatusToString(closed->getStatus())).c_str()));
    }

    void Marketplace::settle(const Trade &trade) {
        for (const auto &endorser : {trade.getProvider(), trade.getSeeker()}) {
            auto admission = ledger_.submit(trade.signedEndorsementFor(endorser));
            if (!admission.accepted()) {
                std::cout << "Settlement endorsement from " << endorser << " for trade " << trade.getId() << " "
                          << reputation::reputationOutcomeToString(admission.outcome) << ": " << admission.reason
                          << std::endl;
            }
        }

        std::cout << "Trade " << trade.getId() << " settled" << std::endl;
        if (listener_ != nullptr) {
            listener_->onTradeSettled(trade);
        }
    }

    SweepReport Marketplace::sweep(dp::i64 now) {
        std::vector<ServiceListing> expired;
        std::vector<Trade> aborted;

        for (auto *category : allCategories()) {
            std::unique_lock<std::mutex> lock(category->mutex);
            Writes writes;

            while (!category->expiring.empty() && category->expiring.begin()->first < now) {
                auto listing_id = category->expiring.begin()->second;
                auto it = category->listings.find(listing_id);
                if (it == category->listings.end() || !it->second.isOpen()) {
                    category->expiring.erase(category->expiring.begin());
                    continue;
                }

                closeOpenLocked(*category, it->second, ListingStatus::Expired);
                writes.listings.push_back(it->second);
                expired.push_back(it->second);
                evictListingLocked(*category, listing_id);
            }

            while (!category->deadlines.empty() && category->deadlines.begin()->first < now) {
                auto trade_id = category->deadlines.begin()->second;
                if (category->trades.count(trade_id) == 0) {
                    category->deadlines.erase(category->deadlines.begin());
                    continue;
                }
                aborted.push_back(retireTradeLocked(*category, trade_id, TradeStatus::Aborted, writes));
            }

            commit(*category, lock, writes);
        }

        for (const auto &trade : aborted) {
            std::cout << "Trade " << trade.getId() << " aborted: deadline passed" << std::endl;
            if (listener_ != nullptr) {
                listener_->onTradeAborted(trade);
            }
        }
        for (const auto &listing : expired) {
            std::cout << "Listing " << listing.getId() << " expired" << std::endl;
            if (listener_ != nullptr) {
                listener_->onListingExpired(listing);
            }
        }

        return SweepReport{expired.size(), aborted.size()};
    }

    // ===========================================
    // Live-state bookkeeping
    // ===========================================

    bool Marketplace::admitLocked(const ServiceListing &listing, size_t &held) {
        auto limit = static_cast<size_t>(config_.max_open_listings_per_soul);
        auto owner = listing.getOwner();
        auto listing_id = listing.getId();

        std::lock_guard<std::mutex> lock(index_mutex_);
        auto open = open_by_soul_.find(owner);
        if (open != open_by_soul_.end() && open->second >= limit) {
            held = open->second;
            return false;
        }

        open_by_soul_[owner]++;
        open_by_session_[listing.owner_session].insert(listing_id);
        listing_home_[listing_id] = listing.getCategory();
        return true;
    }

    void Marketplace::closeOpenLocked(Category &category, ServiceListing &listing, ListingStatus status) {
        if (!listing.isOpen() || status == ListingStatus::Open) {
            listing.setStatus(status);
            return;
        }

        auto listing_id = listing.getId();
        category.book.remove(listing_id);
        category.expiring.erase(std::make_pair(listing.expires_at, listing_id));
        listing.setStatus(status);

        std::lock_guard<std::mutex> lock(index_mutex_);
        auto open = open_by_soul_.find(listing.getOwner());
        if (open != open_by_soul_.end()) {
            if (open->second <= 1) {
                open_by_soul_.erase(open);
            } else {
                open->second--;
            }
        }

        auto session = open_by_session_.find(listing.owner_session);
        if (session != open_by_session_.end()) {
            session->second.erase(listing_id);
            if (session->second.empty()) {
                open_by_session_.erase(session);
            }
        }
    }

    void Marketplace::evictListingLocked(Category &category, const std::string &listing_id) {
        auto it = category.listings.find(listing_id);
        if (it == category.listings.end()) {
            return;
        }

        std::lock_guard<std::mutex> lock(index_mutex_);
        closed_listings_.put(it->second);
        listing_home_.erase(listing_id);
        category.listings.erase(it);
    }

    Trade Marketplace::retireTradeLocked(Category &category, const std::string &trade_id, TradeStatus status,
                                         Writes &writes) {
        auto it = category.trades.find(trade_id);
        Trade trade = it->second;
        trade.setStatus(status);

        for (const auto &listing_id : {std::string(trade.offer_id.c_str()), std::string(trade.request_id.c_str())}) {
            auto listing = category.listings.find(listing_id);
            if (listing == category.listings.end()) {
                continue;
            }
            if (status == TradeStatus::Aborted && listing->second.getStatus() == ListingStatus::Matched) {
                listing->second.setStatus(ListingStatus::Cancelled);
                writes.listings.push_back(listing->second);
            }
            evictListingLocked(category, listing_id);
        }

        writes.trades.push_back(trade);
        category.deadlines.erase(std::make_pair(trade.deadline, trade_id));
        category.trades.erase(it);

        std::lock_guard<std::mutex> lock(index_mutex_);
        closed_trades_.put(trade);
        trade_home_.erase(trade_id);
        return trade;
    }

    void Marketplace::commit(Category &category, std::unique_lock<std::mutex> &lock, const Writes &writes) {
        std::lock_guard<std::mutex> write_lock(category.write_mutex);
        lock.unlock();

        for (const auto &listing : writes.listings) {
            persist(listing);
        }
        for (const auto &trade : writes.trades) {
            persist(trade);
        }
    }

    void Marketplace::persist(const ServiceListing &listing) {
        if (store_ == nullptr) {
            return;
        }
        auto stored = store_->appendListing(listing);
        if (stored.is_err()) {
            std::cerr << "Failed to persist listing " << listing.getId() << ": " << stored.error().message.c_str()
                      << std::endl;
        }
    }

    void Marketplace::persist(const Trade &trade) {
        if (store_ == nullptr) {
            return;
        }
        auto stored = store_->appendTrade(trade);
        if (stored.is_err()) {
            std::cerr << "Failed to persist trade " << trade.getId() << ": " << stored.error().message.c_str()
                      << std::endl;
        }
    }

    // ===========================================
    // Queries
    // ===========================================

    std::vector<ServiceListing> Marketplace::openListings() const {
        std::vector<ServiceListing> result;
        for (auto *category : allCategories()) {
            std::lock_guard<std::mutex> lock(category->mutex);
            auto resting = category->book.listings();
            result.insert(result.end(), resting.begin(), resting.end());
        }
        std::sort(result.begin(), result.end(), [](const ServiceListing &a, const ServiceListing &b) {
            if (a.getCategory() != b.getCategory()) {
                return a.getCategory() < b.getCategory();
            }
            return a.sequence < b.sequence;
        });
        return result;
    }

    std::optional<ServiceListing> Marketplace::listing(const std::string &listing_id) const {
        if (auto *home = homeOfListing(listing_id)) {
            std::lock_guard<std::mutex> lock(home->mutex);
            auto it = home->listings.find(listing_id);
            if (it != home->listings.end()) {
                return it->second;
            }
        }

        std::lock_guard<std::mutex> lock(index_mutex_);
        return closed_listings_.find(listing_id);
    }

    std::optional<Trade> Marketplace::trade(const std::string &trade_id) const {
        if (auto *home = homeOfTrade(trade_id)) {
            std::lock_guard<std::mutex> lock(home->mutex);
            auto it = home->trades.find(trade_id);
            if (it != home->trades.end()) {
                return it->second;
            }
        }

        std::lock_guard<std::mutex> lock(index_mutex_);
        return closed_trades_.find(trade_id);
    }

    std::vector<Trade> Marketplace::tradesFor(const std::string &soul_id) const {
        std::vector<Trade> result;
        for (auto *category : allCategories()) {
            std::lock_guard<std::mutex> lock(category->mutex);
            for (const auto &[id, trade] : category->trades) {
                if (trade.isParty(soul_id)) {
                    result.push_back(trade);
                }
            }
        }
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            for (const auto &[id, trade] : closed_trades_.all()) {
                if (trade.isParty(soul_id)) {
                    result.push_back(trade);
                }
            }
        }
        std::sort(result.begin(), result.end(),
                  [](const Trade &a, const Trade &b) { return a.created_at < b.created_at; });
        return result;
    }

    size_t Marketplace::openCountFor(const std::string &soul_id) const {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = open_by_soul_.find(soul_id);
        return it == open_by_soul_.end() ? 0 : it->second;
    }

    size_t Marketplace::liveRecordCount() const {
        size_t count = 0;
        for (auto *category : allCategories()) {
            std::lock_guard<std::mutex> lock(category->mutex);
            count += category->listings.size() + category->trades.size();
        }
        return count;
    }

    // ===========================================
    // Start-up replay
    // ===========================================

    void Marketplace::restoreListing(const ServiceListing &listing) {
        auto &home = categoryFor(listing.getCategory());
        std::unique_lock<std::mutex> lock(home.mutex);
        home.book.observeSequence(listing.sequence);

        ServiceListing restored = listing;
        Writes writes;
        if (restored.isOpen()) {
            restored.setStatus(ListingStatus::Cancelled);
            writes.listings.push_back(restored);
        }

        // MATCHED stays live until restoreTrade sees its trade closed
        if (restored.getStatus() == ListingStatus::Matched) {
            home.listings[restored.getId()] = restored;
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            listing_home_[restored.getId()] = restored.getCategory();
        } else {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            closed_listings_.put(restored);
        }

        commit(home, lock, writes);
    }

    void Marketplace::restoreTrade(const Trade &trade) {
        auto &home = categoryFor(trade.getCategory());
        std::lock_guard<std::mutex> lock(home.mutex);
        auto trade_id = trade.getId();

        if (trade.isTerminal()) {
            for (const auto &listing_id :
                 {std::string(trade.offer_id.c_str()), std::string(trade.request_id.c_str())}) {
                evictListingLocked(home, listing_id);
            }
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            closed_trades_.put(trade);
            return;
        }

        home.trades[trade_id] = trade;
        home.deadlines.emplace(trade.deadline, trade_id);
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        trade_home_[trade_id] = home.book.category();
    }

} // namespace soulrelay::market
