#include <chrono>
#include <iostream>
#include <soulrelay/relay.hpp>
#include <vector>

namespace soulrelay {

    namespace {

        /// Notifications raised while a session's own line is being dispatched are appended to its
        /// replies so they arrive after the reply that caused them.
        struct Outbox {
            SessionId session = 0;
            std::vector<std::string> lines;
        };

        thread_local Outbox *current_outbox = nullptr;

        class OutboxScope {
          public:
            explicit OutboxScope(Outbox &outbox) : previous_(current_outbox) { current_outbox = &outbox; }
            ~OutboxScope() { current_outbox = previous_; }

            OutboxScope(const OutboxScope &) = delete;
            OutboxScope &operator=(const OutboxScope &) = delete;

          private:
            Outbox *previous_;
        };

        std::string orDash(const std::string &text) { return text.empty() ? "-" : text; }

    } // namespace

    Relay::Relay(RelayConfig config, ITransport *transport)
        : config_(std::move(config)), transport_(transport),
          registry_(config_.storage.persist ? &store_ : nullptr), authenticator_(registry_, config_.auth),
          ledger_(registry_, config_.ledger, config_.storage.persist ? &store_ : nullptr),
          marketplace_(registry_, authenticator_, ledger_, config_.market,
                       config_.storage.persist ? &store_ : nullptr),
          dispatcher_(registry_, authenticator_, ledger_, marketplace_, config_) {
        ledger_.setPresenceCheck(
            [this](const std::string &soul_id) { return authenticator_.isAuthenticated(soul_id); });
        marketplace_.setListener(this);
    }

    Relay::~Relay() { stop(); }

    // ===========================================
    // Lifecycle
    // ===========================================

    dp::Result<void, dp::Error> Relay::start() {
        if (running_) {
            return dp::Result<void, dp::Error>::ok();
        }

        if (config_.storage.persist && !store_.isOpen()) {
            auto opened = store_.open(config_.storage.data_dir, config_.storage.sync_writes);
            if (opened.is_err()) {
                std::cerr << "Failed to open store at " << config_.storage.data_dir << ": "
                          << opened.error().message.c_str() << std::endl;
                return dp::Result<void, dp::Error>::err(storage_error(opened.error().message));
            }
            if (!restored_) {
                restoreState();
                restored_ = true;
            }
        }

        {
            std::lock_guard<std::mutex> lock(sweeper_mutex_);
            stopping_ = false;
        }
        running_ = true;
        sweeper_ = std::thread(&Relay::sweeperLoop, this);

        std::cout << "Relay started: " << registry_.size() << " souls, " << ledger_.eventCount()
                  << " reputation events" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    void Relay::stop() {
        {
            std::lock_guard<std::mutex> lock(sweeper_mutex_);
            stopping_ = true;
        }
        sweeper_cv_.notify_all();
        if (sweeper_.joinable()) {
            sweeper_.join();
        }

        if (running_) {
            running_ = false;
            std::cout << "Relay stopped" << std::endl;
        }
        store_.close();
    }

    void Relay::restoreState() {
        size_t skipped = 0;

        for (const auto &soul : store_.loadSouls()) {
            if (registry_.restore(soul).is_err()) {
                skipped++;
            }
        }

        for (const auto &event : store_.loadReputationEvents()) {
            if (!ledger_.restore(event).accepted()) {
                skipped++;
            }
        }

        auto listings = store_.loadListings();
        for (const auto &listing : listings) {
            marketplace_.restoreListing(listing);
        }

        auto trades = store_.loadTrades();
        for (const auto &trade : trades) {
            marketplace_.restoreTrade(trade);
        }

        skipped += store_.skippedRecords();

        std::cout << "Restored " << registry_.size() << " souls, " << ledger_.eventCount() << " events, "
                  << listings.size() << " listings, " << trades.size() << " trades from " << store_.path()
                  << std::endl;
        if (skipped > 0) {
            std::cerr << "Skipped " << skipped << " invalid persisted records" << std::endl;
        }
    }

    void Relay::sweeperLoop() {
        std::unique_lock<std::mutex> lock(sweeper_mutex_);
        while (!stopping_) {
            sweeper_cv_.wait_for(lock, std::chrono::milliseconds(config_.sweep_interval_ms),
                                 [this]() { return stopping_; });
            if (stopping_) {
                break;
            }

            lock.unlock();
            sweepNow();
            lock.lock();
        }
    }

    void Relay::sweepNow(dp::i64 now) {
        authenticator_.sweep(now);
        marketplace_.sweep(now);
    }

    // ===========================================
    // Sessions
    // ===========================================

    SessionId Relay::connect(const std::string &nick) {
        auto slot = std::make_shared<SessionSlot>();
        slot->session.id = next_session_++;
        slot->session.nick = nick;
        slot->session.connected_at = nowMillis();

        std::unique_lock lock(sessions_mutex_);
        sessions_[slot->session.id] = slot;
        return slot->session.id;
    }

    void Relay::disconnect(SessionId session) {
        std::shared_ptr<SessionSlot> s;
        {
            std::unique_lock lock(sessions_mutex_);
            auto it = sessions_.find(session);
            if (it == sessions_.end()) {
                return;
            }
            s = it->second;
            sessions_.erase(it);
        }

        // A line already dispatching for this session finishes first; later ones see closed
        std::lock_guard<std::mutex> lock(s->mutex);
        s->closed = true;
        authenticator_.forget(session);
        marketplace_.cancelSession(session);
        std::cout << "Session " << session << " disconnected" << std::endl;
    }

    std::shared_ptr<Relay::SessionSlot> Relay::slot(SessionId session) const {
        std::shared_lock lock(sessions_mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) {
            return nullptr;
        }
        return it->second;
    }

    size_t Relay::sessionCount() const {
        std::shared_lock lock(sessions_mutex_);
        return sessions_.size();
    }

    dp::Result<void, dp::Error> Relay::attachSigningKey(SessionId session, const Key &key) {
        if (!key.hasPrivateKey()) {
            return dp::Result<void, dp::Error>::err(no_signing_key("Key has no private half"));
        }

        auto s = slot(session);
        if (!s) {
            return dp::Result<void, dp::Error>::err(dp::Error::not_found("Unknown session"));
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        s->session.signing_key = key;
        return dp::Result<void, dp::Error>::ok();
    }

    protocol::DispatchResult Relay::handleLine(SessionId session, const std::string &line) {
        auto s = slot(session);
        if (!s) {
            return protocol::DispatchResult::rejected(protocol::errorReply(not_authenticated("Unknown session")));
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->closed) {
            return protocol::DispatchResult::rejected(protocol::errorReply(not_authenticated("Session closed")));
        }

        auto command = protocol::Command::parse(line);
        if (command && command->verb == "NICK" && command->has(0)) {
            s->session.nick = command->param(0);
        }

        Outbox outbox;
        outbox.session = session;
        protocol::DispatchResult result;
        {
            OutboxScope scope(outbox);
            result = dispatcher_.dispatch(s->session, line);
        }

        for (auto &queued : outbox.lines) {
            result.replies.push_back(std::move(queued));
        }
        return result;
    }

    std::string Relay::annotate(SessionId session) {
        auto s = slot(session);
        if (!s) {
            return "";
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        auto soul_id = authenticator_.boundSoul(session);
        if (!soul_id) {
            return s->session.nick;
        }

        std::string paradigm;
        std::string mode;
        auto soul = registry_.resolve(*soul_id);
        if (soul.is_ok()) {
            paradigm = soul.value().getParadigm();
            mode = soul.value().getMode();
        }

        std::string prefix = "[Soul:" + *soul_id + "] [Paradigm:" + orDash(paradigm) + "] [Mode:" + orDash(mode) +
                             "] " + s->session.nick;
        if (!s->session.pending_signature.empty()) {
            prefix += " [Sig:" + s->session.pending_signature + "]";
            s->session.pending_signature.clear();
        }
        return prefix;
    }

    // ===========================================
    // Marketplace notifications
    // ===========================================

    void Relay::notify(const std::string &soul_id, const std::string &line) {
        for (auto session : authenticator_.sessionsOf(soul_id)) {
            if (current_outbox != nullptr && current_outbox->session == session) {
                current_outbox->lines.push_back(line);
            } else if (transport_ != nullptr) {
                transport_->deliver(session, line);
            }
        }
    }

    void Relay::onTradeProposed(const market::Trade &trade) {
        auto price = std::to_string(trade.price);
        auto provider = trade.getProvider();
        auto seeker = trade.getSeeker();

        notify(provider, "TRADE_PROPOSED " + trade.getId() + " " + trade.getCategory() + " " + price + " PROVIDER " +
                             seeker + " :" + trade.endorsementFor(provider).canonicalPayload());
        notify(seeker, "TRADE_PROPOSED " + trade.getId() + " " + trade.getCategory() + " " + price + " SEEKER " +
                           provider + " :" + trade.endorsementFor(seeker).canonicalPayload());
    }

    void Relay::onTradeSettled(const market::Trade &trade) {
        notify(trade.getProvider(), "TRADE_SETTLED " + trade.getId());
        notify(trade.getSeeker(), "TRADE_SETTLED " + trade.getId());
    }

    void Relay::onTradeAborted(const market::Trade &trade) {
        notify(trade.getProvider(), "TRADE_ABORTED " + trade.getId());
        notify(trade.getSeeker(), "TRADE_ABORTED " + trade.getId());
    }

    void Relay::onListingExpired(const market::ServiceListing &listing) {
        notify(listing.getOwner(), "SERVICE_EXPIRED " + listing.getId());
    }

} // namespace soulrelay
