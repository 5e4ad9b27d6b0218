#pragma once

#include <atomic>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <soulrelay/auth/session.hpp>
#include <soulrelay/auth/soul_authenticator.hpp>
#include <soulrelay/common/config.hpp>
#include <soulrelay/common/error.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <soulrelay/market/marketplace.hpp>
#include <soulrelay/protocol/dispatcher.hpp>
#include <soulrelay/reputation/reputation_ledger.hpp>
#include <soulrelay/storage/file_store.hpp>
#include <string>
#include <thread>
#include <unordered_map>

namespace soulrelay {

    /// Base chat transport the relay is embedded in
    class ITransport {
      public:
        virtual ~ITransport() = default;

        /// Push an unsolicited line (trade notifications) to a session
        virtual void deliver(SessionId session, const std::string &line) = 0;
    };

    /// Owns every component, the session table, persistence and the expiry sweeper
    class Relay : public market::IMarketListener {
      public:
        explicit Relay(RelayConfig config = RelayConfig{}, ITransport *transport = nullptr);
        ~Relay() override;

        Relay(const Relay &) = delete;
        Relay &operator=(const Relay &) = delete;

        /// Open the store, replay persisted state and start the sweeper
        dp::Result<void, dp::Error> start();

        /// Stop and join the sweeper, close the store
        void stop();

        inline bool isRunning() const { return running_; }

        // === Transport boundary ===

        SessionId connect(const std::string &nick = "");

        /// Drops the challenge and binding, cancels OPEN listings; trades run to their deadline
        void disconnect(SessionId session);

        /// Key the hosting agent lets this session sign with (never persisted)
        dp::Result<void, dp::Error> attachSigningKey(SessionId session, const Key &key);

        protocol::DispatchResult handleLine(SessionId session, const std::string &line);

        /// Display prefix for a message relayed from session. Consumes a pending SIGN signature.
        std::string annotate(SessionId session);

        /// Run one expiry pass (the sweeper calls this every sweep_interval_ms)
        void sweepNow(dp::i64 now = nowMillis());

        // === Components ===

        inline SoulRegistry &registry() { return registry_; }
        inline auth::SoulAuthenticator &authenticator() { return authenticator_; }
        inline reputation::ReputationLedger &ledger() { return ledger_; }
        inline market::Marketplace &marketplace() { return marketplace_; }
        inline const RelayConfig &config() const { return config_; }

        size_t sessionCount() const;

        // === Marketplace events ===

        void onTradeProposed(const market::Trade &trade) override;
        void onTradeSettled(const market::Trade &trade) override;
        void onTradeAborted(const market::Trade &trade) override;
        void onListingExpired(const market::ServiceListing &listing) override;

      private:
        struct SessionSlot {
            std::mutex mutex; // Serializes lines from one connection
            auth::Session session;
            bool closed = false;
        };

        std::shared_ptr<SessionSlot> slot(SessionId session) const;
        void notify(const std::string &soul_id, const std::string &line);
        void restoreState();
        void sweeperLoop();

        RelayConfig config_;
        ITransport *transport_;

        storage::FileStore store_;
        SoulRegistry registry_;
        auth::SoulAuthenticator authenticator_;
        reputation::ReputationLedger ledger_;
        market::Marketplace marketplace_;
        protocol::CommandDispatcher dispatcher_;

        std::unordered_map<SessionId, std::shared_ptr<SessionSlot>> sessions_;
        mutable std::shared_mutex sessions_mutex_;
        std::atomic<SessionId> next_session_{1};

        std::thread sweeper_;
        std::mutex sweeper_mutex_;
        std::condition_variable sweeper_cv_;
        bool stopping_ = false;
        bool restored_ = false;
        std::atomic<bool> running_{false};
    };

} // namespace soulrelay
