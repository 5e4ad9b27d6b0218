#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace soulrelay {

    /// Milliseconds since the Unix epoch
    inline dp::i64 nowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Soul challenge/response settings
    struct AuthConfig {
        int64_t challenge_ttl_ms = 30000; // 30 seconds to answer a challenge
        size_t nonce_bytes = 32;
    };

    /// Reputation ledger admission rules
    struct LedgerConfig {
        int64_t max_abs_delta = 100; // Largest |delta| a single event may carry
        bool require_authenticated_endorser = true;
    };

    /// Marketplace timing and admission control
    struct MarketConfig {
        int64_t listing_ttl_ms = 3600000;  // 1 hour unmatched before EXPIRED
        int64_t trade_deadline_ms = 300000; // 5 minutes for both parties to accept
        int max_open_listings_per_soul = 16;
        int64_t settlement_credit = 1; // Delta each party endorses on settlement
        int64_t max_price = 1000000000;
        size_t closed_history = 1024; // Closed listings and trades still answerable by id
    };

    /// Persistent state location
    struct StorageConfig {
        std::string data_dir = "soulrelay_data";
        bool persist = true;
        bool sync_writes = false; // Flush each record as it is appended
    };

    /// Everything the relay needs at start-up
    struct RelayConfig {
        AuthConfig auth;
        LedgerConfig ledger;
        MarketConfig market;
        StorageConfig storage;

        int64_t sweep_interval_ms = 1000;

        // Base transport verbs an anonymous session may still send
        std::vector<std::string> preauth_passthrough = {"NICK", "USER", "PASS", "PING", "PONG", "QUIT", "CAP"};
    };

} // namespace soulrelay
