#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <soulrelay/auth/session.hpp>
#include <soulrelay/auth/soul_authenticator.hpp>
#include <soulrelay/common/config.hpp>
#include <soulrelay/common/error.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <soulrelay/market/marketplace.hpp>
#include <soulrelay/protocol/command.hpp>
#include <soulrelay/reputation/reputation_ledger.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace soulrelay::protocol {

    enum class Disposition : dp::u8 {
        Handled = 0,  // Consumed by the extension layer, replies go back to the session
        Forward = 1,  // Base transport verb, hand the line to the transport untouched
        Rejected = 2, // Refused before authentication, not forwarded
    };

    inline std::string dispositionToString(Disposition disposition) {
        switch (disposition) {
        case Disposition::Handled:
            return "handled";
        case Disposition::Forward:
            return "forward";
        case Disposition::Rejected:
            return "rejected";
        default:
            return "unknown";
        }
    }

    struct DispatchResult {
        Disposition disposition{Disposition::Handled};
        std::vector<std::string> replies;

        inline static DispatchResult handled(std::vector<std::string> lines) {
            return DispatchResult{Disposition::Handled, std::move(lines)};
        }

        inline static DispatchResult forward() { return DispatchResult{Disposition::Forward, {}}; }

        inline static DispatchResult rejected(std::string line) {
            return DispatchResult{Disposition::Rejected, {std::move(line)}};
        }
    };

    /// Wire reply for an error: "<CODE> :<message>"
    inline std::string errorReply(const dp::Error &error) {
        return replyCode(error) + " :" + std::string(error.message.c_str());
    }

    /// Parses SOUL, SERVICE and SIGN and routes them to the components
    class CommandDispatcher {
      public:
        CommandDispatcher(SoulRegistry &registry, auth::SoulAuthenticator &authenticator,
                          reputation::ReputationLedger &ledger, market::Marketplace &marketplace,
                          const RelayConfig &config = RelayConfig{});

        /// Handle one line from session. The caller serializes calls for the same session.
        DispatchResult dispatch(auth::Session &session, const std::string &line);

      private:
        DispatchResult handleSoul(auth::Session &session, const Command &command);
        DispatchResult handleService(auth::Session &session, const std::string &soul_id, const Command &command);
        DispatchResult handleSign(auth::Session &session, const std::string &soul_id, const Command &command);

        DispatchResult registerSoul(const Command &command);
        DispatchResult whois(const Command &command);
        DispatchResult listServices();
        DispatchResult postListing(auth::Session &session, const std::string &soul_id, market::ListingKind kind,
                                   const Command &command);
        DispatchResult acceptTrade(auth::Session &session, const std::string &soul_id, const Command &command);

        /// Positive decimal integer, no sign or leading garbage
        static std::optional<dp::i64> parsePrice(const std::string &text);

        SoulRegistry &registry_;
        auth::SoulAuthenticator &authenticator_;
        reputation::ReputationLedger &ledger_;
        market::Marketplace &marketplace_;
        std::unordered_set<std::string> passthrough_;
    };

} // namespace soulrelay::protocol
