#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <optional>
#include <soulrelay/auth/session.hpp>
#include <soulrelay/common/config.hpp>
#include <soulrelay/common/error.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace soulrelay::auth {

    /// Per-session challenge/response upgrading an anonymous session to a verified soul
    class SoulAuthenticator {
      private:
        const SoulRegistry &registry_;
        AuthConfig config_;

        std::unordered_map<SessionId, AuthChallenge> challenges_; // At most one outstanding per session
        std::unordered_map<SessionId, std::string> bindings_;
        std::unordered_map<std::string, std::unordered_set<SessionId>> sessions_by_soul_;
        std::unordered_set<SessionId> verifying_; // Proof being checked outside the lock
        mutable std::mutex mutex_;

        void unbindLocked(SessionId session);

        /// Expiry, key lookup and signature check; takes no lock
        dp::Result<void, dp::Error> verifyProof(SessionId session, const AuthChallenge &challenge,
                                                const std::vector<uint8_t> &proof, dp::i64 now) const;

      public:
        explicit SoulAuthenticator(const SoulRegistry &registry, AuthConfig config = AuthConfig{});

        /// Issue a challenge for claimed_soul, replacing any outstanding one for this session
        dp::Result<AuthChallenge, dp::Error> beginAuth(SessionId session, const std::string &claimed_soul,
                                                       dp::i64 now = nowMillis());

        /// Check proof (signature over the nonce) and bind the soul on success
        /// The challenge is consumed whether or not the proof verifies.
        dp::Result<AuthResult, dp::Error> respond(SessionId session, const std::string &challenge_id,
                                                  const std::vector<uint8_t> &proof, dp::i64 now = nowMillis());

        std::optional<AuthChallenge> pendingChallenge(SessionId session) const;

        /// Drop the challenge and binding of a disconnected session
        void forget(SessionId session);

        /// Remove challenges past their TTL, returns how many were dropped
        size_t sweep(dp::i64 now = nowMillis());

        std::optional<std::string> boundSoul(SessionId session) const;

        /// Any live session currently bound to soul_id
        bool isAuthenticated(const std::string &soul_id) const;

        std::vector<SessionId> sessionsOf(const std::string &soul_id) const;

        size_t pendingCount() const;

        size_t authenticatedCount() const;

        const AuthConfig &config() const { return config_; }
    };

} // namespace soulrelay::auth
