#include <iostream>
#include <soulrelay/auth/soul_authenticator.hpp>
#include <soulrelay/common/random.hpp>

namespace soulrelay::auth {

    SoulAuthenticator::SoulAuthenticator(const SoulRegistry &registry, AuthConfig config)
        : registry_(registry), config_(config) {}

    dp::Result<AuthChallenge, dp::Error> SoulAuthenticator::beginAuth(SessionId session,
                                                                      const std::string &claimed_soul, dp::i64 now) {
        if (!registry_.exists(claimed_soul)) {
            return dp::Result<AuthChallenge, dp::Error>::err(
                unknown_soul(("Unknown soul: " + claimed_soul).c_str()));
        }

        AuthChallenge challenge;
        challenge.id = randomHex(8);
        challenge.soul_id = claimed_soul;
        challenge.session = session;
        challenge.nonce = randomHex(config_.nonce_bytes);
        challenge.issued_at = now;
        challenge.expires_at = now + config_.challenge_ttl_ms;

        std::lock_guard<std::mutex> lock(mutex_);
        challenges_[session] = challenge;
        return dp::Result<AuthChallenge, dp::Error>::ok(challenge);
    }

    dp::Result<AuthResult, dp::Error> SoulAuthenticator::respond(SessionId session, const std::string &challenge_id,
                                                                 const std::vector<uint8_t> &proof, dp::i64 now) {
        AuthChallenge challenge;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = challenges_.find(session);
            if (it == challenges_.end() || it->second.id != challenge_id) {
                return dp::Result<AuthResult, dp::Error>::err(challenge_expired());
            }

            // Single use, whatever the outcome
            challenge = it->second;
            challenges_.erase(it);
            verifying_.insert(session);
        }

        auto verified = verifyProof(session, challenge, proof, now);

        std::lock_guard<std::mutex> lock(mutex_);
        // forget() ran while the proof was being checked
        if (verifying_.erase(session) == 0) {
            return dp::Result<AuthResult, dp::Error>::err(challenge_expired("Session went away"));
        }
        if (verified.is_err()) {
            return dp::Result<AuthResult, dp::Error>::err(verified.error());
        }

        AuthResult result;
        result.soul_id = challenge.soul_id;

        auto bound = bindings_.find(session);
        if (bound != bindings_.end() && bound->second != challenge.soul_id) {
            result.replaced = bound->second;
            std::cout << "Session " << session << " re-authenticated: soul " << bound->second << " replaced by "
                      << challenge.soul_id << std::endl;
        }
        unbindLocked(session);

        bindings_[session] = challenge.soul_id;
        sessions_by_soul_[challenge.soul_id].insert(session);

        std::cout << "Soul " << challenge.soul_id << " authenticated on session " << session << std::endl;
        return dp::Result<AuthResult, dp::Error>::ok(result);
    }

    dp::Result<void, dp::Error> SoulAuthenticator::verifyProof(SessionId session, const AuthChallenge &challenge,
                                                               const std::vector<uint8_t> &proof, dp::i64 now) const {
        if (challenge.isExpired(now)) {
            return dp::Result<void, dp::Error>::err(challenge_expired());
        }

        auto key = registry_.keyOf(challenge.soul_id);
        if (key.is_err()) {
            return dp::Result<void, dp::Error>::err(key.error());
        }

        std::vector<uint8_t> nonce_bytes(challenge.nonce.begin(), challenge.nonce.end());
        if (!key.value().verify(nonce_bytes, proof)) {
            std::cout << "Authentication failed for soul " << challenge.soul_id << " on session " << session
                      << std::endl;
            return dp::Result<void, dp::Error>::err(auth_failed());
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::optional<AuthChallenge> SoulAuthenticator::pendingChallenge(SessionId session) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = challenges_.find(session);
        if (it == challenges_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void SoulAuthenticator::unbindLocked(SessionId session) {
        auto bound = bindings_.find(session);
        if (bound == bindings_.end()) {
            return;
        }

        auto sessions = sessions_by_soul_.find(bound->second);
        if (sessions != sessions_by_soul_.end()) {
            sessions->second.erase(session);
            if (sessions->second.empty()) {
                sessions_by_soul_.erase(sessions);
            }
        }
        bindings_.erase(bound);
    }

    void SoulAuthenticator::forget(SessionId session) {
        std::lock_guard<std::mutex> lock(mutex_);
        challenges_.erase(session);
        verifying_.erase(session);
        unbindLocked(session);
    }

    size_t SoulAuthenticator::sweep(dp::i64 now) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = challenges_.begin(); it != challenges_.end();) {
            if (it->second.isExpired(now)) {
                it = challenges_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::optional<std::string> SoulAuthenticator::boundSoul(SessionId session) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(session);
        if (it == bindings_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool SoulAuthenticator::isAuthenticated(const std::string &soul_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_by_soul_.find(soul_id) != sessions_by_soul_.end();
    }

    std::vector<SessionId> SoulAuthenticator::sessionsOf(const std::string &soul_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_by_soul_.find(soul_id);
        if (it == sessions_by_soul_.end()) {
            return {};
        }
        return std::vector<SessionId>(it->second.begin(), it->second.end());
    }

    size_t SoulAuthenticator::pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return challenges_.size();
    }

    size_t SoulAuthenticator::authenticatedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bindings_.size();
    }

} // namespace soulrelay::auth
