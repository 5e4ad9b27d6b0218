#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <soulrelay/identity/key.hpp>
#include <string>

namespace soulrelay {

    using SessionId = dp::u64;

    namespace auth {

        /// Nonce issued to a session claiming a soul. Consumed exactly once.
        struct AuthChallenge {
            std::string id;
            std::string soul_id;
            SessionId session{0};
            std::string nonce; // Hex; the proof is a signature over these characters
            dp::i64 issued_at{0};
            dp::i64 expires_at{0};

            inline bool isExpired(dp::i64 now) const { return now > expires_at; }
        };

        /// Successful authentication
        struct AuthResult {
            std::string soul_id;
            std::optional<std::string> replaced; // Soul previously bound to the session, if different
        };

        /// Live connection as the relay sees it. The bound soul lives in the authenticator.
        struct Session {
            SessionId id{0};
            std::string nick;
            std::optional<Key> signing_key; // Handed over by the hosting agent, never persisted
            std::string pending_signature;  // Hex, attached to the next relayed message
            dp::i64 connected_at{0};
        };

    } // namespace auth
} // namespace soulrelay
