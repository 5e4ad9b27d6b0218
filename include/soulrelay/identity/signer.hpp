#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <soulrelay/identity/key.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <string>
#include <vector>

namespace soulrelay {

    inline std::vector<uint8_t> toBytes(const std::string &text) { return {text.begin(), text.end()}; }

    /// Sign payload with a caller-held private key (Ed25519 is deterministic)
    inline dp::Result<std::vector<uint8_t>, dp::Error> signPayload(const Key &key, const std::string &payload) {
        return key.sign(toBytes(payload));
    }

    /// Lowercase hex signature, the form signatures take on the wire
    inline dp::Result<std::string, dp::Error> signPayloadHex(const Key &key, const std::string &payload) {
        auto signature = signPayload(key, payload);
        if (signature.is_err()) {
            return dp::Result<std::string, dp::Error>::err(signature.error());
        }
        return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(signature.value()));
    }

    /// Verify signature against the registered key of soul_id
    /// Unknown soul, malformed signature or mismatch all give false.
    inline bool verifySignature(const SoulRegistry &registry, const std::string &soul_id,
                                const std::vector<uint8_t> &payload, const std::vector<uint8_t> &signature) {
        auto key = registry.keyOf(soul_id);
        if (key.is_err()) {
            return false;
        }
        return key.value().verify(payload, signature);
    }

    inline bool verifySignatureHex(const SoulRegistry &registry, const std::string &soul_id,
                                   const std::string &payload, const std::string &signature_hex) {
        if (signature_hex.size() != Key::SIGNATURE_SIZE * 2 || !Key::isHex(signature_hex)) {
            return false;
        }
        return verifySignature(registry, soul_id, toBytes(payload), keylock::keylock::from_hex(signature_hex));
    }

    /// Payload, the soul that signed it, and the signature
    struct SignedMessage {
        std::string payload;
        std::string soul_id;
        std::vector<uint8_t> signature;

        /// Sign payload as soul_id
        inline static dp::Result<SignedMessage, dp::Error> create(const Key &key, const std::string &soul_id,
                                                                  const std::string &payload) {
            auto signature = signPayload(key, payload);
            if (signature.is_err()) {
                return dp::Result<SignedMessage, dp::Error>::err(signature.error());
            }
            return dp::Result<SignedMessage, dp::Error>::ok(SignedMessage{payload, soul_id, signature.value()});
        }

        inline bool verify(const SoulRegistry &registry) const {
            return verifySignature(registry, soul_id, toBytes(payload), signature);
        }

        inline std::string signatureHex() const { return keylock::keylock::to_hex(signature); }
    };

} // namespace soulrelay
