#pragma once

#include <cctype>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace soulrelay {

    /// Ed25519 keypair behind a Soul
    /// The relay only ever stores the public half; a private half is present when an agent
    /// hands its key to the session that speaks for it.
    class Key {
      public:
        static constexpr size_t PUBLIC_KEY_SIZE = 32;
        static constexpr size_t SIGNATURE_SIZE = 64;

        Key() = default;

        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty() || keypair.public_key.size() != PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        /// Load from keypair bytes (private key can be 32 or 64 bytes for Ed25519)
        inline static dp::Result<Key, dp::Error> fromKeypair(const std::vector<uint8_t> &public_key,
                                                             const std::vector<uint8_t> &private_key) {
            if (public_key.size() != PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            keypair.private_key = private_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Verification-only key
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Verification-only key from its hex encoding (as sent by SOUL REGISTER)
        inline static dp::Result<Key, dp::Error> fromPublicKeyHex(const std::string &hex) {
            if (hex.size() != PUBLIC_KEY_SIZE * 2 || !isHex(hex)) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Public key must be 64 hex characters"));
            }
            return fromPublicKey(keylock::keylock::from_hex(hex));
        }

        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::permission_denied("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// True only for a well-formed signature made by this key over data
        inline bool verify(const std::vector<uint8_t> &data, const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty() || signature.size() != SIGNATURE_SIZE) {
                return false;
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, keypair_.public_key);
            return result.success;
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline std::string getPublicKeyHex() const { return keylock::keylock::to_hex(keypair_.public_key); }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Soul identifier: SHA-256 of the public key, hex encoded
        inline std::string getId() const {
            if (keypair_.public_key.empty()) {
                return "";
            }

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(keypair_.public_key);

            if (!hash_result.success) {
                return "";
            }

            return keylock::keylock::to_hex(hash_result.data);
        }

        /// Copy without the private half
        inline Key publicOnly() const {
            keylock::KeyPair keypair;
            keypair.public_key = keypair_.public_key;
            return Key(keypair);
        }

        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline static bool isHex(const std::string &text) {
            if (text.empty() || text.size() % 2 != 0) {
                return false;
            }
            for (char c : text) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
            }
            return true;
        }

      private:
        keylock::KeyPair keypair_;
    };

} // namespace soulrelay
