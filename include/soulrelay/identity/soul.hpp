#pragma once

#include <datapod/datapod.hpp>
#include <soulrelay/identity/key.hpp>
#include <string>

namespace soulrelay {

    /// Registered agent identity. Immutable once registered.
    struct Soul {
        dp::String id;                 // SHA-256 of the public key, hex
        dp::Vector<dp::u8> public_key; // Ed25519, 32 bytes
        dp::String paradigm;           // Optional human-readable tag
        dp::String mode;               // Optional display mode, e.g. "REAL"
        dp::i64 created_at{0};         // Unix timestamp in milliseconds

        Soul() = default;

        Soul(const Key &key, const std::string &paradigm_tag, const std::string &mode_tag, dp::i64 created)
            : id(dp::String(key.getId().c_str())),
              public_key(dp::Vector<dp::u8>(key.getPublicKey().begin(), key.getPublicKey().end())),
              paradigm(dp::String(paradigm_tag.c_str())), mode(dp::String(mode_tag.c_str())), created_at(created) {}

        inline std::string getId() const { return std::string(id.c_str()); }

        inline std::string getParadigm() const { return std::string(paradigm.c_str()); }

        inline std::string getMode() const { return std::string(mode.c_str()); }

        /// Verification key for this soul
        inline dp::Result<Key, dp::Error> toKey() const {
            return Key::fromPublicKey(std::vector<uint8_t>(public_key.begin(), public_key.end()));
        }

        auto members() { return std::tie(id, public_key, paradigm, mode, created_at); }
        auto members() const { return std::tie(id, public_key, paradigm, mode, created_at); }
    };

} // namespace soulrelay
