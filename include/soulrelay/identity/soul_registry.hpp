#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <shared_mutex>
#include <soulrelay/common/config.hpp>
#include <soulrelay/common/error.hpp>
#include <soulrelay/identity/soul.hpp>
#include <soulrelay/storage/file_store.hpp>
#include <unordered_map>
#include <vector>

namespace soulrelay {

    /// Soul Registry: every known identity and its verification key
    /// Pure lookup/insert, no knowledge of sessions or the wire.
    class SoulRegistry {
      public:
        SoulRegistry() = default;

        /// Persist each registration through store (may be null)
        inline explicit SoulRegistry(storage::FileStore *store) : store_(store) {}

        // === Registration ===

        /// Register a new soul for a public key
        inline dp::Result<Soul, dp::Error> registerSoul(const Key &key, const std::string &paradigm = "",
                                                        const std::string &mode = "") {
            if (key.getPublicKey().size() != Key::PUBLIC_KEY_SIZE) {
                return dp::Result<Soul, dp::Error>::err(invalid_key("Ed25519 public key must be 32 bytes"));
            }

            Soul soul(key.publicOnly(), paradigm, mode, nowMillis());
            auto id = soul.getId();
            if (id.empty()) {
                return dp::Result<Soul, dp::Error>::err(invalid_key("Failed to derive soul id"));
            }

            {
                std::unique_lock lock(mutex_);
                if (souls_.find(id) != souls_.end()) {
                    return dp::Result<Soul, dp::Error>::err(
                        already_registered(("Soul already registered: " + id).c_str()));
                }
                souls_[id] = soul;
            }

            if (store_ != nullptr) {
                auto stored = store_->appendSoul(soul);
                if (stored.is_err()) {
                    std::cerr << "[registry] failed to persist soul " << id << ": "
                              << stored.error().message.c_str() << std::endl;
                }
            }

            return dp::Result<Soul, dp::Error>::ok(soul);
        }

        /// Register from the hex public key carried by SOUL REGISTER
        inline dp::Result<Soul, dp::Error> registerSoul(const std::string &public_key_hex,
                                                        const std::string &paradigm = "",
                                                        const std::string &mode = "") {
            auto key = Key::fromPublicKeyHex(public_key_hex);
            if (key.is_err()) {
                return dp::Result<Soul, dp::Error>::err(invalid_key(key.error().message.c_str()));
            }
            return registerSoul(key.value(), paradigm, mode);
        }

        /// Load a persisted entry (start-up replay, not re-persisted)
        inline dp::Result<void, dp::Error> restore(const Soul &soul) {
            auto key = soul.toKey();
            if (key.is_err() || key.value().getId() != soul.getId()) {
                return dp::Result<void, dp::Error>::err(invalid_key("Stored soul does not match its key"));
            }

            std::unique_lock lock(mutex_);
            if (souls_.find(soul.getId()) != souls_.end()) {
                return dp::Result<void, dp::Error>::err(already_registered("Soul already registered"));
            }
            souls_[soul.getId()] = soul;
            return dp::Result<void, dp::Error>::ok();
        }

        // === Lookup ===

        inline dp::Result<Soul, dp::Error> resolve(const std::string &soul_id) const {
            std::shared_lock lock(mutex_);
            auto it = souls_.find(soul_id);
            if (it == souls_.end()) {
                return dp::Result<Soul, dp::Error>::err(unknown_soul(("Unknown soul: " + soul_id).c_str()));
            }
            return dp::Result<Soul, dp::Error>::ok(it->second);
        }

        /// Verification key of a registered soul
        inline dp::Result<Key, dp::Error> keyOf(const std::string &soul_id) const {
            auto soul = resolve(soul_id);
            if (soul.is_err()) {
                return dp::Result<Key, dp::Error>::err(soul.error());
            }
            return soul.value().toKey();
        }

        inline bool exists(const std::string &soul_id) const {
            std::shared_lock lock(mutex_);
            return souls_.find(soul_id) != souls_.end();
        }

        inline std::vector<Soul> all() const {
            std::shared_lock lock(mutex_);
            std::vector<Soul> result;
            result.reserve(souls_.size());
            for (const auto &[id, soul] : souls_) {
                result.push_back(soul);
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return souls_.size();
        }

      private:
        std::unordered_map<std::string, Soul> souls_;
        storage::FileStore *store_ = nullptr;
        mutable std::shared_mutex mutex_;
    };

} // namespace soulrelay
