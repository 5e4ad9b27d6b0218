#pragma once

#include <keylock/keylock.hpp>
#include <sodium.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace soulrelay {

    /// Hex string of `bytes` bytes from libsodium's CSPRNG, used for nonces and record ids
    inline std::string randomHex(size_t bytes) {
        static const bool sodium_ready = sodium_init() >= 0;
        if (!sodium_ready) {
            throw std::runtime_error("libsodium initialization failed");
        }

        std::vector<uint8_t> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return keylock::keylock::to_hex(buffer);
    }

} // namespace soulrelay
