#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace soulrelay {

    // ===========================================
    // soulrelay-specific error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_UNKNOWN_SOUL = 200;
    constexpr dp::u32 ERR_AUTH_FAILED = 201;
    constexpr dp::u32 ERR_CHALLENGE_EXPIRED = 202;
    constexpr dp::u32 ERR_NOT_AUTHENTICATED = 203;
    constexpr dp::u32 ERR_INVALID_PRICE = 204;
    constexpr dp::u32 ERR_SYNTAX = 205;
    constexpr dp::u32 ERR_NO_SUCH_LISTING = 206;
    constexpr dp::u32 ERR_NO_SUCH_TRADE = 207;
    constexpr dp::u32 ERR_INVALID_STATE = 208;
    constexpr dp::u32 ERR_LIMIT_EXCEEDED = 209;
    constexpr dp::u32 ERR_NOT_PARTY = 210;
    constexpr dp::u32 ERR_NO_SIGNING_KEY = 211;
    constexpr dp::u32 ERR_ALREADY_REGISTERED = 212;
    constexpr dp::u32 ERR_INVALID_KEY = 213;
    constexpr dp::u32 ERR_STORAGE = 214;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error unknown_soul(const dp::String &msg = "Unknown soul") { return dp::Error{ERR_UNKNOWN_SOUL, msg}; }

    inline dp::Error auth_failed(const dp::String &msg = "Signature does not match") {
        return dp::Error{ERR_AUTH_FAILED, msg};
    }

    inline dp::Error challenge_expired(const dp::String &msg = "Challenge expired or already used") {
        return dp::Error{ERR_CHALLENGE_EXPIRED, msg};
    }

    inline dp::Error not_authenticated(const dp::String &msg = "Session is not authenticated") {
        return dp::Error{ERR_NOT_AUTHENTICATED, msg};
    }

    inline dp::Error invalid_price(const dp::String &msg = "Price must be a positive integer") {
        return dp::Error{ERR_INVALID_PRICE, msg};
    }

    inline dp::Error syntax_error(const dp::String &msg = "Malformed command") { return dp::Error{ERR_SYNTAX, msg}; }

    inline dp::Error no_such_listing(const dp::String &msg = "No such listing") {
        return dp::Error{ERR_NO_SUCH_LISTING, msg};
    }

    inline dp::Error no_such_trade(const dp::String &msg = "No such trade") {
        return dp::Error{ERR_NO_SUCH_TRADE, msg};
    }

    inline dp::Error invalid_state(const dp::String &msg = "Operation not allowed in current state") {
        return dp::Error{ERR_INVALID_STATE, msg};
    }

    inline dp::Error limit_exceeded(const dp::String &msg = "Limit exceeded") {
        return dp::Error{ERR_LIMIT_EXCEEDED, msg};
    }

    inline dp::Error not_party(const dp::String &msg = "Not a party to this trade") {
        return dp::Error{ERR_NOT_PARTY, msg};
    }

    inline dp::Error no_signing_key(const dp::String &msg = "No signing key held for this session") {
        return dp::Error{ERR_NO_SIGNING_KEY, msg};
    }

    inline dp::Error already_registered(const dp::String &msg = "Soul already registered") {
        return dp::Error{ERR_ALREADY_REGISTERED, msg};
    }

    inline dp::Error invalid_key(const dp::String &msg = "Invalid public key") {
        return dp::Error{ERR_INVALID_KEY, msg};
    }

    inline dp::Error storage_error(const dp::String &msg = "Storage failure") { return dp::Error{ERR_STORAGE, msg}; }

    /// Wire reply code for an error. Codes outside the soulrelay range map to ERR_SYNTAX.
    inline std::string replyCode(const dp::Error &error) {
        switch (error.code) {
        case ERR_UNKNOWN_SOUL:
            return "ERR_UNKNOWN_SOUL";
        case ERR_AUTH_FAILED:
            return "ERR_AUTH_FAILED";
        case ERR_CHALLENGE_EXPIRED:
            return "ERR_CHALLENGE_EXPIRED";
        case ERR_NOT_AUTHENTICATED:
            return "ERR_NOT_AUTHENTICATED";
        case ERR_INVALID_PRICE:
            return "ERR_INVALID_PRICE";
        case ERR_NO_SUCH_LISTING:
            return "ERR_NO_SUCH_LISTING";
        case ERR_NO_SUCH_TRADE:
            return "ERR_NO_SUCH_TRADE";
        case ERR_INVALID_STATE:
            return "ERR_INVALID_STATE";
        case ERR_LIMIT_EXCEEDED:
            return "ERR_LIMIT_EXCEEDED";
        case ERR_NOT_PARTY:
            return "ERR_NOT_PARTY";
        case ERR_NO_SIGNING_KEY:
            return "ERR_NO_SIGNING_KEY";
        case ERR_ALREADY_REGISTERED:
            return "ERR_ALREADY_REGISTERED";
        case ERR_INVALID_KEY:
            return "ERR_INVALID_KEY";
        case ERR_STORAGE:
            return "ERR_STORAGE";
        default:
            return "ERR_SYNTAX";
        }
    }

} // namespace soulrelay
