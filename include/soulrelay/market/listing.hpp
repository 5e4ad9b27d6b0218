#pragma once

#include <datapod/datapod.hpp>
#include <soulrelay/auth/session.hpp>
#include <string>

namespace soulrelay {
    namespace market {

        enum class ListingKind : dp::u8 {
            Offer = 0,   // Provider advertises a service
            Request = 1, // Seeker asks for a service
        };

        /// OPEN -> MATCHED, or OPEN -> {CANCELLED, EXPIRED}; MATCHED -> CANCELLED only when its trade aborts
        enum class ListingStatus : dp::u8 {
            Open = 0,
            Matched = 1,
            Cancelled = 2,
            Expired = 3,
        };

        inline std::string listingKindToString(ListingKind kind) {
            switch (kind) {
            case ListingKind::Offer:
                return "OFFER";
            case ListingKind::Request:
                return "REQUEST";
            default:
                return "UNKNOWN";
            }
        }

        inline std::string listingStatusToString(ListingStatus status) {
            switch (status) {
            case ListingStatus::Open:
                return "OPEN";
            case ListingStatus::Matched:
                return "MATCHED";
            case ListingStatus::Cancelled:
                return "CANCELLED";
            case ListingStatus::Expired:
                return "EXPIRED";
            default:
                return "UNKNOWN";
            }
        }

        /// Open offer or request in the marketplace
        struct ServiceListing {
            dp::String id;
            dp::u8 kind{0}; // ListingKind
            dp::String category;
            dp::i64 price{0};
            dp::String owner_soul;
            SessionId owner_session{0};
            dp::u64 sequence{0}; // Strictly increasing within a category
            dp::i64 created_at{0};
            dp::i64 expires_at{0};
            dp::u8 status{0}; // ListingStatus
            dp::String trade_id;

            inline ListingKind getKind() const { return static_cast<ListingKind>(kind); }

            inline ListingStatus getStatus() const { return static_cast<ListingStatus>(status); }

            inline void setStatus(ListingStatus s) { status = static_cast<dp::u8>(s); }

            inline bool isOpen() const { return getStatus() == ListingStatus::Open; }

            inline std::string getId() const { return std::string(id.c_str()); }

            inline std::string getCategory() const { return std::string(category.c_str()); }

            inline std::string getOwner() const { return std::string(owner_soul.c_str()); }

            inline std::string getTradeId() const { return std::string(trade_id.c_str()); }

            auto members() {
                return std::tie(id, kind, category, price, owner_soul, owner_session, sequence, created_at, expires_at,
                                status, trade_id);
            }
            auto members() const {
                return std::tie(id, kind, category, price, owner_soul, owner_session, sequence, created_at, expires_at,
                                status, trade_id);
            }
        };

    } // namespace market
} // namespace soulrelay
