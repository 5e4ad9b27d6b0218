#pragma once

#include <datapod/datapod.hpp>
#include <soulrelay/reputation/reputation_event.hpp>
#include <string>
#include <vector>

namespace soulrelay {
    namespace market {

        /// PROPOSED -> ACCEPTED_BY_{SEEKER,PROVIDER} -> SETTLED, any non-terminal -> ABORTED
        enum class TradeStatus : dp::u8 {
            Proposed = 0,
            AcceptedBySeeker = 1,
            AcceptedByProvider = 2,
            Settled = 3,
            Aborted = 4,
        };

        inline std::string tradeStatusToString(TradeStatus status) {
            switch (status) {
            case TradeStatus::Proposed:
                return "PROPOSED";
            case TradeStatus::AcceptedBySeeker:
                return "ACCEPTED_BY_SEEKER";
            case TradeStatus::AcceptedByProvider:
                return "ACCEPTED_BY_PROVIDER";
            case TradeStatus::Settled:
                return "SETTLED";
            case TradeStatus::Aborted:
                return "ABORTED";
            default:
                return "UNKNOWN";
            }
        }

        inline const std::string TRADE_SETTLED_REASON = "TRADE_SETTLED";

        /// Proposed exchange between a matched offer and request
        struct Trade {
            dp::String id;
            dp::String category;
            dp::String offer_id;
            dp::String request_id;
            dp::String provider_soul; // Owner of the offer
            dp::String seeker_soul;   // Owner of the request
            dp::i64 price{0};         // Price of the listing that was resting in the book
            dp::i64 credit{0};        // Reputation delta each side endorses on settlement
            dp::u8 status{0};         // TradeStatus
            dp::i64 created_at{0};
            dp::i64 deadline{0};
            dp::Vector<dp::u8> provider_signature; // Provider's endorsement of the seeker
            dp::Vector<dp::u8> seeker_signature;   // Seeker's endorsement of the provider

            inline TradeStatus getStatus() const { return static_cast<TradeStatus>(status); }

            inline void setStatus(TradeStatus s) { status = static_cast<dp::u8>(s); }

            inline bool isTerminal() const {
                return getStatus() == TradeStatus::Settled || getStatus() == TradeStatus::Aborted;
            }

            inline std::string getId() const { return std::string(id.c_str()); }

            inline std::string getCategory() const { return std::string(category.c_str()); }

            inline std::string getProvider() const { return std::string(provider_soul.c_str()); }

            inline std::string getSeeker() const { return std::string(seeker_soul.c_str()); }

            inline bool isParty(const std::string &soul_id) const {
                return soul_id == getProvider() || soul_id == getSeeker();
            }

            /// The other side of the trade, or "" if soul_id is not a party
            inline std::string counterpartyOf(const std::string &soul_id) const {
                if (soul_id == getProvider()) {
                    return getSeeker();
                }
                if (soul_id == getSeeker()) {
                    return getProvider();
                }
                return "";
            }

            inline bool hasAccepted(const std::string &soul_id) const {
                if (soul_id == getProvider()) {
                    return !provider_signature.empty();
                }
                if (soul_id == getSeeker()) {
                    return !seeker_signature.empty();
                }
                return false;
            }

            /// Unsigned reputation event a party signs to accept the trade
            inline reputation::ReputationEvent endorsementFor(const std::string &endorser) const {
                return reputation::ReputationEvent("trade:" + getId() + ":" + endorser, counterpartyOf(endorser),
                                                   endorser, credit, TRADE_SETTLED_REASON);
            }

            /// Signed endorsement recorded for endorser, signature empty if not yet accepted
            inline reputation::ReputationEvent signedEndorsementFor(const std::string &endorser) const {
                auto event = endorsementFor(endorser);
                if (endorser == getProvider()) {
                    event.signature = provider_signature;
                } else if (endorser == getSeeker()) {
                    event.signature = seeker_signature;
                }
                return event;
            }

            auto members() {
                return std::tie(id, category, offer_id, request_id, provider_soul, seeker_soul, price, credit, status,
                                created_at, deadline, provider_signature, seeker_signature);
            }
            auto members() const {
                return std::tie(id, category, offer_id, request_id, provider_soul, seeker_soul, price, credit, status,
                                created_at, deadline, provider_signature, seeker_signature);
            }
        };

    } // namespace market
} // namespace soulrelay
