#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace soulrelay {
    namespace reputation {

        /// Outcome of submitting an event to the ledger
        enum class ReputationOutcome : dp::u8 {
            Accepted = 0,  // Appended, score updated
            Duplicate = 1, // Event id already accepted, no effect
            Rejected = 2,  // Signature, endorser or delta not acceptable
        };

        inline std::string reputationOutcomeToString(ReputationOutcome outcome) {
            switch (outcome) {
            case ReputationOutcome::Accepted:
                return "accepted";
            case ReputationOutcome::Duplicate:
                return "duplicate";
            case ReputationOutcome::Rejected:
                return "rejected";
            default:
                return "unknown";
            }
        }

        /// Signed endorsement adjusting a soul's score
        struct ReputationEvent {
            dp::String event_id; // Caller-supplied, unique, dedup key
            dp::String subject;  // Soul being scored
            dp::String endorser; // Soul that signed the event
            dp::i64 delta{0};
            dp::String reason;
            dp::i64 timestamp{0};
            dp::Vector<dp::u8> signature; // Endorser's signature over canonicalPayload()

            ReputationEvent() = default;

            ReputationEvent(const std::string &id, const std::string &subject_soul, const std::string &endorser_soul,
                            dp::i64 score_delta, const std::string &reason_code)
                : event_id(dp::String(id.c_str())), subject(dp::String(subject_soul.c_str())),
                  endorser(dp::String(endorser_soul.c_str())), delta(score_delta),
                  reason(dp::String(reason_code.c_str())) {}

            inline std::string getEventId() const { return std::string(event_id.c_str()); }

            inline std::string getSubject() const { return std::string(subject.c_str()); }

            inline std::string getEndorser() const { return std::string(endorser.c_str()); }

            inline std::string getReason() const { return std::string(reason.c_str()); }

            /// Bytes the endorser signs. The timestamp is not covered so a payload can be
            /// computed ahead of submission by both sides.
            inline std::string canonicalPayload() const {
                return "REPUTATION|" + getEventId() + "|" + getSubject() + "|" + getEndorser() + "|" +
                       std::to_string(delta) + "|" + getReason();
            }

            inline std::vector<uint8_t> canonicalBytes() const {
                auto payload = canonicalPayload();
                return std::vector<uint8_t>(payload.begin(), payload.end());
            }

            inline std::vector<uint8_t> getSignature() const {
                return std::vector<uint8_t>(signature.begin(), signature.end());
            }

            inline void setSignature(const std::vector<uint8_t> &sig) {
                signature = dp::Vector<dp::u8>(sig.begin(), sig.end());
            }

            auto members() { return std::tie(event_id, subject, endorser, delta, reason, timestamp, signature); }
            auto members() const { return std::tie(event_id, subject, endorser, delta, reason, timestamp, signature); }
        };

    } // namespace reputation
} // namespace soulrelay
