#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <iostream>
#include <shared_mutex>
#include <soulrelay/common/config.hpp>
#include <soulrelay/identity/signer.hpp>
#include <soulrelay/identity/soul_registry.hpp>
#include <soulrelay/reputation/reputation_event.hpp>
#include <soulrelay/storage/file_store.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace soulrelay::reputation {

    /// Result of a submission, with the reason when rejected
    struct Admission {
        ReputationOutcome outcome{ReputationOutcome::Rejected};
        std::string reason;

        inline bool accepted() const { return outcome == ReputationOutcome::Accepted; }
    };

    /// Answers whether a soul currently has a live authenticated session
    using PresenceCheck = std::function<bool(const std::string &soul_id)>;

    /// Append-only event log with an incrementally maintained score per soul
    class ReputationLedger {
      public:
        inline ReputationLedger(const SoulRegistry &registry, LedgerConfig config = LedgerConfig{},
                                storage::FileStore *store = nullptr)
            : registry_(registry), config_(config), store_(store) {}

        /// Without a presence check every endorser counts as present
        inline void setPresenceCheck(PresenceCheck check) {
            std::unique_lock lock(mutex_);
            presence_ = std::move(check);
        }

        /// Admit a signed event. A known event id is a no-op.
        inline Admission submit(const ReputationEvent &event, dp::i64 now = nowMillis()) {
            auto event_id = event.getEventId();
            if (hasEvent(event_id)) {
                return {ReputationOutcome::Duplicate, "event already accepted"};
            }

            auto invalid = validate(event);
            if (!invalid.empty()) {
                std::cout << "Reputation event " << event_id << " rejected: " << invalid << std::endl;
                return {ReputationOutcome::Rejected, invalid};
            }

            if (config_.require_authenticated_endorser) {
                PresenceCheck presence;
                {
                    std::shared_lock lock(mutex_);
                    presence = presence_;
                }
                if (presence && !presence(event.getEndorser())) {
                    std::cout << "Reputation event " << event_id << " rejected: endorser not authenticated"
                              << std::endl;
                    return {ReputationOutcome::Rejected, "endorser not authenticated"};
                }
            }

            ReputationEvent accepted = event;
            accepted.timestamp = now;

            std::unique_lock lock(mutex_);
            if (!seen_.insert(event_id).second) {
                return {ReputationOutcome::Duplicate, "event already accepted"};
            }
            apply(accepted);

            if (store_ != nullptr) {
                auto stored = store_->appendReputationEvent(accepted);
                if (stored.is_err()) {
                    std::cerr << "Failed to persist reputation event " << event_id << ": "
                              << stored.error().message.c_str() << std::endl;
                }
            }

            return {ReputationOutcome::Accepted, ""};
        }

        /// Replay a persisted event at start-up. Skips the presence check and is not re-persisted.
        inline Admission restore(const ReputationEvent &event) {
            auto invalid = validate(event);
            if (!invalid.empty()) {
                return {ReputationOutcome::Rejected, invalid};
            }

            std::unique_lock lock(mutex_);
            if (!seen_.insert(event.getEventId()).second) {
                return {ReputationOutcome::Duplicate, "event already accepted"};
            }
            apply(event);
            return {ReputationOutcome::Accepted, ""};
        }

        inline dp::i64 scoreOf(const std::string &soul_id) const {
            std::shared_lock lock(mutex_);
            auto it = scores_.find(soul_id);
            return it == scores_.end() ? 0 : it->second;
        }

        /// Accepted events whose subject is soul_id, in admission order
        inline std::vector<ReputationEvent> eventsFor(const std::string &soul_id) const {
            std::shared_lock lock(mutex_);
            std::vector<ReputationEvent> result;
            auto it = by_subject_.find(soul_id);
            if (it == by_subject_.end()) {
                return result;
            }
            for (size_t index : it->second) {
                result.push_back(events_[index]);
            }
            return result;
        }

        inline bool hasEvent(const std::string &event_id) const {
            std::shared_lock lock(mutex_);
            return seen_.find(event_id) != seen_.end();
        }

        inline size_t eventCount() const {
            std::shared_lock lock(mutex_);
            return events_.size();
        }

      private:
        /// Empty when the event is admissible on its own (signature, endorser, delta)
        inline std::string validate(const ReputationEvent &event) const {
            if (event.getEventId().empty()) {
                return "missing event id";
            }
            if (!registry_.exists(event.getSubject())) {
                return "unknown subject";
            }
            if (event.getEndorser() == event.getSubject()) {
                return "self-endorsement";
            }
            if (event.delta == 0 || event.delta > config_.max_abs_delta || event.delta < -config_.max_abs_delta) {
                return "delta out of range";
            }
            if (!verifySignature(registry_, event.getEndorser(), event.canonicalBytes(), event.getSignature())) {
                return "bad signature";
            }
            return "";
        }

        /// Caller holds the unique lock
        inline void apply(const ReputationEvent &event) {
            by_subject_[event.getSubject()].push_back(events_.size());
            scores_[event.getSubject()] += event.delta;
            events_.push_back(event);
        }

        const SoulRegistry &registry_;
        LedgerConfig config_;
        storage::FileStore *store_;
        PresenceCheck presence_;

        std::vector<ReputationEvent> events_;
        std::unordered_set<std::string> seen_;
        std::unordered_map<std::string, dp::i64> scores_;
        std::unordered_map<std::string, std::vector<size_t>> by_subject_;
        mutable std::shared_mutex mutex_;
    };

} // namespace soulrelay::reputation
