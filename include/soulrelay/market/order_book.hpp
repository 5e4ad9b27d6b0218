#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <optional>
#include <soulrelay/market/listing.hpp>
#include <soulrelay/reputation/reputation_ledger.hpp>
#include <string>
#include <vector>

namespace soulrelay::market {

    // ===========================================
    // Match priority
    // ===========================================

    /// Orders compatible counterparts for an incoming listing
    class MatchPriority {
      public:
        virtual ~MatchPriority() = default;

        /// True when a should be matched before b
        virtual bool before(const ServiceListing &a, const ServiceListing &b) const = 0;

        virtual std::string name() const = 0;
    };

    /// Lowest price first, then earliest arrival
    class PriceTimePriority : public MatchPriority {
      public:
        inline bool before(const ServiceListing &a, const ServiceListing &b) const override {
            if (a.price != b.price) {
                return a.price < b.price;
            }
            return a.sequence < b.sequence;
        }

        inline std::string name() const override { return "price-time"; }
    };

    /// Highest owner reputation first, price-time among equals
    class ReputationFirstPriority : public MatchPriority {
      public:
        inline explicit ReputationFirstPriority(const reputation::ReputationLedger &ledger) : ledger_(ledger) {}

        inline bool before(const ServiceListing &a, const ServiceListing &b) const override {
            auto score_a = ledger_.scoreOf(a.getOwner());
            auto score_b = ledger_.scoreOf(b.getOwner());
            if (score_a != score_b) {
                return score_a > score_b;
            }
            return price_time_.before(a, b);
        }

        inline std::string name() const override { return "reputation-first"; }

      private:
        const reputation::ReputationLedger &ledger_;
        PriceTimePriority price_time_;
    };

    // ===========================================
    // OrderBook - resting listings of one category
    // ===========================================

    /// Not internally synchronized; the marketplace holds the category lock while using a book
    class OrderBook {
      public:
        inline explicit OrderBook(const std::string &category) : category_(category) {}

        inline const std::string &category() const { return category_; }

        /// Next arrival number for this category
        inline dp::u64 nextSequence() { return next_sequence_++; }

        /// Keep sequence numbers ahead of restored history
        inline void observeSequence(dp::u64 sequence) {
            if (sequence >= next_sequence_) {
                next_sequence_ = sequence + 1;
            }
        }

        inline void add(const ServiceListing &listing) {
            if (listing.getKind() == ListingKind::Offer) {
                offers_.push_back(listing);
            } else {
                requests_.push_back(listing);
            }
        }

        inline bool remove(const std::string &listing_id) {
            return removeFrom(offers_, listing_id) || removeFrom(requests_, listing_id);
        }

        /// Best resting counterpart for incoming, never one owned by the same soul or past its TTL at now
        inline std::optional<ServiceListing> bestMatch(const ServiceListing &incoming, const MatchPriority &priority,
                                                       dp::i64 now) const {
            const auto &side = incoming.getKind() == ListingKind::Offer ? requests_ : offers_;

            const ServiceListing *best = nullptr;
            for (const auto &resting : side) {
                if (resting.getOwner() == incoming.getOwner() || !compatible(incoming, resting)) {
                    continue;
                }
                if (now > resting.expires_at) {
                    continue; // Waiting for the sweeper
                }
                if (best == nullptr || priority.before(resting, *best)) {
                    best = &resting;
                }
            }

            if (best == nullptr) {
                return std::nullopt;
            }
            return *best;
        }

        inline std::vector<ServiceListing> listings() const {
            std::vector<ServiceListing> all(offers_.begin(), offers_.end());
            all.insert(all.end(), requests_.begin(), requests_.end());
            std::sort(all.begin(), all.end(),
                      [](const ServiceListing &a, const ServiceListing &b) { return a.sequence < b.sequence; });
            return all;
        }

        inline size_t size() const { return offers_.size() + requests_.size(); }

        /// An offer fills a request when the request pays at least the offer's price
        inline static bool compatible(const ServiceListing &incoming, const ServiceListing &resting) {
            if (incoming.getKind() == resting.getKind()) {
                return false;
            }
            if (incoming.getKind() == ListingKind::Offer) {
                return resting.price >= incoming.price;
            }
            return resting.price <= incoming.price;
        }

      private:
        inline static bool removeFrom(std::vector<ServiceListing> &side, const std::string &listing_id) {
            auto it = std::find_if(side.begin(), side.end(),
                                   [&](const ServiceListing &l) { return l.getId() == listing_id; });
            if (it == side.end()) {
                return false;
            }
            side.erase(it);
            return true;
        }

        std::string category_;
        std::vector<ServiceListing> offers_;
        std::vector<ServiceListing> requests_;
        dp::u64 next_sequence_ = 1;
    };

} // namespace soulrelay::market
