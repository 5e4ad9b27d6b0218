#include "soulrelay/reputation/reputation_ledger.hpp"
#include <doctest/doctest.h>
#include <set>

using namespace soulrelay;
using namespace soulrelay::reputation;

namespace {

    struct Endorser {
        Key key;
        std::string soul_id;
    };

    Endorser enroll(SoulRegistry &registry) {
        auto key = Key::generate();
        REQUIRE(key.is_ok());
        auto soul = registry.registerSoul(key.value());
        REQUIRE(soul.is_ok());
        return Endorser{key.value(), soul.value().getId()};
    }

    ReputationEvent endorse(const Endorser &endorser, const std::string &subject, const std::string &event_id,
                            dp::i64 delta, const std::string &reason = "HELPFUL") {
        ReputationEvent event(event_id, subject, endorser.soul_id, delta, reason);
        auto signature = endorser.key.sign(event.canonicalBytes());
        REQUIRE(signature.is_ok());
        event.setSignature(signature.value());
        return event;
    }

} // namespace

TEST_SUITE("Reputation Ledger Tests") {

    TEST_CASE("Canonical payload") {
        ReputationEvent event("evt-1", "subject", "endorser", -3, "LATE");
        CHECK(event.canonicalPayload() == "REPUTATION|evt-1|subject|endorser|-3|LATE");
    }

    TEST_CASE("Accepted event updates the score") {
        SoulRegistry registry;
        ReputationLedger ledger(registry);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        CHECK(ledger.scoreOf(bob.soul_id) == 0);

        auto admission = ledger.submit(endorse(alice, bob.soul_id, "evt-1", 5));
        CHECK(admission.outcome == ReputationOutcome::Accepted);
        CHECK(ledger.scoreOf(bob.soul_id) == 5);
        CHECK(ledger.scoreOf(alice.soul_id) == 0);

        CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-2", -2)).accepted());
        CHECK(ledger.scoreOf(bob.soul_id) == 3);
        CHECK(ledger.eventCount() == 2);

        auto events = ledger.eventsFor(bob.soul_id);
        REQUIRE(events.size() == 2);
        CHECK(events[0].getEventId() == "evt-1");
        CHECK(events[1].getEventId() == "evt-2");
        CHECK(events[0].timestamp > 0);
    }

    TEST_CASE("Replayed event counts once") {
        SoulRegistry registry;
        ReputationLedger ledger(registry);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        auto event = endorse(alice, bob.soul_id, "evt-1", 4);
        CHECK(ledger.submit(event).outcome == ReputationOutcome::Accepted);
        CHECK(ledger.submit(event).outcome == ReputationOutcome::Duplicate);
        CHECK(ledger.submit(event).outcome == ReputationOutcome::Duplicate);

        CHECK(ledger.scoreOf(bob.soul_id) == 4);
        CHECK(ledger.eventCount() == 1);
    }

    TEST_CASE("Invalid events are rejected") {
        SoulRegistry registry;
        LedgerConfig config;
        config.max_abs_delta = 10;
        ReputationLedger ledger(registry, config);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        SUBCASE("Bad signature") {
            auto event = endorse(alice, bob.soul_id, "evt-1", 1);
            event.delta = 9; // Signed for 1
            CHECK(ledger.submit(event).outcome == ReputationOutcome::Rejected);
        }

        SUBCASE("Signed by someone other than the endorser") {
            auto mallory = enroll(registry);
            ReputationEvent event("evt-1", bob.soul_id, alice.soul_id, 1, "HELPFUL");
            auto signature = mallory.key.sign(event.canonicalBytes());
            REQUIRE(signature.is_ok());
            event.setSignature(signature.value());
            CHECK(ledger.submit(event).outcome == ReputationOutcome::Rejected);
        }

        SUBCASE("Self-endorsement") {
            CHECK(ledger.submit(endorse(alice, alice.soul_id, "evt-1", 1)).outcome == ReputationOutcome::Rejected);
        }

        SUBCASE("Zero delta") {
            CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-1", 0)).outcome == ReputationOutcome::Rejected);
        }

        SUBCASE("Delta out of range") {
            CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-1", 11)).outcome == ReputationOutcome::Rejected);
            CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-2", -11)).outcome == ReputationOutcome::Rejected);
            CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-3", -10)).accepted());
        }

        SUBCASE("Unknown subject") {
            auto admission = ledger.submit(endorse(alice, std::string(64, 'e'), "evt-1", 1));
            CHECK(admission.outcome == ReputationOutcome::Rejected);
            CHECK(admission.reason == "unknown subject");
        }

        CHECK(ledger.scoreOf(bob.soul_id) <= 0);
    }

    TEST_CASE("Rejected event id can still be accepted later") {
        SoulRegistry registry;
        ReputationLedger ledger(registry);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        auto bad = endorse(alice, bob.soul_id, "evt-1", 2);
        bad.delta = 3;
        CHECK(ledger.submit(bad).outcome == ReputationOutcome::Rejected);
        CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-1", 2)).accepted());
        CHECK(ledger.scoreOf(bob.soul_id) == 2);
    }

    TEST_CASE("Endorser must be authenticated") {
        SoulRegistry registry;
        ReputationLedger ledger(registry);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        std::set<std::string> online;
        ledger.setPresenceCheck([&online](const std::string &soul_id) { return online.count(soul_id) > 0; });

        auto admission = ledger.submit(endorse(alice, bob.soul_id, "evt-1", 1));
        CHECK(admission.outcome == ReputationOutcome::Rejected);
        CHECK(admission.reason == "endorser not authenticated");

        online.insert(alice.soul_id);
        CHECK(ledger.submit(endorse(alice, bob.soul_id, "evt-1", 1)).accepted());

        SUBCASE("Presence is not required when disabled") {
            LedgerConfig config;
            config.require_authenticated_endorser = false;
            ReputationLedger relaxed(registry, config);
            relaxed.setPresenceCheck([](const std::string &) { return false; });
            CHECK(relaxed.submit(endorse(bob, alice.soul_id, "evt-9", 1)).accepted());
        }
    }

    TEST_CASE("Restore replays without a presence check") {
        SoulRegistry registry;
        ReputationLedger source(registry);
        auto alice = enroll(registry);
        auto bob = enroll(registry);

        REQUIRE(source.submit(endorse(alice, bob.soul_id, "evt-1", 3)).accepted());
        REQUIRE(source.submit(endorse(bob, alice.soul_id, "evt-2", 2)).accepted());

        ReputationLedger restored(registry);
        restored.setPresenceCheck([](const std::string &) { return false; });
        for (const auto &soul : {alice.soul_id, bob.soul_id}) {
            for (const auto &event : source.eventsFor(soul)) {
                CHECK(restored.restore(event).accepted());
            }
        }

        CHECK(restored.scoreOf(bob.soul_id) == 3);
        CHECK(restored.scoreOf(alice.soul_id) == 2);
        CHECK(restored.submit(endorse(alice, bob.soul_id, "evt-1", 3)).outcome == ReputationOutcome::Duplicate);

        SUBCASE("Tampered record is refused") {
            auto event = source.eventsFor(bob.soul_id).front();
            event.event_id = dp::String("evt-tampered");
            CHECK(restored.restore(event).outcome == ReputationOutcome::Rejected);
        }
    }
}
