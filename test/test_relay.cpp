#include "soulrelay/identity/signer.hpp"
#include "soulrelay/relay.hpp"
#include <atomic>
#include <doctest/doctest.h>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <thread>

using namespace soulrelay;

namespace {

    struct RecordingTransport : ITransport {
        std::mutex mutex;
        std::vector<std::pair<SessionId, std::string>> delivered;

        void deliver(SessionId session, const std::string &line) override {
            std::lock_guard<std::mutex> lock(mutex);
            delivered.emplace_back(session, line);
        }

        std::vector<std::string> linesFor(SessionId session) {
            std::lock_guard<std::mutex> lock(mutex);
            std::vector<std::string> lines;
            for (const auto &[target, line] : delivered) {
                if (target == session) {
                    lines.push_back(line);
                }
            }
            return lines;
        }
    };

    struct TestDir {
        std::string path;

        explicit TestDir(const std::string &name) : path(name + "_relay") { cleanup(); }
        ~TestDir() { cleanup(); }

        void cleanup() {
            if (std::filesystem::exists(path)) {
                std::filesystem::remove_all(path);
            }
        }
    };

    std::vector<std::string> words(const std::string &line) {
        std::istringstream in(line);
        std::vector<std::string> out;
        std::string word;
        while (in >> word) {
            out.push_back(word);
        }
        return out;
    }

    bool startsWith(const std::string &text, const std::string &prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }

    /// Text after the first " :"
    std::string trailing(const std::string &line) {
        auto pos = line.find(" :");
        REQUIRE(pos != std::string::npos);
        return line.substr(pos + 2);
    }

    RelayConfig memoryConfig() {
        RelayConfig config;
        config.storage.persist = false;
        return config;
    }

    struct Agent {
        Key key;
        std::string soul_id;
        SessionId session = 0;
    };

    void login(Relay &relay, Agent &agent) {
        auto challenge = relay.handleLine(agent.session, "SOUL " + agent.soul_id);
        REQUIRE(challenge.replies.size() == 1);
        auto parts = words(challenge.replies[0]);
        REQUIRE(parts.size() == 3);
        REQUIRE(parts[0] == "SOUL_CHALLENGE");

        auto proof = signPayloadHex(agent.key, parts[2]);
        REQUIRE(proof.is_ok());
        auto result = relay.handleLine(agent.session, "SOUL " + agent.soul_id + " " + proof.value());
        REQUIRE(result.replies.size() == 1);
        REQUIRE(result.replies[0] == "AUTH_OK " + agent.soul_id);
    }

    Agent join(Relay &relay, const std::string &nick, const std::string &extra = "") {
        auto key = Key::generate();
        REQUIRE(key.is_ok());
        Agent agent{key.value(), "", relay.connect(nick)};

        auto registered = relay.handleLine(agent.session, "SOUL REGISTER " + agent.key.getPublicKeyHex() + extra);
        REQUIRE(registered.replies.size() == 1);
        auto parts = words(registered.replies[0]);
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0] == "SOUL_REGISTERED");
        agent.soul_id = parts[1];

        login(relay, agent);
        return agent;
    }

} // namespace

TEST_SUITE("Relay Tests") {

    TEST_CASE("Unknown session is rejected") {
        Relay relay(memoryConfig());
        auto result = relay.handleLine(42, "SERVICE LIST");
        CHECK(result.disposition == protocol::Disposition::Rejected);
        CHECK(relay.sessionCount() == 0);
        CHECK(relay.annotate(42).empty());
    }

    TEST_CASE("Trade notifications reach both parties") {
        RecordingTransport transport;
        Relay relay(memoryConfig(), &transport);
        auto seeker = join(relay, "seeker");
        auto provider = join(relay, "provider");

        auto requested = relay.handleLine(seeker.session, "SERVICE REQUEST code 100");
        REQUIRE(requested.replies.size() == 1);
        CHECK(startsWith(requested.replies[0], "SERVICE_LISTED"));

        auto offered = relay.handleLine(provider.session, "SERVICE OFFER code 90");
        REQUIRE(offered.replies.size() == 2);
        CHECK(startsWith(offered.replies[0], "SERVICE_LISTED"));

        // The provider's own notification follows its reply
        auto provider_note = words(offered.replies[1]);
        REQUIRE(provider_note.size() >= 7);
        CHECK(provider_note[0] == "TRADE_PROPOSED");
        CHECK(provider_note[2] == "code");
        CHECK(provider_note[3] == "100");
        CHECK(provider_note[4] == "PROVIDER");
        CHECK(provider_note[5] == seeker.soul_id);
        auto trade_id = provider_note[1];

        auto seeker_lines = transport.linesFor(seeker.session);
        REQUIRE(seeker_lines.size() == 1);
        auto seeker_note = words(seeker_lines[0]);
        CHECK(seeker_note[0] == "TRADE_PROPOSED");
        CHECK(seeker_note[1] == trade_id);
        CHECK(seeker_note[4] == "SEEKER");
        CHECK(seeker_note[5] == provider.soul_id);

        // Seeker signs the payload it was handed
        auto seeker_sig = signPayloadHex(seeker.key, trailing(seeker_lines[0]));
        REQUIRE(seeker_sig.is_ok());
        auto accepted = relay.handleLine(seeker.session, "SERVICE ACCEPT " + trade_id + " " + seeker_sig.value());
        REQUIRE(accepted.replies.size() == 1);
        CHECK(accepted.replies[0] == "TRADE_ACCEPTED " + trade_id + " ACCEPTED_BY_SEEKER");

        // Provider lets the relay sign with its session key
        REQUIRE(relay.attachSigningKey(provider.session, provider.key).is_ok());
        auto settled = relay.handleLine(provider.session, "SERVICE ACCEPT " + trade_id);
        REQUIRE(settled.replies.size() == 2);
        CHECK(settled.replies[0] == "TRADE_ACCEPTED " + trade_id + " SETTLED");
        CHECK(settled.replies[1] == "TRADE_SETTLED " + trade_id);

        seeker_lines = transport.linesFor(seeker.session);
        REQUIRE(seeker_lines.size() == 2);
        CHECK(seeker_lines[1] == "TRADE_SETTLED " + trade_id);

        CHECK(relay.ledger().scoreOf(seeker.soul_id) == 1);
        CHECK(relay.ledger().scoreOf(provider.soul_id) == 1);
    }

    TEST_CASE("Annotation of relayed messages") {
        Relay relay(memoryConfig());
        auto anonymous = relay.connect();

        auto nick = relay.handleLine(anonymous, "NICK drifter");
        CHECK(nick.disposition == protocol::Disposition::Forward);
        CHECK(relay.annotate(anonymous) == "drifter");

        auto agent = join(relay, "worker", " engineer REAL");
        auto prefix = "[Soul:" + agent.soul_id + "] [Paradigm:engineer] [Mode:REAL] worker";
        CHECK(relay.annotate(agent.session) == prefix);

        REQUIRE(relay.attachSigningKey(agent.session, agent.key).is_ok());
        auto signed_reply = relay.handleLine(agent.session, "SIGN :build is green");
        REQUIRE(signed_reply.replies.size() == 1);
        auto signature = words(signed_reply.replies[0])[2];

        CHECK(relay.annotate(agent.session) == prefix + " [Sig:" + signature + "]");
        CHECK(relay.annotate(agent.session) == prefix);
        CHECK(verifySignatureHex(relay.registry(), agent.soul_id, "build is green", signature));
    }

    TEST_CASE("Signing key must carry its private half") {
        Relay relay(memoryConfig());
        auto agent = join(relay, "worker");

        auto result = relay.attachSigningKey(agent.session, agent.key.publicOnly());
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_NO_SIGNING_KEY);
        CHECK(relay.attachSigningKey(999, agent.key).is_err());
    }

    TEST_CASE("Disconnect unbinds the soul and cancels its listings") {
        Relay relay(memoryConfig());
        auto agent = join(relay, "worker");

        auto first = words(relay.handleLine(agent.session, "SERVICE OFFER code 10").replies[0]);
        auto second = words(relay.handleLine(agent.session, "SERVICE OFFER art 20").replies[0]);
        CHECK(relay.marketplace().openCountFor(agent.soul_id) == 2);
        CHECK(relay.sessionCount() == 1);

        relay.disconnect(agent.session);
        CHECK(relay.sessionCount() == 0);
        CHECK_FALSE(relay.authenticator().isAuthenticated(agent.soul_id));
        CHECK(relay.marketplace().listing(first[1])->getStatus() == market::ListingStatus::Cancelled);
        CHECK(relay.marketplace().listing(second[1])->getStatus() == market::ListingStatus::Cancelled);

        // Disconnecting twice is harmless
        relay.disconnect(agent.session);
    }

    TEST_CASE("Lines racing a disconnect never leave an open listing") {
        Relay relay(memoryConfig());

        for (int round = 0; round < 20; ++round) {
            auto agent = join(relay, "worker");
            std::atomic<int> posted{0};

            std::thread writer([&]() {
                for (int i = 0; i < 10; ++i) {
                    auto result = relay.handleLine(agent.session, "SERVICE OFFER code " + std::to_string(10 + i));
                    if (result.disposition == protocol::Disposition::Handled) {
                        posted++;
                    }
                }
            });
            while (posted.load() == 0 && round % 2 == 0) {
                std::this_thread::yield();
            }
            relay.disconnect(agent.session);
            writer.join();

            CHECK(relay.marketplace().openCountFor(agent.soul_id) == 0);
            CHECK_FALSE(relay.authenticator().isAuthenticated(agent.soul_id));
        }

        CHECK(relay.marketplace().openListings().empty());
    }

    TEST_CASE("A closed session rejects further lines") {
        Relay relay(memoryConfig());
        auto agent = join(relay, "worker");
        relay.disconnect(agent.session);

        auto result = relay.handleLine(agent.session, "SERVICE OFFER code 10");
        CHECK(result.disposition == protocol::Disposition::Rejected);
        REQUIRE(result.replies.size() == 1);
        CHECK(startsWith(result.replies[0], "ERR_NOT_AUTHENTICATED"));
        CHECK(relay.marketplace().openListings().empty());
    }

    TEST_CASE("Sweep expires listings and tells the owner") {
        RecordingTransport transport;
        auto config = memoryConfig();
        config.market.listing_ttl_ms = 1000;
        Relay relay(config, &transport);
        auto agent = join(relay, "worker");

        auto listed = words(relay.handleLine(agent.session, "SERVICE OFFER code 10").replies[0]);
        relay.sweepNow(nowMillis() + 5000);

        CHECK(relay.marketplace().listing(listed[1])->getStatus() == market::ListingStatus::Expired);
        auto lines = transport.linesFor(agent.session);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == "SERVICE_EXPIRED " + listed[1]);
    }

    TEST_CASE("State survives a restart") {
        TestDir dir("restart");
        RelayConfig config;
        config.storage.data_dir = dir.path;

        Key seeker_key;
        Key provider_key;
        std::string seeker_soul;
        std::string provider_soul;
        std::string open_listing;
        std::string trade_id;

        {
            Relay relay(config);
            REQUIRE(relay.start().is_ok());
            CHECK(relay.isRunning());

            auto seeker = join(relay, "seeker", " analyst");
            auto provider = join(relay, "provider");
            seeker_key = seeker.key;
            provider_key = provider.key;
            seeker_soul = seeker.soul_id;
            provider_soul = provider.soul_id;

            relay.handleLine(seeker.session, "SERVICE REQUEST code 100");
            auto offered = relay.handleLine(provider.session, "SERVICE OFFER code 100");
            REQUIRE(offered.replies.size() == 2);
            trade_id = words(offered.replies[1])[1];

            REQUIRE(relay.attachSigningKey(seeker.session, seeker.key).is_ok());
            REQUIRE(relay.attachSigningKey(provider.session, provider.key).is_ok());
            relay.handleLine(seeker.session, "SERVICE ACCEPT " + trade_id);
            relay.handleLine(provider.session, "SERVICE ACCEPT " + trade_id);
            REQUIRE(relay.ledger().scoreOf(provider_soul) == 1);

            open_listing = words(relay.handleLine(seeker.session, "SERVICE OFFER art 30").replies[0])[1];
            relay.stop();
            CHECK_FALSE(relay.isRunning());
        }

        Relay restarted(config);
        REQUIRE(restarted.start().is_ok());

        CHECK(restarted.registry().size() == 2);
        auto soul = restarted.registry().resolve(seeker_soul);
        REQUIRE(soul.is_ok());
        CHECK(soul.value().getParadigm() == "analyst");

        CHECK(restarted.ledger().scoreOf(seeker_soul) == 1);
        CHECK(restarted.ledger().scoreOf(provider_soul) == 1);
        CHECK(restarted.ledger().eventsFor(provider_soul).size() == 1);

        auto trade = restarted.marketplace().trade(trade_id);
        REQUIRE(trade.has_value());
        CHECK(trade->getStatus() == market::TradeStatus::Settled);

        // Its session is gone, so the OPEN listing came back cancelled
        auto listing = restarted.marketplace().listing(open_listing);
        REQUIRE(listing.has_value());
        CHECK(listing->getStatus() == market::ListingStatus::Cancelled);
        CHECK(restarted.marketplace().openListings().empty());

        // Nobody is authenticated after a restart, but the same key logs in again
        CHECK_FALSE(restarted.authenticator().isAuthenticated(seeker_soul));
        Agent again{seeker_key, seeker_soul, restarted.connect("seeker")};
        login(restarted, again);
        CHECK(restarted.authenticator().isAuthenticated(seeker_soul));

        restarted.stop();
    }
}
