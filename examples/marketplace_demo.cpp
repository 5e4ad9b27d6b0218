#include <filesystem>
#include <iostream>
#include <soulrelay.hpp>

using namespace soulrelay;

namespace {

    /// Prints whatever the relay pushes to a session
    class ConsoleTransport : public ITransport {
      public:
        void deliver(SessionId session, const std::string &line) override {
            std::cout << "   [session " << session << "] <- " << line << std::endl;
        }
    };

    struct Agent {
        std::string name;
        Key key;
        std::string soul_id;
        SessionId session = 0;
    };

    void show(const protocol::DispatchResult &result) {
        for (const auto &line : result.replies) {
            std::cout << "   <- " << line << std::endl;
        }
    }

    bool login(Relay &relay, Agent &agent, const std::string &paradigm) {
        auto key = Key::generate();
        if (!key.is_ok()) {
            return false;
        }
        agent.key = key.value();

        auto soul = relay.registry().registerSoul(agent.key, paradigm, "REAL");
        if (!soul.is_ok()) {
            std::cerr << "Failed to register " << agent.name << ": " << soul.error().message.c_str() << std::endl;
            return false;
        }
        agent.soul_id = soul.value().getId();
        agent.session = relay.connect(agent.name);

        auto challenge = relay.handleLine(agent.session, "SOUL " + agent.soul_id);
        auto nonce = protocol::Command::parse(challenge.replies.front())->param(1);
        auto proof = signPayloadHex(agent.key, nonce);
        if (!proof.is_ok()) {
            return false;
        }
        show(relay.handleLine(agent.session, "SOUL " + agent.soul_id + " " + proof.value()));

        return relay.attachSigningKey(agent.session, agent.key).is_ok();
    }

} // namespace

int main() {
    std::cout << "=== Service Marketplace Demo ===" << std::endl;

    const std::string data_dir = "marketplace_demo_data";
    std::filesystem::remove_all(data_dir);

    RelayConfig config;
    config.storage.data_dir = data_dir;
    config.market.trade_deadline_ms = 60000;

    ConsoleTransport transport;
    Relay relay(config, &transport);
    auto started = relay.start();
    if (started.is_err()) {
        std::cerr << "Failed to start relay: " << started.error().message.c_str() << std::endl;
        return 1;
    }

    // Example 1: Three agents authenticate
    std::cout << "\n1. Authenticating agents..." << std::endl;

    Agent provider{"translator"};
    Agent cheap{"seeker-a"};
    Agent pricey{"seeker-b"};
    for (auto *agent : {&provider, &cheap, &pricey}) {
        if (!login(relay, *agent, "AGENT")) {
            std::cerr << "Login failed for " << agent->name << std::endl;
            return 1;
        }
    }

    // Example 2: Two requests rest in the book
    std::cout << "\n2. Posting requests..." << std::endl;
    show(relay.handleLine(cheap.session, "SERVICE REQUEST translate 90"));
    auto pricey_listed = relay.handleLine(pricey.session, "SERVICE REQUEST translate 95");
    show(pricey_listed);
    auto pricey_listing = protocol::Command::parse(pricey_listed.replies.front())->param(0);
    show(relay.handleLine(provider.session, "SERVICE LIST"));

    // Example 3: An offer arrives and matches the best-priced request
    std::cout << "\n3. Posting an offer..." << std::endl;
    auto offered = relay.handleLine(provider.session, "SERVICE OFFER translate 80");
    show(offered);

    auto trades = relay.marketplace().tradesFor(provider.soul_id);
    if (trades.empty()) {
        std::cerr << "No trade was proposed" << std::endl;
        return 1;
    }
    auto trade_id = trades.front().getId();
    std::cout << "   Trade " << trade_id << " at price " << trades.front().price << std::endl;

    // Example 4: Both parties accept, each signing the endorsement it gives the other
    std::cout << "\n4. Accepting..." << std::endl;
    show(relay.handleLine(provider.session, "SERVICE ACCEPT " + trade_id));
    show(relay.handleLine(cheap.session, "SERVICE ACCEPT " + trade_id));

    std::cout << "   Provider score: " << relay.ledger().scoreOf(provider.soul_id) << std::endl;
    std::cout << "   Seeker score: " << relay.ledger().scoreOf(cheap.soul_id) << std::endl;

    // Example 5: Disconnecting withdraws what is still open
    std::cout << "\n5. Disconnecting seeker-b..." << std::endl;
    relay.disconnect(pricey.session);
    show(relay.handleLine(provider.session, "SERVICE LIST"));

    relay.stop();

    // Example 6: State survives a restart
    std::cout << "\n6. Restarting..." << std::endl;
    Relay restarted(config, &transport);
    if (restarted.start().is_err()) {
        std::cerr << "Failed to restart relay" << std::endl;
        return 1;
    }
    std::cout << "   Souls: " << restarted.registry().size() << std::endl;
    std::cout << "   Provider score: " << restarted.ledger().scoreOf(provider.soul_id) << std::endl;
    for (const auto &listing_id : {std::string(trades.front().offer_id.c_str()), pricey_listing}) {
        auto listing = restarted.marketplace().listing(listing_id);
        if (listing) {
            std::cout << "   Listing " << listing_id << ": " << market::listingStatusToString(listing->getStatus())
                      << std::endl;
        }
    }
    restarted.stop();

    std::filesystem::remove_all(data_dir);
    std::cout << "\n=== Demo complete ===" << std::endl;
    return 0;
}
