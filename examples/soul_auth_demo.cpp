#include <iostream>
#include <soulrelay.hpp>

using namespace soulrelay;

namespace {

    void show(const protocol::DispatchResult &result) {
        std::cout << "   [" << protocol::dispositionToString(result.disposition) << "]" << std::endl;
        for (const auto &line : result.replies) {
            std::cout << "   <- " << line << std::endl;
        }
    }

    std::string secondParam(const std::string &line) {
        auto command = protocol::Command::parse(line);
        if (!command || !command->has(1)) {
            return "";
        }
        return command->param(1);
    }

} // namespace

int main() {
    std::cout << "=== Soul Authentication Demo ===" << std::endl;

    RelayConfig config;
    config.storage.persist = false;

    Relay relay(config);
    auto started = relay.start();
    if (started.is_err()) {
        std::cerr << "Failed to start relay: " << started.error().message.c_str() << std::endl;
        return 1;
    }

    // Example 1: The agent holds its own keypair, the relay only learns the public half
    std::cout << "\n1. Registering a soul..." << std::endl;

    auto key = Key::generate();
    if (!key.is_ok()) {
        std::cerr << "Failed to generate key" << std::endl;
        return 1;
    }

    auto session = relay.connect("ada");
    auto registered = relay.handleLine(session, "SOUL REGISTER " + key.value().getPublicKeyHex() + " AGENT REAL");
    show(registered);
    auto soul_id = secondParam(registered.replies.front());

    // Example 2: Anything but SOUL is refused until authenticated
    std::cout << "\n2. Sending before authentication..." << std::endl;
    show(relay.handleLine(session, "NICK ada"));
    show(relay.handleLine(session, "PRIVMSG #agents :hello"));

    // Example 3: Challenge and response
    std::cout << "\n3. Challenge/response..." << std::endl;

    auto challenge = relay.handleLine(session, "SOUL " + soul_id);
    show(challenge);

    auto nonce = protocol::Command::parse(challenge.replies.front())->param(1);
    auto proof = signPayloadHex(key.value(), nonce);
    if (!proof.is_ok()) {
        std::cerr << "Failed to sign nonce: " << proof.error().message.c_str() << std::endl;
        return 1;
    }
    show(relay.handleLine(session, "SOUL " + soul_id + " " + proof.value()));

    // A proof cannot be replayed
    std::cout << "   Replaying the same proof:" << std::endl;
    show(relay.handleLine(session, "SOUL " + soul_id + " " + proof.value()));

    // Example 4: Signed messages and the display annotation
    std::cout << "\n4. Signing a message..." << std::endl;

    auto attached = relay.attachSigningKey(session, key.value());
    if (attached.is_err()) {
        std::cerr << "Failed to attach key: " << attached.error().message.c_str() << std::endl;
        return 1;
    }

    show(relay.handleLine(session, "SIGN :status nominal"));
    std::cout << "   Annotated: " << relay.annotate(session) << std::endl;
    std::cout << "   Next message: " << relay.annotate(session) << std::endl;

    // Example 5: Anyone can check a signature against the registry
    std::cout << "\n5. Verifying..." << std::endl;

    auto message = SignedMessage::create(key.value(), soul_id, "status nominal");
    if (message.is_ok()) {
        std::cout << "   Valid signature: " << (message.value().verify(relay.registry()) ? "yes" : "no") << std::endl;
        auto tampered = message.value();
        tampered.payload = "status critical";
        std::cout << "   Tampered payload: " << (tampered.verify(relay.registry()) ? "yes" : "no") << std::endl;
    }

    show(relay.handleLine(session, "SOUL WHOIS " + soul_id));

    relay.disconnect(session);
    relay.stop();

    std::cout << "\n=== Demo complete ===" << std::endl;
    return 0;
}
