#include <iostream>
#include <keylock/keylock.hpp>
#include <soulrelay/identity/signer.hpp>
#include <soulrelay/protocol/dispatcher.hpp>

namespace soulrelay::protocol {

    namespace {

        std::string orDash(const std::string &text) { return text.empty() ? "-" : text; }

        std::vector<uint8_t> decodeSignature(const std::string &hex) {
            if (hex.size() != Key::SIGNATURE_SIZE * 2 || !Key::isHex(hex)) {
                return {};
            }
            return keylock::keylock::from_hex(hex);
        }

        DispatchResult errorResult(const dp::Error &error) { return DispatchResult::handled({errorReply(error)}); }

    } // namespace

    CommandDispatcher::CommandDispatcher(SoulRegistry &registry, auth::SoulAuthenticator &authenticator,
                                         reputation::ReputationLedger &ledger, market::Marketplace &marketplace,
                                         const RelayConfig &config)
        : registry_(registry), authenticator_(authenticator), ledger_(ledger), marketplace_(marketplace),
          passthrough_(config.preauth_passthrough.begin(), config.preauth_passthrough.end()) {}

    DispatchResult CommandDispatcher::dispatch(auth::Session &session, const std::string &line) {
        auto parsed = Command::parse(line);
        if (!parsed) {
            return DispatchResult::handled({});
        }
        const Command &command = *parsed;

        if (command.verb == "SOUL") {
            return handleSoul(session, command);
        }

        auto soul = authenticator_.boundSoul(session.id);
        if (!soul) {
            if (passthrough_.count(command.verb) > 0) {
                return DispatchResult::forward();
            }
            return DispatchResult::rejected(errorReply(not_authenticated()));
        }

        if (command.verb == "SERVICE") {
            return handleService(session, *soul, command);
        }
        if (command.verb == "SIGN") {
            return handleSign(session, *soul, command);
        }
        return DispatchResult::forward();
    }

    // ===========================================
    // SOUL
    // ===========================================

    DispatchResult CommandDispatcher::handleSoul(auth::Session &session, const Command &command) {
        if (!command.has(0)) {
            return errorResult(syntax_error("SOUL needs a soul id"));
        }

        auto sub = Command::upper(command.param(0));
        if (sub == "REGISTER") {
            return registerSoul(command);
        }
        if (sub == "WHOIS") {
            return whois(command);
        }

        const auto &soul_id = command.param(0);
        if (command.params.size() == 1) {
            auto challenge = authenticator_.beginAuth(session.id, soul_id);
            if (challenge.is_err()) {
                return errorResult(challenge.error());
            }
            return DispatchResult::handled({"SOUL_CHALLENGE " + soul_id + " " + challenge.value().nonce});
        }

        if (command.params.size() == 2) {
            std::string challenge_id;
            auto pending = authenticator_.pendingChallenge(session.id);
            if (pending && pending->soul_id == soul_id) {
                challenge_id = pending->id;
            }

            auto result = authenticator_.respond(session.id, challenge_id, decodeSignature(command.param(1)));
            if (result.is_err()) {
                return errorResult(result.error());
            }

            // A different soul no longer speaks through this session's signing key
            if (session.signing_key && session.signing_key->getId() != soul_id) {
                session.signing_key.reset();
            }
            session.pending_signature.clear();

            std::string reply = "AUTH_OK " + soul_id;
            if (result.value().replaced) {
                reply += " :replaced " + *result.value().replaced;
            }
            return DispatchResult::handled({reply});
        }

        return errorResult(syntax_error("SOUL <soul_id> [signature]"));
    }

    DispatchResult CommandDispatcher::registerSoul(const Command &command) {
        if (!command.has(1) || command.params.size() > 4) {
            return errorResult(syntax_error("SOUL REGISTER <pubkey_hex> [paradigm] [mode]"));
        }

        auto paradigm = command.has(2) ? command.param(2) : "";
        auto mode = command.has(3) ? command.param(3) : "";
        auto soul = registry_.registerSoul(command.param(1), paradigm, mode);
        if (soul.is_err()) {
            return errorResult(soul.error());
        }

        std::cout << "Soul " << soul.value().getId() << " registered" << std::endl;
        return DispatchResult::handled({"SOUL_REGISTERED " + soul.value().getId()});
    }

    DispatchResult CommandDispatcher::whois(const Command &command) {
        if (!command.has(1)) {
            return errorResult(syntax_error("SOUL WHOIS <soul_id>"));
        }

        auto soul = registry_.resolve(command.param(1));
        if (soul.is_err()) {
            return errorResult(soul.error());
        }

        const auto &s = soul.value();
        return DispatchResult::handled({"SOUL_INFO " + s.getId() + " " + std::to_string(ledger_.scoreOf(s.getId())) +
                                        " " + orDash(s.getParadigm()) + " " + orDash(s.getMode())});
    }

    // ===========================================
    // SERVICE
    // ===========================================

    DispatchResult CommandDispatcher::handleService(auth::Session &session, const std::string &soul_id,
                                                    const Command &command) {
        if (!command.has(0)) {
            return errorResult(syntax_error("SERVICE needs a subcommand"));
        }

        auto sub = Command::upper(command.param(0));
        if (sub == "LIST") {
            return listServices();
        }
        if (sub == "OFFER") {
            return postListing(session, soul_id, market::ListingKind::Offer, command);
        }
        if (sub == "REQUEST") {
            return postListing(session, soul_id, market::ListingKind::Request, command);
        }
        if (sub == "CANCEL") {
            if (!command.has(1)) {
                return errorResult(syntax_error("SERVICE CANCEL <listing_id>"));
            }
            auto cancelled = marketplace_.cancel(soul_id, command.param(1));
            if (cancelled.is_err()) {
                return errorResult(cancelled.error());
            }
            return DispatchResult::handled({"SERVICE_CANCELLED " + cancelled.value().getId()});
        }
        if (sub == "ACCEPT") {
            return acceptTrade(session, soul_id, command);
        }

        return errorResult(syntax_error(("Unknown SERVICE subcommand " + sub).c_str()));
    }

    DispatchResult CommandDispatcher::listServices() {
        std::vector<std::string> lines;
        for (const auto &listing : marketplace_.openListings()) {
            lines.push_back("SERVICE_ITEM " + listing.getId() + " " + market::listingKindToString(listing.getKind()) +
                            " " + listing.getCategory() + " " + std::to_string(listing.price) + " " +
                            listing.getOwner());
        }
        lines.push_back("SERVICE_END");
        return DispatchResult::handled(std::move(lines));
    }

    DispatchResult CommandDispatcher::postListing(auth::Session &session, const std::string &soul_id,
                                                  market::ListingKind kind, const Command &command) {
        if (!command.has(2)) {
            return errorResult(syntax_error("SERVICE OFFER|REQUEST <category> <price>"));
        }

        auto price = parsePrice(command.param(2));
        if (!price) {
            return errorResult(invalid_price());
        }

        auto listed = marketplace_.list(session.id, soul_id, kind, command.param(1), *price);
        if (listed.is_err()) {
            return errorResult(listed.error());
        }
        return DispatchResult::handled({"SERVICE_LISTED " + listed.value().listing.getId()});
    }

    DispatchResult CommandDispatcher::acceptTrade(auth::Session &session, const std::string &soul_id,
                                                  const Command &command) {
        if (!command.has(1)) {
            return errorResult(syntax_error("SERVICE ACCEPT <trade_id> [signature]"));
        }
        const auto &trade_id = command.param(1);

        std::vector<uint8_t> signature;
        if (command.has(2)) {
            signature = decodeSignature(command.param(2));
            if (signature.empty()) {
                return errorResult(auth_failed("Malformed endorsement signature"));
            }
        } else {
            if (!session.signing_key) {
                return errorResult(no_signing_key());
            }
            auto trade = marketplace_.trade(trade_id);
            if (!trade) {
                return errorResult(no_such_trade());
            }
            auto signed_payload = signPayload(*session.signing_key, trade->endorsementFor(soul_id).canonicalPayload());
            if (signed_payload.is_err()) {
                return errorResult(no_signing_key(signed_payload.error().message));
            }
            signature = signed_payload.value();
        }

        auto accepted = marketplace_.accept(session.id, soul_id, trade_id, signature);
        if (accepted.is_err()) {
            return errorResult(accepted.error());
        }
        return DispatchResult::handled({"TRADE_ACCEPTED " + trade_id + " " +
                                        market::tradeStatusToString(accepted.value().getStatus())});
    }

    // ===========================================
    // SIGN
    // ===========================================

    DispatchResult CommandDispatcher::handleSign(auth::Session &session, const std::string &soul_id,
                                                 const Command &command) {
        if (!command.has(0)) {
            return errorResult(syntax_error("SIGN <payload>"));
        }
        if (!session.signing_key || session.signing_key->getId() != soul_id) {
            return errorResult(no_signing_key());
        }

        auto payload = command.remainder();
        auto signature = signPayloadHex(*session.signing_key, payload);
        if (signature.is_err()) {
            return errorResult(no_signing_key(signature.error().message));
        }

        session.pending_signature = signature.value();
        return DispatchResult::handled({"SIGNATURE " + soul_id + " " + signature.value() + " :" + payload});
    }

    std::optional<dp::i64> CommandDispatcher::parsePrice(const std::string &text) {
        if (text.empty() || text.size() > 18) {
            return std::nullopt;
        }
        for (char c : text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
        }
        return static_cast<dp::i64>(std::stoll(text));
    }

} // namespace soulrelay::protocol
