#include "soulrelay/identity/soul_registry.hpp"
#include <doctest/doctest.h>
#include <thread>

using namespace soulrelay;

TEST_SUITE("Soul Registry Tests") {

    TEST_CASE("Register a new soul") {
        SoulRegistry registry;

        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());

        auto result = registry.registerSoul(key_result.value(), "AGENT", "REAL");
        REQUIRE(result.is_ok());

        const auto &soul = result.value();
        CHECK(soul.getId() == key_result.value().getId());
        CHECK(soul.getParadigm() == "AGENT");
        CHECK(soul.getMode() == "REAL");
        CHECK(soul.created_at > 0);
        CHECK(registry.exists(soul.getId()));
        CHECK(registry.size() == 1);
    }

    TEST_CASE("Registry keeps only the public half") {
        SoulRegistry registry;

        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());
        auto result = registry.registerSoul(key_result.value());
        REQUIRE(result.is_ok());

        auto key = registry.keyOf(result.value().getId());
        REQUIRE(key.is_ok());
        CHECK_FALSE(key.value().hasPrivateKey());
        CHECK(key.value() == key_result.value());
    }

    TEST_CASE("Register duplicate soul fails") {
        SoulRegistry registry;

        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());
        REQUIRE(registry.registerSoul(key_result.value()).is_ok());

        // Same key = same soul id
        auto again = registry.registerSoul(key_result.value(), "OTHER");
        REQUIRE(again.is_err());
        CHECK(again.error().code == ERR_ALREADY_REGISTERED);
        CHECK(registry.size() == 1);

        auto resolved = registry.resolve(key_result.value().getId());
        REQUIRE(resolved.is_ok());
        CHECK(resolved.value().getParadigm().empty());
    }

    TEST_CASE("Register from hex public key") {
        SoulRegistry registry;

        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());

        auto result = registry.registerSoul(key_result.value().getPublicKeyHex(), "AGENT");
        REQUIRE(result.is_ok());
        CHECK(result.value().getId() == key_result.value().getId());

        auto bad = registry.registerSoul(std::string("not-a-key"));
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == ERR_INVALID_KEY);
    }

    TEST_CASE("Resolve unknown soul fails") {
        SoulRegistry registry;

        auto result = registry.resolve(std::string(64, '0'));
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_UNKNOWN_SOUL);
        CHECK_FALSE(registry.exists(std::string(64, '0')));
    }

    TEST_CASE("Restore persisted soul") {
        SoulRegistry source;
        auto key_result = Key::generate();
        REQUIRE(key_result.is_ok());
        auto soul = source.registerSoul(key_result.value(), "AGENT", "REAL");
        REQUIRE(soul.is_ok());

        SoulRegistry restored;
        CHECK(restored.restore(soul.value()).is_ok());
        CHECK(restored.exists(soul.value().getId()));
        CHECK(restored.restore(soul.value()).is_err());

        SUBCASE("Entry whose id does not match its key is refused") {
            Soul forged = soul.value();
            forged.id = dp::String(std::string(64, 'a').c_str());
            CHECK(restored.restore(forged).is_err());
        }
    }

    TEST_CASE("Concurrent registration") {
        SoulRegistry registry;
        std::vector<std::thread> threads;

        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&registry]() {
                for (int i = 0; i < 5; ++i) {
                    auto key = Key::generate();
                    if (key.is_ok()) {
                        registry.registerSoul(key.value());
                    }
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }

        CHECK(registry.size() == 20);
        CHECK(registry.all().size() == 20);
    }
}
