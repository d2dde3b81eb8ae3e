#include <catch2/catch_test_macros.hpp>
#include "../src/address.hpp"
#include "../src/util.hpp"

TEST_CASE("Address canonicalization", "[address]") {
    SECTION("Mixed case is lowered") {
        auto addr = AddressNormalizer::canonicalize("0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
        REQUIRE(addr.has_value());
        REQUIRE(*addr == "0x833589fcd6edb6e08f4c7c32d4f71b54bda02913");
    }

    SECTION("Upper-case prefix and surrounding whitespace accepted") {
        auto addr = AddressNormalizer::canonicalize("  0X4200000000000000000000000000000000000006 ");
        REQUIRE(addr.has_value());
        REQUIRE(*addr == "0x4200000000000000000000000000000000000006");
    }

    SECTION("Invalid inputs rejected") {
        REQUIRE_FALSE(AddressNormalizer::canonicalize("").has_value());
        REQUIRE_FALSE(AddressNormalizer::canonicalize("0x1234").has_value());
        REQUIRE_FALSE(AddressNormalizer::canonicalize("4200000000000000000000000000000000000006").has_value());
        REQUIRE_FALSE(AddressNormalizer::canonicalize("0x42000000000000000000000000000000000000061").has_value());
        REQUIRE_FALSE(AddressNormalizer::canonicalize("0xg200000000000000000000000000000000000006").has_value());
        REQUIRE_FALSE(AddressNormalizer::canonicalize("1x4200000000000000000000000000000000000006").has_value());
    }

    SECTION("Zero address detection") {
        REQUIRE(AddressNormalizer::is_zero(kZeroAddress));
        REQUIRE(AddressNormalizer::is_zero("garbage"));
        REQUIRE_FALSE(AddressNormalizer::is_zero("0x4200000000000000000000000000000000000006"));
    }
}

TEST_CASE("Address set normalization", "[address]") {
    SECTION("Duplicates collapse case-insensitively") {
        auto set = AddressNormalizer::normalize(
            "0x940181a94a35a4569e4529a3cdfb74e38fd98631,"
            "0x940181A94A35A4569E4529A3CDFB74E38FD98631, "
            "0x4200000000000000000000000000000000000006");

        REQUIRE(set.size() == 2);
        REQUIRE(set.count("0x940181a94a35a4569e4529a3cdfb74e38fd98631") == 1);
        REQUIRE(set.count("0x4200000000000000000000000000000000000006") == 1);
    }

    SECTION("Invalid entries dropped without failing the batch") {
        auto set = AddressNormalizer::normalize(std::vector<std::string>{
            "not-an-address",
            "0x4200000000000000000000000000000000000006",
            "0xZZ"
        });

        REQUIRE(set.size() == 1);
        REQUIRE(*set.begin() == "0x4200000000000000000000000000000000000006");
    }

    SECTION("Empty input yields empty set") {
        REQUIRE(AddressNormalizer::normalize("").empty());
        REQUIRE(AddressNormalizer::normalize(" , ,").empty());
    }

    SECTION("Set iterates in sorted order") {
        auto set = AddressNormalizer::normalize(
            "0xffffffffffffffffffffffffffffffffffffffff,0x0000000000000000000000000000000000000001");
        REQUIRE(*set.begin() == "0x0000000000000000000000000000000000000001");
    }
}

TEST_CASE("Utility functions", "[util]") {
    SECTION("Split trims and skips empties") {
        auto parts = util::split(" a , ,b,", ',');
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0] == "a");
        REQUIRE(parts[1] == "b");
    }

    SECTION("Join") {
        REQUIRE(util::join({"a", "b", "c"}, ",") == "a,b,c");
        REQUIRE(util::join({}, ",").empty());
    }

    SECTION("RPC key redaction") {
        std::string redacted = util::redact_url("https://base-mainnet.g.alchemy.com/v2/abcdef123");
        REQUIRE(redacted.find("abcdef123") == std::string::npos);
        REQUIRE(redacted.find("***") != std::string::npos);

        REQUIRE(util::redact_url("https://mainnet.base.org") == "https://mainnet.base.org");
    }
}
