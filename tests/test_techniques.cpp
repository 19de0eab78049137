/**
 * @file test_techniques.cpp
 * @brief Tests for the technique registry and tiers.
 */

#include <sudokulogic/techniques.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace sudokulogic;

TEST_CASE("all_techniques order", "[techniques]") {
    const std::vector<std::string> expected = {
        "Naked Single", "Hidden Single", "Locked Candidates", "Naked Pair", "Hidden Pair", "Naked Triple",
        "Hidden Triple", "Naked Quad", "Hidden Quad", "X-Wing", "Skyscraper", "Y-Wing"};

    auto techniques = all_techniques();
    REQUIRE(techniques.size() == expected.size());
    for (std::size_t i = 0; i < techniques.size(); ++i) {
        REQUIRE(techniques[i]->name() == expected[i]);
    }

    SECTION("tiers never decrease") {
        for (std::size_t i = 1; i < techniques.size(); ++i) {
            REQUIRE(techniques[i - 1]->tier() <= techniques[i]->tier());
        }
        REQUIRE(techniques.front()->tier() == TechniqueTier::Fundamental);
        REQUIRE(techniques.back()->tier() == TechniqueTier::Advanced);
    }
}

TEST_CASE("fundamental_techniques", "[techniques]") {
    auto techniques = fundamental_techniques();
    REQUIRE(techniques.size() == 2);
    REQUIRE(std::string(techniques[0]->name()) == "Naked Single");
    REQUIRE(std::string(techniques[1]->name()) == "Hidden Single");
}

TEST_CASE("technique_by_name", "[techniques]") {
    SECTION("exact and case-insensitive") {
        BoxedTechnique technique = technique_by_name("X-Wing");
        REQUIRE(technique != nullptr);
        REQUIRE(technique->tier() == TechniqueTier::UpperIntermediate);

        technique = technique_by_name("naked pair");
        REQUIRE(technique != nullptr);
        REQUIRE(std::string(technique->name()) == "Naked Pair");
    }

    SECTION("unknown") {
        REQUIRE(technique_by_name("Swordfish") == nullptr);
        REQUIRE(technique_by_name("") == nullptr);
    }
}

TEST_CASE("Technique clone", "[techniques]") {
    for (const BoxedTechnique& technique : all_techniques()) {
        BoxedTechnique copy = technique->clone();
        REQUIRE(copy.get() != technique.get());
        REQUIRE(std::string(copy->name()) == technique->name());
        REQUIRE(copy->tier() == technique->tier());
    }
}

TEST_CASE("Tier names", "[techniques]") {
    REQUIRE(std::string(tier_name(TechniqueTier::Fundamental)) == "Fundamental");
    REQUIRE(std::string(tier_name(TechniqueTier::Basic)) == "Basic");
    REQUIRE(std::string(tier_name(TechniqueTier::Intermediate)) == "Intermediate");
    REQUIRE(std::string(tier_name(TechniqueTier::UpperIntermediate)) == "Upper Intermediate");
    REQUIRE(std::string(tier_name(TechniqueTier::Advanced)) == "Advanced");
    REQUIRE(std::string(tier_name(TechniqueTier::Expert)) == "Expert");
}
