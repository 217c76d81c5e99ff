#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../core/DeckValidator.hpp"
#include "../core/Exception.hpp"
#include "Fixtures.hpp"

using namespace cardroll::core;
using namespace cardroll::test;

namespace
{
using DVC = error::DeckViolationCode;

// Every standard card owned three times.
auto own_everything() -> OwnedCollection
{
    OwnedCollection owned;
    for (Card const& c : StandardCards()) owned[c.id] = 3;
    return owned;
}

auto deck_of_commons(std::size_t n) -> Deck
{
    static std::vector<std::string> const ids{"common_1", "common_2", "common_spell",
                                              "uncommon_1", "uncommon_2", "uncommon_spell"};
    Deck d{};
    for (std::size_t i = 0; i < n; ++i) d.card_ids.push_back(ids[i % ids.size()]);
    return d;
}
} // anonymous namespace

TEST(DeckValidator, Size_Boundaries)
{
    DeckValidator const v{StandardCatalog(), DeckRules{}};
    OwnedCollection owned = own_everything();
    // room for 31 copies of the common/uncommon pool
    for (auto& [id, n] : owned) n = 6;

    auto const empty = v.Validate(Deck{}, owned);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, DVC::DeckSizeError);
    EXPECT_EQ(empty.error().deck_size.value(), 0u);

    DeckRules relaxed{};
    relaxed.max_copies.fill(10);
    DeckValidator const loose{StandardCatalog(), relaxed};

    EXPECT_TRUE(loose.Validate(deck_of_commons(30), owned).has_value());

    auto const big = loose.Validate(deck_of_commons(31), owned);
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().code, DVC::DeckSizeError);
    EXPECT_EQ(big.error().deck_size.value(), 31u);
    EXPECT_EQ(big.error().max_size.value(), 30u);

    EXPECT_TRUE(v.Validate(deck_of_commons(1), owned).has_value());
}

TEST(DeckValidator, Unowned_And_Unknown_Cards)
{
    DeckValidator const v{StandardCatalog(), DeckRules{}};
    OwnedCollection owned{{"common_1", 1}, {"rare_1", 1}};

    auto const missing = v.Validate(Deck{{"common_1", "epic_1"}}, owned);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, DVC::UnownedCardError);
    EXPECT_EQ(missing.error().card_id.value(), "epic_1");

    // owned once, used twice
    auto const over = v.Validate(Deck{{"common_1", "common_1"}}, owned);
    ASSERT_FALSE(over.has_value());
    EXPECT_EQ(over.error().code, DVC::UnownedCardError);
    EXPECT_EQ(over.error().copies.value(), 2u);
    EXPECT_EQ(over.error().owned.value(), 1u);

    // owned on paper but no longer in the catalog
    owned["retired"] = 4;
    auto const gone = v.Validate(Deck{{"retired"}}, owned);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, DVC::UnownedCardError);
}

TEST(DeckValidator, Copy_Limits_Depend_On_Rarity)
{
    DeckValidator const v{StandardCatalog(), DeckRules{}};
    OwnedCollection const owned = own_everything();

    EXPECT_TRUE(v.Validate(Deck{{"common_1", "common_1", "common_1"}}, owned).has_value());
    EXPECT_TRUE(v.Validate(Deck{{"rare_1", "rare_1"}}, owned).has_value());

    auto const rare = v.Validate(Deck{{"rare_1", "rare_1", "rare_1"}}, owned);
    ASSERT_FALSE(rare.has_value());
    EXPECT_EQ(rare.error().code, DVC::DuplicateLimitError);
    EXPECT_EQ(rare.error().limit.value(), 2u);
    EXPECT_EQ(rare.error().rarity.value(), Rarity::Rare);

    auto const legend = v.Validate(Deck{{"common_1", "legendary_1", "legendary_1"}}, owned);
    ASSERT_FALSE(legend.has_value());
    EXPECT_EQ(legend.error().code, DVC::DuplicateLimitError);
    EXPECT_EQ(legend.error().card_id.value(), "legendary_1");
    EXPECT_NE(error::describe(legend.error()).find("DuplicateLimitError"), std::string::npos);
}

TEST(DeckValidator, Checks_Run_In_Order)
{
    DeckValidator const v{StandardCatalog(), DeckRules{.min_size = 2, .max_size = 3}};

    // too small and unowned: size wins
    auto const first = v.Validate(Deck{{"mythic_1"}}, OwnedCollection{});
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, DVC::DeckSizeError);

    // unowned and over the limit: ownership wins
    auto const second = v.Validate(Deck{{"mythic_1", "mythic_1"}}, OwnedCollection{{"mythic_1", 1}});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, DVC::UnownedCardError);
}

TEST(DeckValidator, Stats_Summarize_The_Deck)
{
    DeckValidator const v{StandardCatalog(), DeckRules{}};
    Deck const d{{"common_1", "common_spell", "epic_1", "retired"}};

    DeckStats const s = v.Stats(d);
    EXPECT_EQ(s.size, 3u);
    // cost = tier index + 1, attack = tier index + 2, health = tier index + 3
    EXPECT_EQ(s.total_cost, 1u + 1u + 4u);
    EXPECT_EQ(s.total_attack, 2 + 2 + 5);
    EXPECT_EQ(s.total_health, 3 + 3 + 6);
    EXPECT_DOUBLE_EQ(s.average_attack, 3.0);
    EXPECT_EQ(s.rarity_distribution[Index(Rarity::Common)], 2u);
    EXPECT_EQ(s.rarity_distribution[Index(Rarity::Epic)], 1u);
    EXPECT_EQ(s.type_distribution.at(CardType::Spell), 1u);
    EXPECT_EQ(s.type_distribution.at(CardType::Creature), 2u);
}

TEST(DeckValidator, Rejects_Bad_Bounds)
{
    EXPECT_THROW((DeckValidator{StandardCatalog(), DeckRules{.min_size = 0, .max_size = 30}}),
                 error::ConfigurationError);
    EXPECT_THROW((DeckValidator{StandardCatalog(), DeckRules{.min_size = 10, .max_size = 5}}),
                 error::ConfigurationError);
}
