#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <vector>

#include "../core/CardCatalog.hpp"
#include "../core/Exception.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "Fixtures.hpp"

using namespace cardroll::core;
using namespace cardroll::test;

TEST(CardCatalog, Indexes_By_Id_Rarity_And_Pack)
{
    PackType spells = MakePack("spells", PerRarity<double>{0.5, 0.5, 0, 0, 0, 0, 0});
    spells.pool.types = {CardType::Spell};
    spells.qualifying_rarity = Rarity::Uncommon;

    CatalogSP const cat = CardCatalog::Build(StandardCards(), {MakePack("basic"), spells});

    EXPECT_EQ(cat->Size(), 21u);
    ASSERT_NE(cat->GetById("epic_1"), nullptr);
    EXPECT_EQ(cat->GetById("epic_1")->rarity, Rarity::Epic);
    EXPECT_EQ(cat->GetById("nope"), nullptr);

    EXPECT_EQ(cat->ListByRarity(Rarity::Mythic).size(), 3u);
    EXPECT_EQ(cat->ListByRarityAndPack(Rarity::Common, "basic").size(), 3u);

    auto const pool = cat->ListByRarityAndPack(Rarity::Common, "spells");
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0]->id, "common_spell");

    EXPECT_THROW((void)cat->ListByRarityAndPack(Rarity::Common, "mystery"), error::ValidationError);
    EXPECT_EQ(cat->FindPack("mystery"), nullptr);
    ASSERT_NE(cat->DistributionFor("spells"), nullptr);
    EXPECT_FALSE(cat->DistributionFor("spells")->Reachable(Rarity::Rare));
    EXPECT_EQ(cat->Packs().size(), 2u);

    EXPECT_EQ(cardroll::core::debug::CheckInvariants(*cat), std::nullopt);
}

TEST(CardCatalog, Tags_Are_Deduplicated_And_Filter_Pools)
{
    std::vector<Card> cards = StandardCards();
    cards.push_back(MakeCard("doge", Rarity::Common, CardType::Creature, {"dog", "meme", "dog", "classic"}));

    PackType dogs = MakePack("dogs", PerRarity<double>{1.0, 0, 0, 0, 0, 0, 0});
    dogs.pool.tags = {"dog"};
    dogs.qualifying_rarity = Rarity::Common;

    CatalogSP const cat = CardCatalog::Build(std::move(cards), {dogs});

    CCardSP const doge = cat->GetById("doge");
    ASSERT_NE(doge, nullptr);
    EXPECT_EQ(doge->tags, (std::vector<std::string>{"classic", "dog", "meme"}));
    EXPECT_TRUE(doge->HasTag("dog"));
    EXPECT_FALSE(doge->HasTag("cat"));

    auto const pool = cat->ListByRarityAndPack(Rarity::Common, "dogs");
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0]->id, "doge");

    auto const view = cardroll::core::debug::Inspector::Gather(*cat);
    ASSERT_EQ(view.packs.size(), 1u);
    EXPECT_EQ(view.packs[0].pool_sizes[Index(Rarity::Common)], 1u);
    EXPECT_EQ(view.packs[0].pool_sizes[Index(Rarity::Epic)], 0u);
}

TEST(CardCatalog, Build_Rejects_Inconsistent_Data)
{
    {
        std::vector<Card> cards = StandardCards();
        cards.push_back(MakeCard("rare_1", Rarity::Common));
        EXPECT_THROW((void)CardCatalog::Build(cards, {MakePack("basic")}), error::ConfigurationError);
    }
    {
        EXPECT_THROW((void)CardCatalog::Build(StandardCards(), {MakePack("basic"), MakePack("basic")}),
                     error::ConfigurationError);
    }
    {
        EXPECT_THROW((void)CardCatalog::Build(StandardCards(),
                                              {MakePack("bad", PerRarity<double>{0.5, 0.6, 0, 0, 0, 0, 0})}),
                     error::ConfigurationError);
    }
    {
        EXPECT_THROW((void)CardCatalog::Build(StandardCards(), {MakePack("zero", BasicWeights, 0)}),
                     error::ConfigurationError);
        EXPECT_THROW((void)CardCatalog::Build(StandardCards(), {MakePack("zero", BasicWeights, 50, 0)}),
                     error::ConfigurationError);
    }
    {
        // reachable cosmic tier with no cosmic cards
        std::vector<Card> cards = StandardCards();
        std::erase_if(cards, [](Card const& c) { return c.rarity == Rarity::Cosmic; });
        EXPECT_THROW((void)CardCatalog::Build(cards, {MakePack("basic")}), error::ConfigurationError);
    }
    {
        // qualifying tier unreachable by weight but still needs cards for forced slots
        std::vector<Card> cards = StandardCards();
        std::erase_if(cards, [](Card const& c) { return c.rarity == Rarity::Legendary; });
        PackType p = MakePack("cheap", PerRarity<double>{1.0, 0, 0, 0, 0, 0, 0});
        p.qualifying_rarity = Rarity::Legendary;
        EXPECT_THROW((void)CardCatalog::Build(cards, {p}), error::ConfigurationError);
    }
    {
        Card blank = MakeCard("", Rarity::Common);
        EXPECT_THROW((void)CardCatalog::Build({blank}, {}), error::ConfigurationError);
    }
}

TEST(CardCatalog, Find_Filters_And_Orders)
{
    std::vector<Card> cards = StandardCards();
    Card dog = MakeCard("good_boy", Rarity::Rare, CardType::Artifact, {"dog"});
    dog.flavor = "Much wow, very Loyal";
    dog.effects = {"Fetch: draw a card"};
    cards.push_back(dog);
    auto const cat = CardCatalog::Build(cards, {MakePack("basic")});

    std::vector<CCardSP> const all = cat->Find(CardQuery{});
    ASSERT_EQ(all.size(), cat->Size());
    EXPECT_TRUE(std::ranges::is_sorted(all, {}, [](CCardSP const& c) { return c->rarity; }));
    EXPECT_EQ(all.front()->id, "common_1");

    std::vector<CCardSP> const rare_creatures = cat->Find(CardQuery{.rarity = Rarity::Rare, .type = CardType::Creature});
    ASSERT_EQ(rare_creatures.size(), 2u);
    EXPECT_EQ(rare_creatures[0]->id, "rare_1");

    // flavor and effect text are searched, case folded
    ASSERT_EQ(cat->Find(CardQuery{.text = "loyal"}).size(), 1u);
    ASSERT_EQ(cat->Find(CardQuery{.text = "FETCH"}).size(), 1u);

    // any one of the tags is enough
    EXPECT_EQ(cat->Find(CardQuery{.tags = {"dog", "spell"}}).size(), 8u);
    EXPECT_TRUE(cat->Find(CardQuery{.rarity = Rarity::Common, .tags = {"dog"}}).empty());
}

TEST(CardCatalog, Search_Ranks_Rarest_First)
{
    auto const cat = StandardCatalog();

    std::vector<CCardSP> const spells = cat->Search("Spell", 100);
    ASSERT_EQ(spells.size(), 7u);
    EXPECT_EQ(spells.front()->id, "cosmic_spell");
    EXPECT_EQ(spells.back()->id, "common_spell");

    std::vector<CCardSP> const capped = cat->Search("card", 4);
    ASSERT_EQ(capped.size(), 4u);
    EXPECT_EQ(capped[0]->rarity, Rarity::Cosmic);
    EXPECT_EQ(capped[3]->rarity, Rarity::Mythic);

    // exact tag match
    EXPECT_EQ(cat->Search("meme", 100).size(), cat->Size());
    EXPECT_TRUE(cat->Search("nothing like this", 10).empty());

    EXPECT_THROW((void)cat->Search("", 10), error::ValidationError);
    EXPECT_THROW((void)cat->Search("  \t", 10), error::ValidationError);
}

TEST(CardCatalog, Counts_Types_And_Tags)
{
    std::vector<Card> cards = StandardCards();
    cards.push_back(MakeCard("relic", Rarity::Common, CardType::Artifact, {"alpha", "zeta"}));
    auto const cat = CardCatalog::Build(cards, {MakePack("basic")});

    std::map<CardType, std::size_t> const types = cat->CountByType();
    EXPECT_EQ(types.at(CardType::Creature), 14u);
    EXPECT_EQ(types.at(CardType::Spell), 7u);
    EXPECT_EQ(types.at(CardType::Artifact), 1u);

    std::vector<TagCount> const tags = cat->PopularTags(10);
    ASSERT_EQ(tags.size(), 4u);
    EXPECT_EQ(tags[0].tag, "meme");
    EXPECT_EQ(tags[0].count, 21u);
    EXPECT_EQ(tags[1].tag, "spell");
    // ties keep name order
    EXPECT_EQ(tags[2].tag, "alpha");
    EXPECT_EQ(tags[3].tag, "zeta");
    EXPECT_EQ(cat->PopularTags(1).size(), 1u);
}

TEST(CardCatalog, Rejects_Bad_Bonus_Multiplier)
{
    for (double const bad : {0.0, -2.0, std::numeric_limits<double>::infinity(), std::nan("")})
    {
        PackType p = MakePack("basic");
        p.bonus_multiplier = bad;
        EXPECT_THROW((void)CardCatalog::Build(StandardCards(), {p}), error::ConfigurationError) << bad;
    }
    PackType ok = MakePack("basic");
    ok.bonus_multiplier = 3.0;
    EXPECT_DOUBLE_EQ(CardCatalog::Build(StandardCards(), {ok})->FindPack("basic")->bonus_multiplier, 3.0);
}
