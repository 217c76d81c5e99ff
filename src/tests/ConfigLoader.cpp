#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <string>

#include "../config/ConfigLoader.hpp"
#include "../core/Exception.hpp"
#include "../debug/Invariants.hpp"

using namespace cardroll::core;

namespace
{
constexpr char const* Minimal = R"({
    "cards": [
        {"id": "doge", "rarity": "common", "type": "creature", "cost": 1, "attack": 1, "health": 2},
        {"id": "chad", "rarity": "epic", "type": "creature", "cost": 5, "attack": 6, "health": 6,
         "tags": ["meme", "gym"], "emoji": "X"}
    ],
    "packs": [
        {"name": "basic", "maxBatch": 5, "pityThreshold": 10,
         "weights": {"common": 0.9, "epic": 0.1}}
    ]
})";

// Swaps one fragment of the minimal config for another.
auto with(std::string const& from, std::string const& to) -> std::string
{
    std::string text{Minimal};
    std::size_t const at = text.find(from);
    EXPECT_NE(at, std::string::npos) << from;
    if (at != std::string::npos) text.replace(at, from.size(), to);
    return text;
}
} // anonymous namespace

TEST(ConfigLoader, Minimal_Config_Uses_Defaults)
{
    config::EngineConfig const cfg = config::ParseConfigText(Minimal);

    ASSERT_NE(cfg.catalog, nullptr);
    EXPECT_EQ(cfg.catalog->Size(), 2u);

    PackType const* basic = cfg.catalog->FindPack("basic");
    ASSERT_NE(basic, nullptr);
    EXPECT_EQ(basic->max_batch, 5u);
    EXPECT_EQ(basic->pity_threshold, 10u);
    EXPECT_EQ(basic->qualifying_rarity, Rarity::Epic);
    EXPECT_DOUBLE_EQ(basic->weights[Index(Rarity::Rare)], 0.0);

    CCardSP const chad = cfg.catalog->GetById("chad");
    ASSERT_NE(chad, nullptr);
    EXPECT_EQ(chad->name, "chad");
    EXPECT_EQ(chad->tags.size(), 2u);

    EXPECT_EQ(cfg.deck.min_size, 1u);
    EXPECT_EQ(cfg.deck.max_size, 30u);
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.persistence.directory, std::filesystem::path{"pity_data"});
    EXPECT_FALSE(cfg.seed.has_value());
}

TEST(ConfigLoader, Optional_Sections_Override_Defaults)
{
    std::string const text = with(R"("packs": [)", R"(
        "deck": {"minSize": 5, "maxSize": 20, "maxCopies": {"epic": 4}},
        "persistence": {"directory": "", "timeoutMs": 250, "retryAttempts": 2, "retryBackoffMs": 10},
        "server": {"port": 9000, "threads": 2, "requestTimeoutMs": 100, "audit": "audit.log"},
        "engine": {"seed": 42},
        "packs": [)");

    config::EngineConfig const cfg = config::ParseConfigText(text);
    EXPECT_EQ(cfg.deck.min_size, 5u);
    EXPECT_EQ(cfg.deck.max_size, 20u);
    EXPECT_EQ(cfg.deck.max_copies[Index(Rarity::Epic)], 4u);
    EXPECT_EQ(cfg.deck.max_copies[Index(Rarity::Common)], 3u);
    EXPECT_TRUE(cfg.persistence.directory.empty());
    EXPECT_EQ(cfg.persistence.timeout.count(), 250);
    EXPECT_EQ(cfg.persistence.reconciler.max_attempts, 2u);
    EXPECT_EQ(cfg.persistence.reconciler.backoff.count(), 10);
    EXPECT_EQ(cfg.persistence.reconciler.save_timeout.count(), 250);
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.threads, 2u);
    EXPECT_EQ(cfg.server.request_timeout.count(), 100);
    EXPECT_EQ(cfg.server.audit_path, "audit.log");
    EXPECT_EQ(cfg.seed.value(), 42u);
}

TEST(ConfigLoader, Shipped_Config_Is_Sound)
{
    std::filesystem::path const path = std::filesystem::path{CARDROLL_SOURCE_DIR} / "config" / "default_config.json";
    config::EngineConfig const cfg = config::LoadConfigFile(path);

    EXPECT_EQ(cfg.catalog->Packs().size(), 3u);
    EXPECT_GE(cfg.catalog->Size(), 19u);
    for (char const* name : {"basic", "premium", "legendary"})
    {
        EXPECT_NE(cfg.catalog->FindPack(name), nullptr) << name;
    }
    EXPECT_EQ(cfg.catalog->FindPack("legendary")->qualifying_rarity, Rarity::Legendary);
    // every tier is represented
    for (Rarity const r : AllRarities)
    {
        EXPECT_FALSE(cfg.catalog->ListByRarity(r).empty()) << ToString(r);
    }

    EXPECT_EQ(debug::CheckInvariants(*cfg.catalog), std::nullopt);
}

TEST(ConfigLoader, Rejects_Bad_Documents)
{
    EXPECT_THROW((void)config::ParseConfigText("{ not json"), error::ConfigurationError);
    EXPECT_THROW((void)config::ParseConfigText("[]"), error::ConfigurationError);
    EXPECT_THROW((void)config::ParseConfigText(R"({"cards": []})"), error::ConfigurationError);
    EXPECT_THROW((void)config::LoadConfigFile("/nonexistent/cardroll.json"), error::ConfigurationError);
}

TEST(ConfigLoader, Rejects_Bad_Cards_And_Packs)
{
    // unknown rarity
    EXPECT_THROW((void)config::ParseConfigText(with(R"("rarity": "common")", R"("rarity": "shiny")")),
                 error::ConfigurationError);
    // negative cost
    EXPECT_THROW((void)config::ParseConfigText(with(R"("cost": 1)", R"("cost": -1)")),
                 error::ConfigurationError);
    // unknown type
    EXPECT_THROW((void)config::ParseConfigText(with(R"("type": "creature")", R"("type": "trap")")),
                 error::ConfigurationError);
    // weights missing
    EXPECT_THROW((void)config::ParseConfigText(with(R"("weights")", R"("odds")")),
                 error::ConfigurationError);
    // threshold missing
    EXPECT_THROW((void)config::ParseConfigText(with(R"("pityThreshold": 10,)", "")),
                 error::ConfigurationError);
    // weights that do not sum to one
    EXPECT_THROW((void)config::ParseConfigText(with(R"("epic": 0.1)", R"("epic": 0.5)")),
                 error::ConfigurationError);
    // duplicate card id
    EXPECT_THROW((void)config::ParseConfigText(with(R"("id": "chad")", R"("id": "doge")")),
                 error::ConfigurationError);
}

TEST(ConfigLoader, Error_Names_The_Offending_Key)
{
    try
    {
        (void)config::ParseConfigText(with(R"("cost": 5)", R"("cost": "five")"));
        FAIL() << "expected ConfigurationError";
    }
    catch (error::ConfigurationError const& e)
    {
        std::string const what = e.what();
        EXPECT_NE(what.find("card 'chad'"), std::string::npos) << what;
        EXPECT_NE(what.find("cost"), std::string::npos) << what;
    }
}

TEST(ConfigLoader, Deck_Size_Bounds_Are_Checked_At_Load)
{
    auto deck = [](std::string const& section)
    {
        return with(R"("packs": [)", std::format(R"("deck": {}, "packs": [)", section));
    };

    EXPECT_NO_THROW((void)config::ParseConfigText(deck(R"({"minSize": 30, "maxSize": 30})")));
    EXPECT_THROW((void)config::ParseConfigText(deck(R"({"minSize": 0})")), error::ConfigurationError);
    EXPECT_THROW((void)config::ParseConfigText(deck(R"({"maxSize": 0})")), error::ConfigurationError);
    // minSize above the default maxSize of 30
    EXPECT_THROW((void)config::ParseConfigText(deck(R"({"minSize": 31})")), error::ConfigurationError);

    try
    {
        (void)config::ParseConfigText(deck(R"({"minSize": 20, "maxSize": 10})"));
        FAIL() << "inverted bounds accepted";
    }
    catch (error::ConfigurationError const& e)
    {
        EXPECT_NE(std::string{e.what()}.find("exceeds"), std::string::npos) << e.what();
    }
}

TEST(ConfigLoader, Pack_Bonus_Multiplier)
{
    config::EngineConfig const plain = config::ParseConfigText(Minimal);
    EXPECT_DOUBLE_EQ(plain.catalog->FindPack("basic")->bonus_multiplier, 1.0);

    config::EngineConfig const boosted =
        config::ParseConfigText(with(R"("maxBatch": 5,)", R"("maxBatch": 5, "bonusMultiplier": 2.5,)"));
    EXPECT_DOUBLE_EQ(boosted.catalog->FindPack("basic")->bonus_multiplier, 2.5);

    for (std::string const bad : {"0", "-1", "\"big\""})
    {
        EXPECT_THROW((void)config::ParseConfigText(
                         with(R"("maxBatch": 5,)", std::format(R"("maxBatch": 5, "bonusMultiplier": {},)", bad))),
                     error::ConfigurationError) << bad;
    }
}
