#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string>

#include "../core/PityTracker.hpp"
#include "../core/RollEngine.hpp"
#include "../store/FilePityStore.hpp"
#include "Fixtures.hpp"

using namespace cardroll::core;
using namespace cardroll::test;

namespace
{
// Fresh directory per test, removed afterwards.
class FilePityStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / std::format("cardroll_{}", info->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

auto sample_record() -> PlayerPityRecord
{
    PlayerPityRecord r{};
    r.roll_sequence = 7;
    r.packs["basic"] = PityState{.counter = 12, .threshold = 50, .total_rolls = 40};
    r.packs["premium"] = PityState{.counter = 0, .threshold = 20, .total_rolls = 3};
    return r;
}
} // anonymous namespace

TEST_F(FilePityStoreTest, Saves_And_Loads_A_Record)
{
    store::FilePityStore fs{dir_};
    ASSERT_TRUE(fs.Save("alice", sample_record(), Soon()).has_value());

    EXPECT_TRUE(std::filesystem::exists(fs.PathFor("alice")));
    auto const loaded = fs.Load("alice", Soon());
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, sample_record());

    // overwrite keeps only the latest
    PlayerPityRecord next = sample_record();
    next.roll_sequence = 8;
    next.packs["basic"].counter = 13;
    ASSERT_TRUE(fs.Save("alice", next, Soon()).has_value());
    EXPECT_EQ(fs.Load("alice", Soon()).value(), next);
}

TEST_F(FilePityStoreTest, Unknown_Player_Starts_Empty)
{
    store::FilePityStore fs{dir_};
    auto const loaded = fs.Load("nobody", Soon());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, PlayerPityRecord{});
}

TEST_F(FilePityStoreTest, Player_Ids_Are_Hex_Encoded)
{
    store::FilePityStore fs{dir_};
    EXPECT_EQ(fs.PathFor("ab/").filename().string(), "61622f.pity");
    EXPECT_EQ(fs.PathFor("../x").parent_path(), dir_);
}

TEST_F(FilePityStoreTest, Corrupt_Files_Are_Reported)
{
    store::FilePityStore fs{dir_};
    {
        std::ofstream out(fs.PathFor("mallory"), std::ios::binary);
        out << "definitely not a flatbuffer";
    }
    auto const garbage = fs.Load("mallory", Soon());
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().kind, StoreFailureKind::Corrupt);

    // a valid record filed under the wrong name
    ASSERT_TRUE(fs.Save("alice", sample_record(), Soon()).has_value());
    std::filesystem::copy_file(fs.PathFor("alice"), fs.PathFor("bob"));
    auto const swapped = fs.Load("bob", Soon());
    ASSERT_FALSE(swapped.has_value());
    EXPECT_EQ(swapped.error().kind, StoreFailureKind::Corrupt);
}

TEST_F(FilePityStoreTest, Expired_Deadline_Times_Out)
{
    store::FilePityStore fs{dir_};
    Deadline const past = Clock::now() - std::chrono::milliseconds(1);

    auto const save = fs.Save("alice", sample_record(), past);
    ASSERT_FALSE(save.has_value());
    EXPECT_EQ(save.error().kind, StoreFailureKind::Timeout);
    EXPECT_FALSE(std::filesystem::exists(fs.PathFor("alice")));

    auto const load = fs.Load("alice", past);
    ASSERT_FALSE(load.has_value());
    EXPECT_EQ(load.error().kind, StoreFailureKind::Timeout);
}

TEST_F(FilePityStoreTest, Pity_Survives_A_Restart)
{
    CatalogSP const cat = StandardCatalog(10);
    {
        auto tracker = std::make_shared<PityTracker>(std::make_shared<store::FilePityStore>(dir_));
        RollEngine engine(cat, tracker, FixedFactory(0.0));
        RollResult const r = engine.Roll("alice", "basic", 7, Soon());
        ASSERT_EQ(r.persistence, PersistenceStatus::Committed);
        EXPECT_EQ(r.pity.counter, 7u);
    }

    // new process, same directory
    auto tracker = std::make_shared<PityTracker>(std::make_shared<store::FilePityStore>(dir_));
    RollEngine engine(cat, tracker, FixedFactory(0.0));
    RollResult const r = engine.Roll("alice", "basic", 3, Soon());

    // slots 8, 9, 10: the tenth is forced
    ASSERT_EQ(r.cards.size(), 3u);
    EXPECT_FALSE(r.cards[1].forced);
    EXPECT_TRUE(r.cards[2].forced);
    EXPECT_EQ(r.cards[2].card->rarity, Rarity::Epic);
    EXPECT_EQ(r.pity.counter, 0u);
    EXPECT_EQ(r.sequence, 1u);
}

TEST_F(FilePityStoreTest, Long_Player_Ids_Get_Bounded_File_Names)
{
    store::FilePityStore fs{dir_};
    std::string const a = std::string(250, 'a') + "-first";
    std::string const b = std::string(250, 'a') + "-second";

    std::string const name = fs.PathFor(a).filename().string();
    EXPECT_LT(name.size(), 255u);
    // 'a' is 0x61
    EXPECT_TRUE(name.starts_with("6161"));
    EXPECT_NE(fs.PathFor(a), fs.PathFor(b));

    ASSERT_TRUE(fs.Save(a, sample_record(), Soon()).has_value());
    EXPECT_TRUE(std::filesystem::exists(fs.PathFor(a)));
    auto const loaded = fs.Load(a, Soon());
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, sample_record());

    auto const other = fs.Load(b, Soon());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(*other, PlayerPityRecord{});

    // ids that fit keep the plain hex name
    std::string const exact(store::FilePityStore::HexPrefixBytes, 'z');
    EXPECT_EQ(fs.PathFor(exact).filename().string().size(), 2 * store::FilePityStore::HexPrefixBytes + 5);
}
