//
// Fixtures.hpp
//

#ifndef CARDROLL_TEST_FIXTURES_HPP
#define CARDROLL_TEST_FIXTURES_HPP

#include <atomic>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../core/CardCatalog.hpp"
#include "../core/PityStore.hpp"
#include "../core/Random.hpp"
#include "../core/Types.hpp"

namespace cardroll::test
{
    using namespace cardroll::core;

    inline auto MakeCard(std::string id, Rarity r, CardType t = CardType::Creature,
                         std::vector<std::string> tags = {"meme"}) -> Card
    {
        Card c{};
        c.name = std::format("Card {}", id);
        c.id = std::move(id);
        c.rarity = r;
        c.type = t;
        c.cost = static_cast<std::uint32_t>(Index(r)) + 1;
        c.attack = static_cast<std::int32_t>(Index(r)) + 2;
        c.defense = 1;
        c.health = static_cast<std::int32_t>(Index(r)) + 3;
        c.tags = std::move(tags);
        return c;
    }

    // Two creatures and one spell per tier: "<tier>_1", "<tier>_2", "<tier>_spell".
    inline auto StandardCards() -> std::vector<Card>
    {
        std::vector<Card> cards;
        for (Rarity const r : AllRarities)
        {
            std::string const tier{ToString(r)};
            cards.push_back(MakeCard(tier + "_1", r));
            cards.push_back(MakeCard(tier + "_2", r));
            cards.push_back(MakeCard(tier + "_spell", r, CardType::Spell, {"meme", "spell"}));
        }
        return cards;
    }

    inline constexpr PerRarity<double> BasicWeights{0.65, 0.25, 0.07, 0.025, 0.004, 0.0009, 0.0001};

    inline auto MakePack(std::string name, PerRarity<double> weights = BasicWeights,
                         std::uint32_t threshold = 50, std::uint32_t max_batch = 10,
                         Rarity qualifying = Rarity::Epic) -> PackType
    {
        PackType p{};
        p.name = std::move(name);
        p.weights = weights;
        p.pity_threshold = threshold;
        p.max_batch = max_batch;
        p.qualifying_rarity = qualifying;
        return p;
    }

    inline auto StandardCatalog(std::uint32_t threshold = 50) -> CatalogSP
    {
        return CardCatalog::Build(StandardCards(), {MakePack("basic", BasicWeights, threshold)});
    }

    // Returns the same unit value forever; indexes always pick the first card.
    class FixedRandomSource final : public RandomSource
    {
    public:
        explicit FixedRandomSource(double unit) : unit_(unit) {}

        auto NextUnit() -> double override { return unit_; }
        auto NextIndex(std::size_t) -> std::size_t override { return 0; }

    private:
        double unit_;
    };

    // 0.0 always lands on the lowest reachable tier.
    inline auto FixedFactory(double unit = 0.0) -> RandomSourceFactory
    {
        return [unit](PlayerId const&, std::uint64_t) -> std::unique_ptr<RandomSource>
        {
            return std::make_unique<FixedRandomSource>(unit);
        };
    }

    // In-memory store whose next loads or saves can be made to fail.
    class FlakyPityStore final : public PityStore
    {
    public:
        auto Load(PlayerId const& player, Deadline deadline)
            -> std::expected<PlayerPityRecord, StoreFailure> override
        {
            ++loads_;
            if (fail_loads_.load() > 0)
            {
                --fail_loads_;
                return std::unexpected(StoreFailure{StoreFailureKind::Unavailable, "injected load failure"});
            }
            return inner_.Load(player, deadline);
        }

        auto Save(PlayerId const& player, PlayerPityRecord const& record, Deadline deadline)
            -> std::expected<void, StoreFailure> override
        {
            ++saves_;
            if (fail_saves_.load() > 0)
            {
                --fail_saves_;
                return std::unexpected(StoreFailure{StoreFailureKind::Unavailable, "injected save failure"});
            }
            auto saved = inner_.Save(player, record, deadline);
            std::function<void()> hook;
            {
                std::lock_guard<std::mutex> lock(hook_mtx_);
                hook = std::exchange(after_save_, {});
            }
            if (hook) hook();
            return saved;
        }

        auto FailNextLoads(int n) -> void { fail_loads_ = n; }
        auto FailNextSaves(int n) -> void { fail_saves_ = n; }

        // Runs once, on the thread of the next successful save, before it returns.
        auto AfterNextSave(std::function<void()> hook) -> void
        {
            std::lock_guard<std::mutex> lock(hook_mtx_);
            after_save_ = std::move(hook);
        }

        [[nodiscard]] auto Saves() const -> int { return saves_.load(); }
        [[nodiscard]] auto Loads() const -> int { return loads_.load(); }

        // What a fresh process would read back.
        auto Stored(PlayerId const& player) -> PlayerPityRecord
        {
            return inner_.Load(player, Clock::now() + std::chrono::seconds(1)).value();
        }

    private:
        InMemoryPityStore inner_;
        std::atomic<int> fail_loads_{0};
        std::atomic<int> fail_saves_{0};
        std::atomic<int> saves_{0};
        std::atomic<int> loads_{0};
        std::mutex hook_mtx_;
        std::function<void()> after_save_;
    };

    inline auto Soon() -> Deadline
    {
        return Clock::now() + std::chrono::seconds(5);
    }
}

#endif //CARDROLL_TEST_FIXTURES_HPP
