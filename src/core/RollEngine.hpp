//
// RollEngine.hpp
//

#ifndef CARDROLL_ROLLENGINE_HPP
#define CARDROLL_ROLLENGINE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "CardCatalog.hpp"
#include "PityStore.hpp"
#include "PityTracker.hpp"
#include "Random.hpp"
#include "Types.hpp"

namespace cardroll::core
{
    struct RolledCard
    {
        CCardSP card;
        bool forced{false}; // rarity set by the pity guarantee, not sampled
    };

    enum class PersistenceStatus : std::uint8_t
    {
        Committed,
        PendingReconciliation
    };

    struct RollResult
    {
        std::string pack_type;
        std::vector<RolledCard> cards;
        PityState pity{};            // state after the last slot
        std::uint64_t sequence{};    // request number the random source was seeded with
        double bonus_multiplier{1.0};
        PersistenceStatus persistence{PersistenceStatus::Committed};
        std::optional<StoreFailure> persistence_failure{};

        // Sum of the cards' rarity values times the pack's bonus, rounded.
        [[nodiscard]]
        auto TotalValue() const -> std::uint64_t;

        [[nodiscard]]
        auto RarityBreakdown() const -> std::map<Rarity, std::uint32_t>;

        // Up to five rare-or-better cards, most valuable first.
        [[nodiscard]]
        auto Highlights() const -> std::vector<CCardSP>;

        [[nodiscard]]
        auto AnyForced() const -> bool;
    };

    // Forced slots take the pack's qualifying tier.
    [[nodiscard]]
    auto ForcedRarity(PackType const& pack) noexcept -> Rarity;

    // Uniform pick from a pool. Throws ConfigurationError on an empty pool.
    [[nodiscard]]
    auto PickCard(std::span<CCardSP const> pool, RandomSource& rng, Rarity r, std::string_view pack) -> CCardSP;

    class RollEngine
    {
    public:
        RollEngine(CatalogSP catalog,
                   std::shared_ptr<PityTracker> tracker,
                   RandomSourceFactory random_factory);

        // Throws ValidationError for an unknown pack or a count outside
        // [1, max_batch], TransientError when the player's pity state cannot be
        // read before the deadline, ConfigurationError on a catalog/pack mismatch.
        // A failed save after the batch is reported through the result, never thrown.
        auto Roll(PlayerId const& player, std::string_view pack_name, std::int64_t count, Deadline deadline)
            -> RollResult;

        // Wholesale swap; rolls already running keep the catalog they started with.
        auto ReplaceCatalog(CatalogSP catalog) -> void;

        [[nodiscard]]
        auto Catalog() const -> CatalogSP;

        [[nodiscard]]
        auto Tracker() const noexcept -> std::shared_ptr<PityTracker> const& { return tracker_; }

    private:
        mutable std::mutex catalog_mtx_;
        CatalogSP catalog_;
        std::shared_ptr<PityTracker> tracker_;
        RandomSourceFactory random_factory_;
    };
}

#endif //CARDROLL_ROLLENGINE_HPP
