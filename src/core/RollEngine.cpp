//
// RollEngine.cpp
//
#include "RollEngine.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace cardroll::core
{
    auto RollResult::TotalValue() const -> std::uint64_t
    {
        std::uint64_t base{};
        for (RolledCard const& rc : cards)
        {
            base += RarityValue(rc.card->rarity);
        }
        return static_cast<std::uint64_t>(std::llround(static_cast<double>(base) * bonus_multiplier));
    }

    auto RollResult::RarityBreakdown() const -> std::map<Rarity, std::uint32_t>
    {
        std::map<Rarity, std::uint32_t> out;
        for (RolledCard const& rc : cards)
        {
            ++out[rc.card->rarity];
        }
        return out;
    }

    auto RollResult::Highlights() const -> std::vector<CCardSP>
    {
        std::vector<CCardSP> out;
        for (RolledCard const& rc : cards)
        {
            if (rc.card->rarity >= Rarity::Rare) out.push_back(rc.card);
        }
        std::ranges::stable_sort(out, std::ranges::greater{},
                                 [](CCardSP const& c) { return RarityValue(c->rarity); });
        if (out.size() > 5) out.resize(5);
        return out;
    }

    auto RollResult::AnyForced() const -> bool
    {
        return std::ranges::any_of(cards, &RolledCard::forced);
    }

    auto ForcedRarity(PackType const& pack) noexcept -> Rarity
    {
        return pack.qualifying_rarity;
    }

    auto PickCard(std::span<CCardSP const> const pool, RandomSource& rng, Rarity const r, std::string_view const pack)
        -> CCardSP
    {
        if (pool.empty())
            CRL_THROW(error::Code::Configuration,
                      std::format("No {} cards available to pack '{}'", ToString(r), pack));
        return pool[rng.NextIndex(pool.size())];
    }

    RollEngine::RollEngine(CatalogSP catalog,
                           std::shared_ptr<PityTracker> tracker,
                           RandomSourceFactory random_factory) :
        catalog_(std::move(catalog)),
        tracker_(std::move(tracker)),
        random_factory_(std::move(random_factory))
    {
        CRL_ASSERT(catalog_ != nullptr, "RollEngine requires a catalog");
        CRL_ASSERT(tracker_ != nullptr, "RollEngine requires a pity tracker");
        CRL_ASSERT(static_cast<bool>(random_factory_), "RollEngine requires a random source factory");
    }

    auto RollEngine::Catalog() const -> CatalogSP
    {
        std::lock_guard<std::mutex> lock(catalog_mtx_);
        return catalog_;
    }

    auto RollEngine::ReplaceCatalog(CatalogSP catalog) -> void
    {
        CRL_ASSERT(catalog != nullptr, "ReplaceCatalog with a null catalog");
        std::lock_guard<std::mutex> lock(catalog_mtx_);
        catalog_ = std::move(catalog);
    }

    auto RollEngine::Roll(PlayerId const& player, std::string_view const pack_name, std::int64_t const count,
                          Deadline const deadline) -> RollResult
    {
        CatalogSP const catalog = Catalog();

        PackType const* pack = catalog->FindPack(pack_name);
        if (!pack)
            CRL_THROW(error::Code::Validation, std::format("Unknown pack type '{}'", pack_name));

        if (count < 1 || count > static_cast<std::int64_t>(pack->max_batch))
            CRL_THROW(error::Code::Validation,
                      std::format("Count must be between 1 and {} for pack '{}', got {}",
                                  pack->max_batch, pack->name, count));

        RarityDistribution const* dist = catalog->DistributionFor(pack->name);
        CRL_ASSERT(dist != nullptr, "Pack without a distribution");

        // Everything below runs inside the player's exclusive section: a second
        // request for this player waits here until the batch is committed.
        PityTracker::Lease lease = tracker_->Acquire(player, deadline);
        lease.Checkpoint();

        RollResult result{};
        result.pack_type = pack->name;
        result.sequence = lease.Sequence();
        result.bonus_multiplier = pack->bonus_multiplier;
        result.cards.reserve(static_cast<std::size_t>(count));

        try
        {
            std::unique_ptr<RandomSource> rng = random_factory_(player, result.sequence);
            CRL_ASSERT(rng != nullptr, "Random source factory returned null");

            for (std::int64_t slot{}; slot < count; ++slot)
            {
                bool const forced = lease.ShouldForce(*pack);
                Rarity const rarity = forced ? ForcedRarity(*pack) : dist->Sample(*rng);

                CCardSP card = PickCard(catalog->ListByRarityAndPack(rarity, pack->name), *rng, rarity, pack->name);

                // recorded before the next slot looks at the counter
                result.pity = lease.RecordResult(*pack, card->rarity);
                result.cards.push_back(RolledCard{.card = std::move(card), .forced = forced});
            }
            lease.AdvanceSequence();
        }
        catch (...)
        {
            // nothing was handed out: leave no trace of the partial batch
            lease.Rollback();
            throw;
        }

        if (auto saved = lease.Commit(deadline); !saved.has_value())
        {
            result.persistence = PersistenceStatus::PendingReconciliation;
            result.persistence_failure = saved.error();
            std::print(stderr, "[RollEngine] roll for '{}' delivered but pity save failed ({}): {}\n",
                       player, to_string(saved.error().kind), saved.error().message);
        }
        return result;
    }
}
