//
// CardCatalog.hpp
//

#ifndef CARDROLL_CARDCATALOG_HPP
#define CARDROLL_CARDCATALOG_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "PackType.hpp"
#include "RarityDistribution.hpp"
#include "Types.hpp"

namespace cardroll::core::debug { struct Inspector; }

namespace cardroll::core
{
    // Catalog browsing filter. Unset fields do not restrict.
    struct CardQuery
    {
        std::optional<Rarity> rarity;
        std::optional<CardType> type;
        std::string text;              // case-insensitive, in name, flavor or effects
        std::vector<std::string> tags; // card needs at least one of these
    };

    struct TagCount
    {
        std::string tag;
        std::size_t count{};
    };

    // Read-only index over every card definition and pack type. Built once;
    // a balance patch builds a new catalog instead of touching this one.
    class CardCatalog
    {
    public:
        // Validates and indexes the input. Throws ConfigurationError on duplicate
        // card ids or pack names, an invalid weight table, a zero batch size or
        // pity threshold, or a pack whose reachable or qualifying tier has no
        // cards in its pool.
        static auto Build(std::vector<Card> cards, std::vector<PackType> packs)
            -> std::shared_ptr<CardCatalog const>;

        // nullptr when absent
        [[nodiscard]]
        auto GetById(std::string_view id) const -> CCardSP;

        [[nodiscard]]
        auto ListByRarity(Rarity r) const -> std::span<CCardSP const>;

        // Throws ValidationError for an unknown pack name.
        [[nodiscard]]
        auto ListByRarityAndPack(Rarity r, std::string_view pack) const -> std::span<CCardSP const>;

        [[nodiscard]]
        auto FindPack(std::string_view name) const -> PackType const*;

        [[nodiscard]]
        auto DistributionFor(std::string_view name) const -> RarityDistribution const*;

        [[nodiscard]]
        auto Packs() const -> std::vector<PackType const*>;

        [[nodiscard]]
        auto Size() const noexcept -> std::size_t { return cards_.size(); }

        // Matches ordered by rarity, then cost, then name.
        [[nodiscard]]
        auto Find(CardQuery const& q) const -> std::vector<CCardSP>;

        // Free-text lookup: name, flavor or effect text contains the query, or a
        // tag equals it (lowercased). Rarest first, then by name. Throws
        // ValidationError for a blank query.
        [[nodiscard]]
        auto Search(std::string_view text, std::size_t limit) const -> std::vector<CCardSP>;

        [[nodiscard]]
        auto CountByType() const -> std::map<CardType, std::size_t>;

        // Most used tags first, ties by name.
        [[nodiscard]]
        auto PopularTags(std::size_t limit) const -> std::vector<TagCount>;

        friend struct debug::Inspector;

    private:
        struct PackEntry
        {
            PackType pack;
            RarityDistribution distribution;
            PerRarity<std::vector<CCardSP>> pools;
        };

        CardCatalog() = default;

        std::vector<CCardSP> cards_;
        std::map<std::string, CCardSP, std::less<>> by_id_;
        PerRarity<std::vector<CCardSP>> by_rarity_{};
        std::map<std::string, PackEntry, std::less<>> packs_;
    };

    using CatalogSP = std::shared_ptr<CardCatalog const>;
}

#endif //CARDROLL_CARDCATALOG_HPP
