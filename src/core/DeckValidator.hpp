//
// DeckValidator.hpp
//

#ifndef CARDROLL_DECKVALIDATOR_HPP
#define CARDROLL_DECKVALIDATOR_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "CardCatalog.hpp"
#include "Exception.hpp"
#include "Types.hpp"

namespace cardroll::core
{
    struct DeckRules
    {
        std::size_t min_size{constants::DefaultMinDeckSize};
        std::size_t max_size{constants::DefaultMaxDeckSize};
        // rarer tiers allow fewer duplicates
        PerRarity<std::uint32_t> max_copies{3, 3, 2, 2, 1, 1, 1};
    };

    struct Deck
    {
        std::vector<std::string> card_ids;

        [[nodiscard]]
        auto Size() const noexcept -> std::size_t { return card_ids.size(); }
    };

    // card id -> copies the player owns
    using OwnedCollection = std::map<std::string, std::uint32_t, std::less<>>;

    struct DeckStats
    {
        std::size_t size{};
        std::uint64_t total_cost{};
        std::int64_t total_attack{};
        std::int64_t total_defense{};
        std::int64_t total_health{};
        double average_attack{};
        double average_health{};
        PerRarity<std::uint32_t> rarity_distribution{};
        std::map<CardType, std::uint32_t> type_distribution;
    };

    class DeckValidator
    {
    public:
        DeckValidator(CatalogSP catalog, DeckRules rules);

        // Size, then ownership, then per-rarity copy limits; stops at the first
        // violation. Pure: nothing is stored.
        [[nodiscard]]
        auto Validate(Deck const& deck, OwnedCollection const& owned) const -> error::ValidateResult;

        // Ids missing from the catalog are left out of the totals.
        [[nodiscard]]
        auto Stats(Deck const& deck) const -> DeckStats;

        [[nodiscard]]
        auto Rules() const noexcept -> DeckRules const& { return rules_; }

    private:
        CatalogSP catalog_;
        DeckRules rules_;
    };
}

#endif //CARDROLL_DECKVALIDATOR_HPP
