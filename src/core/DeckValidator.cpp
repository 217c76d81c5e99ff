//
// DeckValidator.cpp
//
#include "DeckValidator.hpp"

#include <utility>

#include "Util.hpp"

namespace
{
    inline auto Viol(cardroll::core::error::DeckViolationCode code) -> cardroll::core::error::DeckViolation
    {
        return cardroll::core::error::DeckViolation{.code = code};
    }
}

namespace cardroll::core
{
    DeckValidator::DeckValidator(CatalogSP catalog, DeckRules rules) :
        catalog_(std::move(catalog)),
        rules_(std::move(rules))
    {
        CRL_ASSERT(catalog_ != nullptr, "DeckValidator requires a catalog");
        if (rules_.min_size < 1 || rules_.min_size > rules_.max_size)
            CRL_THROW(error::Code::Configuration, "Deck size bounds must satisfy 1 <= min <= max");
    }

    auto DeckValidator::Validate(Deck const& deck, OwnedCollection const& owned) const -> error::ValidateResult
    {
        using DVC = error::DeckViolationCode;

        std::size_t const n = deck.Size();
        if (n < rules_.min_size || n > rules_.max_size)
            return std::unexpected(Viol(DVC::DeckSizeError).with_size(n, rules_.min_size, rules_.max_size));

        util::CardCopyCounter const copies{deck.card_ids};
        auto const entries = copies.Entries();

        for (auto const& [id, used] : entries)
        {
            auto const it = owned.find(id);
            std::uint32_t const have = it != owned.end() ? it->second : 0u;
            if (have == 0 || !catalog_->GetById(id))
                return std::unexpected(Viol(DVC::UnownedCardError).with_card(id).with_owned(have));
            if (used > have)
                return std::unexpected(Viol(DVC::UnownedCardError).with_card(id).with_copies(used).with_owned(have));
        }

        for (auto const& [id, used] : entries)
        {
            CCardSP const card = catalog_->GetById(id);
            std::uint32_t const limit = rules_.max_copies[Index(card->rarity)];
            if (used > limit)
                return std::unexpected(Viol(DVC::DuplicateLimitError)
                                       .with_card(id)
                                       .with_copies(used)
                                       .with_limit(limit)
                                       .with_rarity(card->rarity));
        }

        return {};
    }

    auto DeckValidator::Stats(Deck const& deck) const -> DeckStats
    {
        DeckStats s{};
        for (std::string const& id : deck.card_ids)
        {
            CCardSP const card = catalog_->GetById(id);
            if (!card) continue;

            ++s.size;
            s.total_cost += card->cost;
            s.total_attack += card->attack;
            s.total_defense += card->defense;
            s.total_health += card->health;
            ++s.rarity_distribution[Index(card->rarity)];
            ++s.type_distribution[card->type];
        }
        if (s.size > 0)
        {
            s.average_attack = static_cast<double>(s.total_attack) / static_cast<double>(s.size);
            s.average_health = static_cast<double>(s.total_health) / static_cast<double>(s.size);
        }
        return s;
    }
}
