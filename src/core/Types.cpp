//
// Types.cpp
//
#include "Types.hpp"

#include <algorithm>
#include <cctype>

namespace cardroll::core
{
    static auto Lower(std::string_view s) -> std::string
    {
        std::string out(s);
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    auto Card::HasTag(std::string_view tag) const -> bool
    {
        return std::ranges::binary_search(tags, tag, std::less<>{});
    }

    auto ToString(Rarity r) noexcept -> std::string_view
    {
        switch (r)
        {
        case Rarity::Common: return "common";
        case Rarity::Uncommon: return "uncommon";
        case Rarity::Rare: return "rare";
        case Rarity::Epic: return "epic";
        case Rarity::Legendary: return "legendary";
        case Rarity::Mythic: return "mythic";
        case Rarity::Cosmic: return "cosmic";
        }
        return "unknown";
    }

    auto ToString(CardType t) noexcept -> std::string_view
    {
        switch (t)
        {
        case CardType::Creature: return "creature";
        case CardType::Spell: return "spell";
        case CardType::Artifact: return "artifact";
        }
        return "unknown";
    }

    auto ParseRarity(std::string_view s) -> std::optional<Rarity>
    {
        std::string const key = Lower(s);
        for (Rarity const r : AllRarities)
        {
            if (ToString(r) == key) return r;
        }
        return std::nullopt;
    }

    auto ParseCardType(std::string_view s) -> std::optional<CardType>
    {
        std::string const key = Lower(s);
        for (CardType const t : {CardType::Creature, CardType::Spell, CardType::Artifact})
        {
            if (ToString(t) == key) return t;
        }
        return std::nullopt;
    }

    auto RarityValue(Rarity r) noexcept -> std::uint32_t
    {
        static constexpr PerRarity<std::uint32_t> values{10, 25, 50, 100, 250, 500, 1000};
        return values[Index(r)];
    }
}
