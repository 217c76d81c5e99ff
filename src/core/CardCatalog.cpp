//
// CardCatalog.cpp
//
#include "CardCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <tuple>
#include <format>
#include <ranges>
#include <utility>

#include "Exception.hpp"

namespace cardroll::core
{
    auto PoolFilter::Admits(Card const& c) const -> bool
    {
        if (!types.empty() && std::ranges::find(types, c.type) == types.end()) return false;
        if (tags.empty()) return true;
        return std::ranges::any_of(tags, [&c](std::string const& t) { return c.HasTag(t); });
    }

    static auto Lower(std::string_view const s) -> std::string
    {
        std::string out{s};
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // needle is already lowercase
    static auto ContainsFolded(std::string_view const hay, std::string_view const needle) -> bool
    {
        return Lower(hay).find(needle) != std::string::npos;
    }

    static auto MatchesText(Card const& c, std::string_view const needle) -> bool
    {
        if (ContainsFolded(c.name, needle) || ContainsFolded(c.flavor, needle)) return true;
        return std::ranges::any_of(c.effects, [needle](std::string const& e) { return ContainsFolded(e, needle); });
    }

    static auto CheckPack(PackType const& p) -> void
    {
        if (p.name.empty())
            CRL_THROW(error::Code::Configuration, "Pack type with empty name");
        if (p.max_batch == 0)
            CRL_THROW(error::Code::Configuration, std::format("Pack '{}' has max_batch 0", p.name));
        if (p.pity_threshold == 0)
            CRL_THROW(error::Code::Configuration, std::format("Pack '{}' has pity_threshold 0", p.name));
        if (!std::isfinite(p.bonus_multiplier) || p.bonus_multiplier <= 0.0)
            CRL_THROW(error::Code::Configuration,
                      std::format("Pack '{}' has bonus multiplier {}, expected > 0", p.name, p.bonus_multiplier));
    }

    auto CardCatalog::Build(std::vector<Card> cards, std::vector<PackType> packs)
        -> std::shared_ptr<CardCatalog const>
    {
        std::shared_ptr<CardCatalog> cat{new CardCatalog()};
        cat->cards_.reserve(cards.size());

        for (Card& c : cards)
        {
            if (c.id.empty())
                CRL_THROW(error::Code::Configuration, std::format("Card '{}' has an empty id", c.name));

            std::ranges::sort(c.tags);
            auto const dup = std::ranges::unique(c.tags);
            c.tags.erase(dup.begin(), dup.end());

            CCardSP sp = std::make_shared<Card const>(std::move(c));
            if (!cat->by_id_.emplace(sp->id, sp).second)
                CRL_THROW(error::Code::Configuration, std::format("Duplicate card id '{}'", sp->id));

            cat->by_rarity_[Index(sp->rarity)].push_back(sp);
            cat->cards_.push_back(std::move(sp));
        }

        for (PackType& p : packs)
        {
            CheckPack(p);
            if (cat->packs_.contains(p.name))
                CRL_THROW(error::Code::Configuration, std::format("Duplicate pack type '{}'", p.name));

            RarityDistribution dist{p.weights};
            PerRarity<std::vector<CCardSP>> pools{};
            for (CCardSP const& c : cat->cards_)
            {
                if (p.pool.Admits(*c)) pools[Index(c->rarity)].push_back(c);
            }

            for (Rarity const r : AllRarities)
            {
                bool const needed = dist.Reachable(r) || r == p.qualifying_rarity;
                if (needed && pools[Index(r)].empty())
                    CRL_THROW(error::Code::Configuration,
                              std::format("Pack '{}' references {} but its pool has no {} cards",
                                          p.name, ToString(r), ToString(r)));
            }

            std::string key = p.name;
            cat->packs_.emplace(std::move(key), PackEntry{std::move(p), dist, std::move(pools)});
        }

        return cat;
    }

    auto CardCatalog::GetById(std::string_view const id) const -> CCardSP
    {
        auto const it = by_id_.find(id);
        return it != by_id_.end() ? it->second : CCardSP{};
    }

    auto CardCatalog::ListByRarity(Rarity const r) const -> std::span<CCardSP const>
    {
        return by_rarity_[Index(r)];
    }

    auto CardCatalog::ListByRarityAndPack(Rarity const r, std::string_view const pack) const
        -> std::span<CCardSP const>
    {
        auto const it = packs_.find(pack);
        if (it == packs_.end())
            CRL_THROW(error::Code::Validation, std::format("Unknown pack type '{}'", pack));
        return it->second.pools[Index(r)];
    }

    auto CardCatalog::FindPack(std::string_view const name) const -> PackType const*
    {
        auto const it = packs_.find(name);
        return it != packs_.end() ? &it->second.pack : nullptr;
    }

    auto CardCatalog::DistributionFor(std::string_view const name) const -> RarityDistribution const*
    {
        auto const it = packs_.find(name);
        return it != packs_.end() ? &it->second.distribution : nullptr;
    }

    auto CardCatalog::Packs() const -> std::vector<PackType const*>
    {
        std::vector<PackType const*> out;
        out.reserve(packs_.size());
        for (auto const& entry : packs_ | std::views::values)
        {
            out.push_back(&entry.pack);
        }
        return out;
    }

    auto CardCatalog::Find(CardQuery const& q) const -> std::vector<CCardSP>
    {
        std::string const needle = Lower(q.text);
        std::vector<CCardSP> out;
        for (CCardSP const& c : cards_)
        {
            if (q.rarity && c->rarity != *q.rarity) continue;
            if (q.type && c->type != *q.type) continue;
            if (!needle.empty() && !MatchesText(*c, needle)) continue;
            if (!q.tags.empty() &&
                std::ranges::none_of(q.tags, [&c](std::string const& t) { return c->HasTag(t); }))
                continue;
            out.push_back(c);
        }
        std::ranges::sort(out, {}, [](CCardSP const& c) { return std::tie(c->rarity, c->cost, c->name); });
        return out;
    }

    auto CardCatalog::Search(std::string_view const text, std::size_t const limit) const -> std::vector<CCardSP>
    {
        std::string const needle = Lower(text);
        if (std::ranges::all_of(needle, [](unsigned char c) { return std::isspace(c) != 0; }))
            CRL_THROW(error::Code::Validation, "Search query cannot be empty");

        std::vector<CCardSP> out;
        for (CCardSP const& c : cards_)
        {
            if (MatchesText(*c, needle) || c->HasTag(needle)) out.push_back(c);
        }
        std::ranges::sort(out, [](CCardSP const& a, CCardSP const& b)
        {
            if (a->rarity != b->rarity) return a->rarity > b->rarity;
            return a->name < b->name;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    auto CardCatalog::CountByType() const -> std::map<CardType, std::size_t>
    {
        std::map<CardType, std::size_t> out;
        for (CCardSP const& c : cards_) ++out[c->type];
        return out;
    }

    auto CardCatalog::PopularTags(std::size_t const limit) const -> std::vector<TagCount>
    {
        std::map<std::string, std::size_t, std::less<>> counts;
        for (CCardSP const& c : cards_)
        {
            for (std::string const& t : c->tags) ++counts[t];
        }

        std::vector<TagCount> out;
        out.reserve(counts.size());
        for (auto const& [tag, n] : counts) out.push_back(TagCount{.tag = tag, .count = n});
        // map order already sorts ties by name
        std::ranges::stable_sort(out, std::ranges::greater{}, &TagCount::count);
        if (out.size() > limit) out.resize(limit);
        return out;
    }
}
