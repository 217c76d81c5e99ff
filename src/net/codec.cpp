//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <format>
#include <limits>

namespace cardroll::core::net
{
    using nlohmann::json;

    namespace
    {
        auto ParseObject(std::string_view body) -> std::expected<json, ParseError>
        {
            json j = json::parse(body, nullptr, false);
            if (j.is_discarded())
                return std::unexpected(ParseError{"body is not valid JSON"});
            if (!j.is_object())
                return std::unexpected(ParseError{"body must be a JSON object"});
            return j;
        }
    }

    auto PercentDecode(std::string_view const s) -> std::expected<std::string, ParseError>
    {
        auto hex = [](char const c) -> int
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '+')
            {
                out.push_back(' ');
            }
            else if (s[i] == '%')
            {
                if (i + 2 >= s.size())
                    return std::unexpected(ParseError{"truncated percent escape"});
                int const hi = hex(s[i + 1]);
                int const lo = hex(s[i + 2]);
                if (hi < 0 || lo < 0) return std::unexpected(ParseError{"invalid percent escape"});
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
            }
            else
            {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    auto ParseQuery(std::string_view query) -> std::expected<QueryParams, ParseError>
    {
        QueryParams out;
        while (!query.empty())
        {
            std::size_t const amp = query.find('&');
            std::string_view const pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (pair.empty()) continue;

            std::size_t const eq = pair.find('=');
            auto key = PercentDecode(pair.substr(0, eq));
            if (!key.has_value()) return std::unexpected(key.error());
            auto value = PercentDecode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
            if (!value.has_value()) return std::unexpected(value.error());
            out.insert_or_assign(std::move(*key), std::move(*value));
        }
        return out;
    }

    auto DecodeLimit(QueryParams const& params, std::uint32_t const fallback, std::uint32_t const max)
        -> std::expected<std::uint32_t, ParseError>
    {
        auto const it = params.find("limit");
        if (it == params.end()) return fallback;
        std::uint32_t v{};
        auto const [end, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), v);
        if (ec != std::errc{} || end != it->second.data() + it->second.size() || v == 0 || v > max)
            return std::unexpected(ParseError{std::format("'limit' must be an integer in [1, {}]", max)});
        return v;
    }

    auto DecodeCardListRequest(QueryParams const& params) -> std::expected<CardListRequest, ParseError>
    {
        CardListRequest req{};

        if (auto const it = params.find("rarity"); it != params.end() && !it->second.empty())
        {
            req.query.rarity = ParseRarity(it->second);
            if (!req.query.rarity) return std::unexpected(ParseError{std::format("unknown rarity '{}'", it->second)});
        }
        if (auto const it = params.find("type"); it != params.end() && !it->second.empty())
        {
            req.query.type = ParseCardType(it->second);
            if (!req.query.type) return std::unexpected(ParseError{std::format("unknown card type '{}'", it->second)});
        }
        if (auto const it = params.find("search"); it != params.end())
        {
            req.query.text = it->second;
        }
        if (auto const it = params.find("tags"); it != params.end())
        {
            std::string_view rest = it->second;
            while (!rest.empty())
            {
                std::size_t const comma = rest.find(',');
                std::string_view const tag = rest.substr(0, comma);
                if (!tag.empty()) req.query.tags.emplace_back(tag);
                rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
            }
        }
        if (auto const it = params.find("page"); it != params.end())
        {
            std::string const& v = it->second;
            auto const [end, ec] = std::from_chars(v.data(), v.data() + v.size(), req.page);
            if (ec != std::errc{} || end != v.data() + v.size() || req.page == 0)
                return std::unexpected(ParseError{"'page' must be a positive integer"});
        }

        auto limit = DecodeLimit(params, req.limit, MaxPageSize);
        if (!limit.has_value()) return std::unexpected(limit.error());
        req.limit = *limit;
        return req;
    }

    auto DecodeRollRequest(std::string_view const body) -> std::expected<RollRequest, ParseError>
    {
        RollRequest req{};
        if (body.empty()) return req;

        auto parsed = ParseObject(body);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        json const& j = *parsed;

        if (auto const it = j.find("packType"); it != j.end() && !it->is_null())
        {
            if (!it->is_string()) return std::unexpected(ParseError{"'packType' must be a string"});
            req.pack_type = it->get<std::string>();
        }

        if (auto const it = j.find("count"); it != j.end() && !it->is_null())
        {
            if (it->is_number_unsigned())
            {
                std::uint64_t const v = it->get<std::uint64_t>();
                if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    return std::unexpected(ParseError{"'count' is out of range"});
                req.count = static_cast<std::int64_t>(v);
            }
            else if (it->is_number_integer())
            {
                req.count = it->get<std::int64_t>();
            }
            else
            {
                return std::unexpected(ParseError{"'count' must be an integer"});
            }
        }
        return req;
    }

    auto DecodeDeckRequest(std::string_view const body) -> std::expected<DeckRequest, ParseError>
    {
        auto parsed = ParseObject(body);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        json const& j = *parsed;

        DeckRequest req{};
        if (auto const it = j.find("cards"); it != j.end())
        {
            if (!it->is_array()) return std::unexpected(ParseError{"'cards' must be an array of card ids"});
            std::vector<std::string> ids;
            ids.reserve(it->size());
            for (json const& e : *it)
            {
                if (!e.is_string()) return std::unexpected(ParseError{"'cards' must be an array of card ids"});
                ids.push_back(e.get<std::string>());
            }
            req.cards = std::move(ids);
        }

        if (auto const it = j.find("deckId"); it != j.end())
        {
            if (!it->is_string()) return std::unexpected(ParseError{"'deckId' must be a string"});
            req.deck_id = it->get<std::string>();
        }

        if (req.cards.has_value() == req.deck_id.has_value())
            return std::unexpected(ParseError{"exactly one of 'cards' or 'deckId' is required"});
        return req;
    }

    auto BuildCard(Card const& c) -> json
    {
        return json{
            {"id", c.id},
            {"name", c.name},
            {"rarity", ToString(c.rarity)},
            {"type", ToString(c.type)},
            {"cost", c.cost},
            {"attack", c.attack},
            {"defense", c.defense},
            {"health", c.health},
            {"effects", c.effects},
            {"tags", c.tags},
            {"emoji", c.emoji},
            {"flavor", c.flavor}
        };
    }

    auto BuildCardList(std::vector<CCardSP> const& cards) -> json
    {
        json out = json::array();
        for (CCardSP const& c : cards) out.push_back(BuildCard(*c));
        return out;
    }

    auto BuildCardPage(std::vector<CCardSP> const& matches, std::uint32_t const page, std::uint32_t const limit)
        -> json
    {
        std::size_t const total = matches.size();
        std::size_t const total_pages = (total + limit - 1) / limit;
        std::size_t const first = std::min<std::size_t>(static_cast<std::size_t>(page - 1) * limit, total);
        std::size_t const last = std::min<std::size_t>(first + limit, total);

        json cards = json::array();
        for (std::size_t i = first; i < last; ++i) cards.push_back(BuildCard(*matches[i]));

        return json{
            {"cards", std::move(cards)},
            {"pagination", {
                {"page", page},
                {"limit", limit},
                {"total", total},
                {"totalPages", total_pages},
                {"hasNext", page < total_pages},
                {"hasPrev", page > 1}
            }}
        };
    }

    auto BuildCardStats(CardCatalog const& catalog) -> json
    {
        json by_rarity = json::object();
        for (Rarity const r : AllRarities)
        {
            if (std::size_t const n = catalog.ListByRarity(r).size(); n > 0)
                by_rarity[std::string{ToString(r)}] = n;
        }
        json by_type = json::object();
        for (auto const& [t, n] : catalog.CountByType())
            by_type[std::string{ToString(t)}] = n;

        return json{{"total", catalog.Size()}, {"byRarity", std::move(by_rarity)}, {"byType", std::move(by_type)}};
    }

    auto BuildTags(std::vector<TagCount> const& tags) -> json
    {
        json out = json::array();
        for (TagCount const& t : tags) out.push_back(json{{"tag", t.tag}, {"count", t.count}});
        return json{{"tags", std::move(out)}};
    }

    auto BuildRollResponse(RollResult const& r) -> json
    {
        json cards = json::array();
        for (RolledCard const& rc : r.cards)
        {
            json c = BuildCard(*rc.card);
            c["forced"] = rc.forced;
            cards.push_back(std::move(c));
        }

        json breakdown = json::object();
        for (auto const& [rarity, n] : r.RarityBreakdown())
            breakdown[std::string{ToString(rarity)}] = n;

        json highlights = json::array();
        for (CCardSP const& c : r.Highlights()) highlights.push_back(c->id);

        return json{
            {"packType", r.pack_type},
            {"count", r.cards.size()},
            {"cards", std::move(cards)},
            {"totalValue", r.TotalValue()},
            {"bonusMultiplier", r.bonus_multiplier},
            {"rarityBreakdown", std::move(breakdown)},
            {"highlights", std::move(highlights)},
            {"pity", {{"current", r.pity.counter}, {"max", r.pity.threshold}}},
            {"persistence", PersistenceName(r.persistence)}
        };
    }

    auto BuildDeckResponse(error::ValidateResult const& v, DeckStats const& stats) -> json
    {
        json out{{"valid", v.has_value()}};
        if (!v.has_value())
        {
            out["error"] = error::to_string(v.error().code);
            out["message"] = error::describe(v.error());
            return out;
        }

        json rarities = json::object();
        for (Rarity const r : AllRarities)
        {
            if (stats.rarity_distribution[Index(r)] > 0)
                rarities[std::string{ToString(r)}] = stats.rarity_distribution[Index(r)];
        }
        json types = json::object();
        for (auto const& [t, n] : stats.type_distribution)
            types[std::string{ToString(t)}] = n;

        out["stats"] = json{
            {"size", stats.size},
            {"totalCost", stats.total_cost},
            {"totalAttack", stats.total_attack},
            {"totalDefense", stats.total_defense},
            {"totalHealth", stats.total_health},
            {"averageAttack", stats.average_attack},
            {"averageHealth", stats.average_health},
            {"rarityDistribution", std::move(rarities)},
            {"typeDistribution", std::move(types)}
        };
        return out;
    }

    auto BuildError(std::string_view const kind, std::string_view const message) -> json
    {
        return json{{"error", kind}, {"message", message}};
    }

    auto BuildPityInfo(PlayerPityRecord const& record, CardCatalog const& catalog) -> json
    {
        json packs = json::object();
        for (PackType const* p : catalog.Packs())
        {
            std::uint32_t current = 0;
            std::uint64_t total = 0;
            if (auto const it = record.packs.find(p->name); it != record.packs.end())
            {
                current = std::min(it->second.counter, p->pity_threshold);
                total = it->second.total_rolls;
            }
            double const pct = 100.0 * static_cast<double>(current) / static_cast<double>(p->pity_threshold);
            packs[p->name] = json{
                {"current", current},
                {"max", p->pity_threshold},
                {"percentage", pct},
                {"totalRolls", total}
            };
        }
        return json{{"rollSequence", record.roll_sequence}, {"packs", std::move(packs)}};
    }

    auto BuildPacks(CardCatalog const& catalog) -> json
    {
        json out = json::array();
        for (PackType const* p : catalog.Packs())
        {
            json weights = json::object();
            for (Rarity const r : AllRarities)
                weights[std::string{ToString(r)}] = p->weights[Index(r)];

            out.push_back(json{
                {"name", p->name},
                {"maxBatch", p->max_batch},
                {"weights", std::move(weights)},
                {"qualifyingRarity", ToString(p->qualifying_rarity)},
                {"bonusMultiplier", p->bonus_multiplier},
                {"pityThreshold", p->pity_threshold}
            });
        }
        return json{{"packs", std::move(out)}};
    }

    auto PersistenceName(PersistenceStatus const s) noexcept -> std::string_view
    {
        switch (s)
        {
        case PersistenceStatus::Committed: return "committed";
        case PersistenceStatus::PendingReconciliation: return "pending";
        }
        return "unknown";
    }
}
