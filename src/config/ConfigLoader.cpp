//
// ConfigLoader.cpp
//
#include "ConfigLoader.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

#include "core/Exception.hpp"

namespace cardroll::core::config
{
    using nlohmann::json;

    namespace
    {
        [[noreturn]] auto Bad(std::string_view where, std::string_view what) -> void
        {
            CRL_THROW(error::Code::Configuration, std::format("config {}: {}", where, what));
        }

        auto RequireObject(json const& j, std::string_view where) -> void
        {
            if (!j.is_object()) Bad(where, "expected an object");
        }

        auto RequireString(json const& j, char const* key, std::string_view where) -> std::string
        {
            auto const it = j.find(key);
            if (it == j.end() || !it->is_string())
                Bad(where, std::format("'{}' must be a string", key));
            return it->get<std::string>();
        }

        auto OptString(json const& j, char const* key, std::string fallback, std::string_view where)
            -> std::string
        {
            auto const it = j.find(key);
            if (it == j.end() || it->is_null()) return fallback;
            if (!it->is_string()) Bad(where, std::format("'{}' must be a string", key));
            return it->get<std::string>();
        }

        // Unsigned integer in [lo, hi]; absent keys keep the fallback.
        auto OptUnsigned(json const& j, char const* key, std::uint64_t fallback, std::uint64_t lo,
                         std::uint64_t hi, std::string_view where) -> std::uint64_t
        {
            auto const it = j.find(key);
            if (it == j.end() || it->is_null()) return fallback;
            if (!it->is_number_integer())
                Bad(where, std::format("'{}' must be an integer", key));
            if (it->is_number_unsigned() || it->get<std::int64_t>() >= 0)
            {
                std::uint64_t const v = it->get<std::uint64_t>();
                if (v >= lo && v <= hi) return v;
            }
            Bad(where, std::format("'{}' must be in [{}, {}]", key, lo, hi));
        }

        auto OptSigned(json const& j, char const* key, std::string_view where) -> std::int32_t
        {
            auto const it = j.find(key);
            if (it == j.end() || it->is_null()) return 0;
            if (!it->is_number_integer())
                Bad(where, std::format("'{}' must be an integer", key));
            std::int64_t const v = it->get<std::int64_t>();
            if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max())
                Bad(where, std::format("'{}' is out of range", key));
            return static_cast<std::int32_t>(v);
        }

        auto OptStrings(json const& j, char const* key, std::string_view where) -> std::vector<std::string>
        {
            std::vector<std::string> out;
            auto const it = j.find(key);
            if (it == j.end() || it->is_null()) return out;
            if (!it->is_array()) Bad(where, std::format("'{}' must be an array of strings", key));
            out.reserve(it->size());
            for (json const& e : *it)
            {
                if (!e.is_string()) Bad(where, std::format("'{}' must be an array of strings", key));
                out.push_back(e.get<std::string>());
            }
            return out;
        }

        auto ToRarity(std::string_view s, std::string_view where) -> Rarity
        {
            std::optional<Rarity> const r = ParseRarity(s);
            if (!r) Bad(where, std::format("unknown rarity '{}'", s));
            return *r;
        }

        auto ParseWeights(json const& j, std::string_view where) -> PerRarity<double>
        {
            PerRarity<double> w{};
            RequireObject(j, where);
            for (auto const& [key, value] : j.items())
            {
                Rarity const r = ToRarity(key, where);
                if (!value.is_number())
                    Bad(where, std::format("weight for '{}' must be a number", key));
                w[Index(r)] = value.get<double>();
            }
            return w;
        }

        auto ParseDeck(json const& j) -> DeckRules
        {
            DeckRules rules{};
            if (j.is_null()) return rules;
            RequireObject(j, "deck");

            rules.min_size = OptUnsigned(j, "minSize", rules.min_size, 1, 100000, "deck");
            rules.max_size = OptUnsigned(j, "maxSize", rules.max_size, 1, 100000, "deck");
            if (rules.min_size > rules.max_size)
                Bad("deck", std::format("'minSize' ({}) exceeds 'maxSize' ({})", rules.min_size, rules.max_size));

            if (auto const it = j.find("maxCopies"); it != j.end())
            {
                RequireObject(*it, "deck.maxCopies");
                for (auto const& [key, value] : it->items())
                {
                    Rarity const r = ToRarity(key, "deck.maxCopies");
                    if (!value.is_number_unsigned())
                        Bad("deck.maxCopies", std::format("limit for '{}' must be a non-negative integer", key));
                    rules.max_copies[Index(r)] = value.get<std::uint32_t>();
                }
            }
            return rules;
        }

        auto ParsePersistence(json const& j) -> PersistenceSettings
        {
            PersistenceSettings p{};
            if (j.is_null()) return p;
            RequireObject(j, "persistence");

            p.directory = OptString(j, "directory", p.directory.string(), "persistence");
            p.timeout = std::chrono::milliseconds{
                OptUnsigned(j, "timeoutMs", static_cast<std::uint64_t>(p.timeout.count()), 1, 600000, "persistence")
            };
            p.reconciler.max_attempts = static_cast<std::uint32_t>(
                OptUnsigned(j, "retryAttempts", p.reconciler.max_attempts, 1, 1000, "persistence"));
            p.reconciler.backoff = std::chrono::milliseconds{
                OptUnsigned(j, "retryBackoffMs", static_cast<std::uint64_t>(p.reconciler.backoff.count()), 0,
                            600000, "persistence")
            };
            p.reconciler.save_timeout = p.timeout;
            return p;
        }

        auto ParseServer(json const& j) -> ServerSettings
        {
            ServerSettings s{};
            if (j.is_null()) return s;
            RequireObject(j, "server");

            s.port = static_cast<std::uint16_t>(OptUnsigned(j, "port", s.port, 1, 65535, "server"));
            s.threads = static_cast<std::uint32_t>(OptUnsigned(j, "threads", s.threads, 1, 256, "server"));
            s.request_timeout = std::chrono::milliseconds{
                OptUnsigned(j, "requestTimeoutMs", static_cast<std::uint64_t>(s.request_timeout.count()), 1,
                            600000, "server")
            };
            s.audit_path = OptString(j, "audit", s.audit_path, "server");
            return s;
        }
    }

    auto ParseCard(json const& j) -> Card
    {
        RequireObject(j, "cards[]");
        Card c{};
        c.id = RequireString(j, "id", "cards[]");
        std::string const where = std::format("card '{}'", c.id);

        c.name = OptString(j, "name", c.id, where);
        c.rarity = ToRarity(RequireString(j, "rarity", where), where);

        std::string const type = RequireString(j, "type", where);
        std::optional<CardType> const t = ParseCardType(type);
        if (!t) Bad(where, std::format("unknown card type '{}'", type));
        c.type = *t;

        // cost is the one stat that may not go negative
        c.cost = static_cast<std::uint32_t>(
            OptUnsigned(j, "cost", 0, 0, std::numeric_limits<std::uint32_t>::max(), where));
        c.attack = OptSigned(j, "attack", where);
        c.defense = OptSigned(j, "defense", where);
        c.health = OptSigned(j, "health", where);
        c.effects = OptStrings(j, "effects", where);
        c.tags = OptStrings(j, "tags", where);
        c.emoji = OptString(j, "emoji", "", where);
        c.flavor = OptString(j, "flavor", "", where);
        return c;
    }

    auto ParsePack(json const& j) -> PackType
    {
        RequireObject(j, "packs[]");
        PackType p{};
        p.name = RequireString(j, "name", "packs[]");
        std::string const where = std::format("pack '{}'", p.name);

        p.max_batch = static_cast<std::uint32_t>(OptUnsigned(j, "maxBatch", 1, 1, 1000, where));
        p.pity_threshold = static_cast<std::uint32_t>(
            OptUnsigned(j, "pityThreshold", 0, 1, std::numeric_limits<std::uint32_t>::max(), where));
        if (p.pity_threshold == 0) Bad(where, "'pityThreshold' is required");

        p.qualifying_rarity = ToRarity(OptString(j, "qualifyingRarity", "epic", where), where);

        if (auto const bonus = j.find("bonusMultiplier"); bonus != j.end() && !bonus->is_null())
        {
            if (!bonus->is_number() || bonus->get<double>() <= 0.0)
                Bad(where, "'bonusMultiplier' must be a positive number");
            p.bonus_multiplier = bonus->get<double>();
        }

        auto const w = j.find("weights");
        if (w == j.end()) Bad(where, "'weights' is required");
        p.weights = ParseWeights(*w, where);

        if (auto const pool = j.find("pool"); pool != j.end() && !pool->is_null())
        {
            RequireObject(*pool, where);
            for (std::string const& s : OptStrings(*pool, "types", where))
            {
                std::optional<CardType> const t = ParseCardType(s);
                if (!t) Bad(where, std::format("unknown card type '{}' in pool", s));
                p.pool.types.push_back(*t);
            }
            p.pool.tags = OptStrings(*pool, "tags", where);
        }
        return p;
    }

    auto ParseConfig(json const& root) -> EngineConfig
    {
        RequireObject(root, "root");

        auto const cards_it = root.find("cards");
        auto const packs_it = root.find("packs");
        if (cards_it == root.end() || !cards_it->is_array())
            Bad("root", "'cards' must be an array");
        if (packs_it == root.end() || !packs_it->is_array())
            Bad("root", "'packs' must be an array");

        std::vector<Card> cards;
        cards.reserve(cards_it->size());
        for (json const& c : *cards_it) cards.push_back(ParseCard(c));

        std::vector<PackType> packs;
        packs.reserve(packs_it->size());
        for (json const& p : *packs_it) packs.push_back(ParsePack(p));

        EngineConfig cfg{};
        cfg.catalog = CardCatalog::Build(std::move(cards), std::move(packs));
        cfg.deck = ParseDeck(root.value("deck", json{}));
        cfg.persistence = ParsePersistence(root.value("persistence", json{}));
        cfg.server = ParseServer(root.value("server", json{}));

        if (auto const engine = root.find("engine"); engine != root.end() && !engine->is_null())
        {
            RequireObject(*engine, "engine");
            if (auto const seed = engine->find("seed"); seed != engine->end() && !seed->is_null())
            {
                if (!seed->is_number_unsigned())
                    Bad("engine", "'seed' must be a non-negative integer");
                cfg.seed = seed->get<std::uint64_t>();
            }
        }
        return cfg;
    }

    auto ParseConfigText(std::string_view const text) -> EngineConfig
    {
        json root;
        try
        {
            root = json::parse(text);
        }
        catch (json::parse_error const& e)
        {
            CRL_THROW(error::Code::Configuration, std::format("config is not valid JSON: {}", e.what()));
        }
        return ParseConfig(root);
    }

    auto LoadConfigFile(std::filesystem::path const& path) -> EngineConfig
    {
        std::ifstream file(path);
        if (!file.is_open())
            CRL_THROW(error::Code::Configuration, std::format("cannot open config file '{}'", path.string()));

        std::string const content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return ParseConfigText(content);
    }
}
