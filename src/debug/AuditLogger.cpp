#include "AuditLogger.hpp"

#include <format>
#include <utility>

using namespace cardroll::core;

namespace
{

auto s_card(RolledCard const& rc) -> std::string
{
    return std::format("{}:{}{}", rc.card->id, ToString(rc.card->rarity), rc.forced ? "!" : "");
}

auto s_cards(RollResult const& r) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < r.cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_card(r.cards[i]);
    }
    return body;
}

auto s_ids(Deck const& d) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < d.card_ids.size(); ++i)
    {
        body += (i ? "," : "");
        body += d.card_ids[i];
    }
    return body;
}

} // anonymous namespace

namespace cardroll::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::uint64_t const seed, CardCatalog const& catalog) -> void
{
    std::string packs;
    for (PackType const* p : catalog.Packs())
    {
        packs += (packs.empty() ? "" : ",");
        packs += std::format("{}/{}/{}", p->name, ToString(p->qualifying_rarity), p->pity_threshold);
    }

    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Cards={}\n", catalog.Size());
    out_ << std::format("Packs=[{}]\n", packs);
    out_.flush();
}

auto AuditLogger::roll(PlayerId const& player, RollResult const& r) -> void
{
    std::string const line = std::format(
        "Roll player={} seq={} pack={} cards=[{}] pity={}/{} total={} persistence={}\n",
        player,
        r.sequence,
        r.pack_type,
        s_cards(r),
        r.pity.counter,
        r.pity.threshold,
        r.TotalValue(),
        r.persistence == PersistenceStatus::Committed ? "committed" : "pending"
    );

    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line;
}

auto AuditLogger::rejected(PlayerId const& player, std::string_view const what, std::string_view const message)
    -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Rejected player={} error={} message={}\n", player, what, message);
}

auto AuditLogger::deck(PlayerId const& player, Deck const& d, error::ValidateResult const& v) -> void
{
    std::string const line = std::format(
        "Deck player={} size={} cards=[{}] result={}\n",
        player,
        d.Size(),
        s_ids(d),
        v.has_value() ? std::string{"valid"} : error::describe(v.error())
    );

    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line;
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

} // namespace cardroll::core::debug
