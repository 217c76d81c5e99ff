//
// FilePityStore.cpp
//
#include "FilePityStore.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/Exception.hpp"
#include "core/Util.hpp"
#include "generated/flatbuffers/pity_store_generated.h"

namespace cardroll::core::store
{
    namespace fbs = cardroll::gen::store;

    static auto TimedOut(Deadline const deadline, char const* what) -> std::expected<void, StoreFailure>
    {
        if (Clock::now() > deadline)
            return std::unexpected(StoreFailure{StoreFailureKind::Timeout,
                                                std::format("deadline passed before {}", what)});
        return {};
    }

    FilePityStore::FilePityStore(std::filesystem::path dir) :
        dir_(std::move(dir))
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            CRL_THROW(error::Code::Configuration,
                      std::format("Cannot create pity store directory '{}': {}", dir_.string(), ec.message()));
    }

    auto FilePityStore::PathFor(PlayerId const& player) const -> std::filesystem::path
    {
        // hex keeps arbitrary ids out of path syntax; long ids keep a prefix
        // plus a digest of the whole id so the name stays under NAME_MAX
        static constexpr char digits[] = "0123456789abcdef";
        std::string_view const shown = std::string_view{player}.substr(0, HexPrefixBytes);
        std::string name;
        name.reserve(shown.size() * 2 + 22);
        for (unsigned char const c : shown)
        {
            name.push_back(digits[c >> 4]);
            name.push_back(digits[c & 0x0F]);
        }
        if (player.size() > HexPrefixBytes)
        {
            name += std::format("-{:016x}", util::Fnv1a(player));
        }
        name += ".pity";
        return dir_ / name;
    }

    auto FilePityStore::Encode(PlayerId const& player, PlayerPityRecord const& record)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbs::PackPity>> packs;
        packs.reserve(record.packs.size());
        for (auto const& [name, state] : record.packs)
        {
            packs.push_back(fbs::CreatePackPityDirect(fbb, name.c_str(), state.counter, state.threshold,
                                                      state.total_rolls));
        }

        auto const root = fbs::CreatePlayerPityDirect(fbb, player.c_str(), record.roll_sequence, &packs);
        fbs::FinishPlayerPityBuffer(fbb, root);
        return fbb.Release();
    }

    auto FilePityStore::Decode(std::span<std::byte const> const bytes)
        -> std::expected<std::pair<PlayerId, PlayerPityRecord>, StoreFailure>
    {
        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbs::VerifyPlayerPityBuffer(verifier))
            return std::unexpected(StoreFailure{StoreFailureKind::Corrupt, "pity buffer failed verification"});

        fbs::PlayerPity const* root = fbs::GetPlayerPity(data);

        std::pair<PlayerId, PlayerPityRecord> out{};
        if (root->player()) out.first = root->player()->str();
        out.second.roll_sequence = root->roll_sequence();

        if (auto const* v = root->packs())
        {
            for (fbs::PackPity const* p : *v)
            {
                if (!p->pack())
                    return std::unexpected(StoreFailure{StoreFailureKind::Corrupt, "pack entry without a name"});
                out.second.packs.insert_or_assign(p->pack()->str(), PityState{
                                                      .counter = p->counter(),
                                                      .threshold = p->threshold(),
                                                      .total_rolls = p->total_rolls()
                                                  });
            }
        }
        return out;
    }

    auto FilePityStore::Load(PlayerId const& player, Deadline const deadline)
        -> std::expected<PlayerPityRecord, StoreFailure>
    {
        if (auto const t = TimedOut(deadline, "load"); !t.has_value()) return std::unexpected(t.error());

        std::filesystem::path const path = PathFor(player);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            if (ec)
                return std::unexpected(StoreFailure{StoreFailureKind::Unavailable, ec.message()});
            return PlayerPityRecord{};
        }

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return std::unexpected(StoreFailure{StoreFailureKind::Unavailable,
                                                std::format("cannot open '{}'", path.string())});

        std::vector<char> const raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            return std::unexpected(StoreFailure{StoreFailureKind::Unavailable,
                                                std::format("read error on '{}'", path.string())});

        auto decoded = Decode(std::as_bytes(std::span{raw}));
        if (!decoded.has_value()) return std::unexpected(decoded.error());
        if (decoded->first != player)
            return std::unexpected(StoreFailure{StoreFailureKind::Corrupt,
                                                std::format("'{}' holds the record of another player", path.string())});
        return std::move(decoded->second);
    }

    auto FilePityStore::Save(PlayerId const& player, PlayerPityRecord const& record, Deadline const deadline)
        -> std::expected<void, StoreFailure>
    {
        if (auto const t = TimedOut(deadline, "save"); !t.has_value()) return t;

        flatbuffers::DetachedBuffer const buf = Encode(player, record);

        std::filesystem::path const path = PathFor(player);
        std::filesystem::path tmp = path;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
                return std::unexpected(StoreFailure{StoreFailureKind::Unavailable,
                                                    std::format("cannot open '{}'", tmp.string())});
            out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
            out.flush();
            if (!out.good())
                return std::unexpected(StoreFailure{StoreFailureKind::Unavailable,
                                                    std::format("write error on '{}'", tmp.string())});
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec)
            return std::unexpected(StoreFailure{StoreFailureKind::Unavailable,
                                                std::format("cannot replace '{}': {}", path.string(), ec.message())});
        return {};
    }
}
