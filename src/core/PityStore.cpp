//
// PityStore.cpp
//
#include "PityStore.hpp"

namespace cardroll::core
{
    auto to_string(StoreFailureKind const k) -> std::string_view
    {
        switch (k)
        {
        case StoreFailureKind::Timeout: return "timeout";
        case StoreFailureKind::Unavailable: return "unavailable";
        case StoreFailureKind::Corrupt: return "corrupt";
        }
        return "unknown";
    }

    auto InMemoryPityStore::Load(PlayerId const& player, Deadline const deadline)
        -> std::expected<PlayerPityRecord, StoreFailure>
    {
        if (Clock::now() > deadline)
            return std::unexpected(StoreFailure{StoreFailureKind::Timeout, "deadline passed before load"});

        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = records_.find(player);
        return it != records_.end() ? it->second : PlayerPityRecord{};
    }

    auto InMemoryPityStore::Save(PlayerId const& player, PlayerPityRecord const& record, Deadline const deadline)
        -> std::expected<void, StoreFailure>
    {
        if (Clock::now() > deadline)
            return std::unexpected(StoreFailure{StoreFailureKind::Timeout, "deadline passed before save"});

        std::lock_guard<std::mutex> lock(mtx_);
        records_[player] = record;
        return {};
    }
}
