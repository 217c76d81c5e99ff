//
// PityStore.hpp
//

#ifndef CARDROLL_PITYSTORE_HPP
#define CARDROLL_PITYSTORE_HPP

#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "Types.hpp"

namespace cardroll::core
{
    struct PityState
    {
        std::uint32_t counter{};   // consecutive non-qualifying slots
        std::uint32_t threshold{}; // guarantee window of the pack
        std::uint64_t total_rolls{};

        auto operator==(PityState const&) const -> bool = default;
    };

    // Persisted per player: pack name -> state, plus the number of committed
    // roll requests (feeds the per-request random source).
    struct PlayerPityRecord
    {
        std::uint64_t roll_sequence{};
        std::map<std::string, PityState, std::less<>> packs;

        auto operator==(PlayerPityRecord const&) const -> bool = default;
    };

    enum class StoreFailureKind : std::uint8_t
    {
        Timeout,
        Unavailable,
        Corrupt
    };

    struct StoreFailure
    {
        StoreFailureKind kind{StoreFailureKind::Unavailable};
        std::string message;
    };

    auto to_string(StoreFailureKind k) -> std::string_view;

    // Storage contract for pity state. Implementations must honour the deadline
    // (fail with Timeout instead of blocking past it) and must be callable
    // concurrently for different players.
    class PityStore
    {
    public:
        virtual ~PityStore() = default;

        // An unknown player yields a default (empty) record.
        virtual auto Load(PlayerId const& player, Deadline deadline)
            -> std::expected<PlayerPityRecord, StoreFailure> = 0;

        virtual auto Save(PlayerId const& player, PlayerPityRecord const& record, Deadline deadline)
            -> std::expected<void, StoreFailure> = 0;
    };

    class InMemoryPityStore final : public PityStore
    {
    public:
        auto Load(PlayerId const& player, Deadline deadline)
            -> std::expected<PlayerPityRecord, StoreFailure> override;

        auto Save(PlayerId const& player, PlayerPityRecord const& record, Deadline deadline)
            -> std::expected<void, StoreFailure> override;

    private:
        std::mutex mtx_;
        std::unordered_map<PlayerId, PlayerPityRecord> records_;
    };
}

#endif //CARDROLL_PITYSTORE_HPP
