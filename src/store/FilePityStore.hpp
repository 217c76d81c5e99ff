//
// FilePityStore.hpp
//

#ifndef CARDROLL_FILEPITYSTORE_HPP
#define CARDROLL_FILEPITYSTORE_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>
#include <utility>

#include <flatbuffers/flatbuffers.h>

#include "core/PityStore.hpp"
#include "core/Types.hpp"

namespace cardroll::core::store
{
    // One FlatBuffers file per player under a directory. Writes go to a
    // temporary file that is renamed over the old one, so a crash leaves
    // either the previous or the new record.
    class FilePityStore final : public PityStore
    {
    public:
        // Creates the directory if needed; throws ConfigurationError when it
        // cannot be created.
        explicit FilePityStore(std::filesystem::path dir);

        auto Load(PlayerId const& player, Deadline deadline)
            -> std::expected<PlayerPityRecord, StoreFailure> override;

        auto Save(PlayerId const& player, PlayerPityRecord const& record, Deadline deadline)
            -> std::expected<void, StoreFailure> override;

        // Ids up to this many bytes map to their plain hex encoding.
        static constexpr std::size_t HexPrefixBytes = 48;

        // Distinct ids can share a digest; Load() detects that through the id
        // stored in the file and reports Corrupt.
        [[nodiscard]]
        auto PathFor(PlayerId const& player) const -> std::filesystem::path;

        static auto Encode(PlayerId const& player, PlayerPityRecord const& record)
            -> flatbuffers::DetachedBuffer;

        static auto Decode(std::span<std::byte const> bytes)
            -> std::expected<std::pair<PlayerId, PlayerPityRecord>, StoreFailure>;

    private:
        std::filesystem::path dir_;
    };
}

#endif //CARDROLL_FILEPITYSTORE_HPP
