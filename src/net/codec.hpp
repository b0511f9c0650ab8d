//
// codec.hpp
//

#ifndef BIGTWO_CODEC_HPP
#define BIGTWO_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/bigtwo_net_generated.h"

namespace bigtwo::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct JoinRequest
    {
        std::string room;
        SeatIdxT seat{};
        std::uint64_t msg_id{};
    };

    struct DecodedAction
    {
        std::string room;
        SeatIdxT actor{};
        PlayerAction action{};
        std::uint64_t msg_id{};
    };

    struct TimerExpiredRequest
    {
        std::string room;
        std::uint64_t sequence_id{};
        std::uint64_t msg_id{};
    };

    using ClientMessage = std::variant<JoinRequest, DecodedAction, TimerExpiredRequest>;

    struct DecodedSnapshot
    {
        std::string room;
        std::uint64_t msg_id{};
        SeatView view{};
    };

    struct DecodedViolation
    {
        std::uint64_t msg_id{};
        error::RuleViolationCode code{};
        std::string text;
        std::optional<std::uint64_t> sequence_id{};
    };

    using ServerMessage = std::variant<DecodedSnapshot, DecodedViolation>;

    auto ToFbSuit(Suit s) noexcept -> gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> gen::net::Rank;
    auto ToFbPhase(Phase p) noexcept -> gen::net::Phase;
    auto ToFbComboType(ComboType t) noexcept -> gen::net::ComboType;

    auto FromFbSuit(gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(gen::net::Rank r) noexcept -> Rank;
    auto FromFbPhase(gen::net::Phase p) noexcept -> Phase;

    // --- Outbound builders (server → client) ---

    auto BuildSnapshot(std::string const& room,
                       SeatView const& view,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (client → server) ---

    auto BuildJoin(std::string const& room,
                   SeatIdxT seat,
                   std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Play(std::string const& room,
                          SeatIdxT actor,
                          std::span<Card const> cards,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Pass(std::string const& room,
                          SeatIdxT actor,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildTimerExpired(std::string const& room,
                           std::uint64_t sequence_id,
                           std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto DecodeClientMessage(std::span<std::byte const> bytes)
        -> std::expected<ClientMessage, ParseError>;

    auto DecodeServerMessage(std::span<std::byte const> bytes)
        -> std::expected<ServerMessage, ParseError>;
} // namespace bigtwo::core::net


#endif //BIGTWO_CODEC_HPP
