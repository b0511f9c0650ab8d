//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

#include "../core/Combo.hpp"

namespace bigtwo::core::net
{
    namespace fbn = bigtwo::gen::net;

    auto ToFbSuit(Suit s) noexcept -> fbn::Suit
    {
        switch (s)
        {
        case Suit::Diamonds: return fbn::Suit::Diamonds;
        case Suit::Clubs: return fbn::Suit::Clubs;
        case Suit::Hearts: return fbn::Suit::Hearts;
        case Suit::Spades: return fbn::Suit::Spades;
        }
        return fbn::Suit::Diamonds;
    }

    auto FromFbSuit(fbn::Suit s) noexcept -> Suit
    {
        switch (s)
        {
        case fbn::Suit::Diamonds: return Suit::Diamonds;
        case fbn::Suit::Clubs: return Suit::Clubs;
        case fbn::Suit::Hearts: return Suit::Hearts;
        case fbn::Suit::Spades: return Suit::Spades;
        }
        return Suit::Diamonds;
    }

    auto ToFbRank(Rank r) noexcept -> fbn::Rank
    {
        switch (r)
        {
        case Rank::Three: return fbn::Rank::Three;
        case Rank::Four: return fbn::Rank::Four;
        case Rank::Five: return fbn::Rank::Five;
        case Rank::Six: return fbn::Rank::Six;
        case Rank::Seven: return fbn::Rank::Seven;
        case Rank::Eight: return fbn::Rank::Eight;
        case Rank::Nine: return fbn::Rank::Nine;
        case Rank::Ten: return fbn::Rank::Ten;
        case Rank::Jack: return fbn::Rank::Jack;
        case Rank::Queen: return fbn::Rank::Queen;
        case Rank::King: return fbn::Rank::King;
        case Rank::Ace: return fbn::Rank::Ace;
        case Rank::Two: return fbn::Rank::Two;
        }
        return fbn::Rank::Three;
    }

    auto FromFbRank(fbn::Rank r) noexcept -> Rank
    {
        switch (r)
        {
        case fbn::Rank::Three: return Rank::Three;
        case fbn::Rank::Four: return Rank::Four;
        case fbn::Rank::Five: return Rank::Five;
        case fbn::Rank::Six: return Rank::Six;
        case fbn::Rank::Seven: return Rank::Seven;
        case fbn::Rank::Eight: return Rank::Eight;
        case fbn::Rank::Nine: return Rank::Nine;
        case fbn::Rank::Ten: return Rank::Ten;
        case fbn::Rank::Jack: return Rank::Jack;
        case fbn::Rank::Queen: return Rank::Queen;
        case fbn::Rank::King: return Rank::King;
        case fbn::Rank::Ace: return Rank::Ace;
        case fbn::Rank::Two: return Rank::Two;
        }
        return Rank::Three;
    }

    auto ToFbPhase(Phase p) noexcept -> fbn::Phase
    {
        switch (p)
        {
        case Phase::FirstPlay: return fbn::Phase::FirstPlay;
        case Phase::Playing: return fbn::Phase::Playing;
        case Phase::Finished: return fbn::Phase::Finished;
        case Phase::GameOver: return fbn::Phase::GameOver;
        }
        return fbn::Phase::FirstPlay;
    }

    auto FromFbPhase(fbn::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case fbn::Phase::FirstPlay: return Phase::FirstPlay;
        case fbn::Phase::Playing: return Phase::Playing;
        case fbn::Phase::Finished: return Phase::Finished;
        case fbn::Phase::GameOver: return Phase::GameOver;
        }
        return Phase::FirstPlay;
    }

    auto ToFbComboType(ComboType t) noexcept -> fbn::ComboType
    {
        return static_cast<fbn::ComboType>(std::to_underlying(t));
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)bigtwo::core::Suit::Hearts == (int)bigtwo::gen::net::Suit::Hearts);
    static_assert((int)bigtwo::core::Rank::Two == (int)bigtwo::gen::net::Rank::Two);
    static_assert((int)bigtwo::core::Phase::GameOver == (int)bigtwo::gen::net::Phase::GameOver);
    static_assert((int)bigtwo::core::ComboType::StraightFlush == (int)bigtwo::gen::net::ComboType::StraightFlush);
} // anonymous

namespace bigtwo::core::net
{
    using CardVecT = flatbuffers::Vector<flatbuffers::Offset<fbn::Card>>;

    static auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, std::span<Card const> cards)
        -> flatbuffers::Offset<CardVecT>
    {
        std::vector<flatbuffers::Offset<fbn::Card>> vec;
        vec.reserve(cards.size());
        for (Card const& c : cards)
        {
            vec.push_back(fbn::CreateCard(fbb, ToFbSuit(c.suit), ToFbRank(c.rank)));
        }
        return fbb.CreateVector(vec);
    }

    // The verifier checks offsets only; enum values still need a range check.
    static auto FromFbCard(fbn::Card const* c) -> std::optional<Card>
    {
        if (c == nullptr) return std::nullopt;
        if (static_cast<std::size_t>(c->suit()) >= SuitCount) return std::nullopt;
        if (static_cast<std::size_t>(c->rank()) >= RankCount) return std::nullopt;
        return Card{FromFbSuit(c->suit()), FromFbRank(c->rank())};
    }

    static auto FromFbCards(CardVecT const* v) -> std::expected<std::vector<Card>, ParseError>
    {
        std::vector<Card> out;
        if (v == nullptr) return out;
        out.reserve(v->size());
        for (auto const* fb_c : *v)
        {
            std::optional<Card> const c = FromFbCard(fb_c);
            if (!c) return std::unexpected(ParseError{"card out of range"});
            out.push_back(*c);
        }
        return out;
    }

    static auto ToStr(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    static auto Finish(flatbuffers::FlatBufferBuilder& fbb,
                       fbn::Message type,
                       flatbuffers::Offset<void> msg) -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(std::string const& room,
                       SeatView const& view,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        TurnState const& s = view.state;
        flatbuffers::FlatBufferBuilder fbb;

        flatbuffers::Offset<fbn::LastPlay> lp_off{};
        if (s.last_play)
        {
            auto const cards = ToFbCards(fbb, s.last_play->combo.cards);
            lp_off = fbn::CreateLastPlay(fbb, s.last_play->seat, ToFbComboType(s.last_play->combo.type), cards);
        }

        flatbuffers::Offset<fbn::AutoPassTimer> t_off{};
        if (ActiveTimer const* t = ActiveOf(s.timer))
        {
            auto const cards = ToFbCards(fbb, t->triggering_combo.cards);
            t_off = fbn::CreateAutoPassTimer(fbb,
                                             t->exempt_seat,
                                             t->end_timestamp_ms,
                                             t->server_time_at_creation_ms,
                                             t->sequence_id,
                                             cards);
        }

        std::vector<std::uint8_t> const counts(s.hand_counts.begin(), s.hand_counts.end());
        std::vector<std::uint32_t> const totals(s.totals.begin(), s.totals.end());
        auto const counts_vec = fbb.CreateVector(counts);
        auto const totals_vec = fbb.CreateVector(totals);
        auto const my_vec = ToFbCards(fbb, view.my_hand);
        auto const played_vec = ToFbCards(fbb, view.played);

        auto const sv = fbn::CreateSeatView(
            fbb,
            /*schema_version*/ 1,
            /*seat*/ view.seat,
            /*current_turn*/ s.current_turn,
            /*phase*/ ToFbPhase(s.phase),
            /*match_number*/ s.match_number,
            /*consecutive_passes*/ s.consecutive_passes,
            /*last_play*/ lp_off,
            /*timer*/ t_off,
            /*hand_counts*/ counts_vec,
            /*totals*/ totals_vec,
            /*my_hand*/ my_vec,
            /*played*/ played_vec,
            /*last_match_winner*/ s.last_match_winner ? static_cast<int8_t>(*s.last_match_winner) : int8_t{-1},
            /*version*/ s.version
        );

        auto const room_off = fbb.CreateString(room);
        auto const sm = fbn::CreateSnapshotMsg(fbb, msg_id, room_off, sv);
        return Finish(fbb, fbn::Message::SnapshotMsg, sm.Union());
    }

    // ---------- Violation (server → client) ----------

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fbn::CreateViolation(
            fbb, msg_id, static_cast<int16_t>(v.code), txt, v.sequence_id.value_or(0));
        return Finish(fbb, fbn::Message::Violation, vio.Union());
    }

    // ---------- Builders (client → server) ----------

    auto BuildJoin(std::string const& room,
                   SeatIdxT seat,
                   std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const room_off = fbb.CreateString(room);
        auto const j = fbn::CreateJoinMsg(fbb, msg_id, room_off, seat);
        return Finish(fbb, fbn::Message::JoinMsg, j.Union());
    }

    auto BuildAction_Play(std::string const& room,
                          SeatIdxT actor,
                          std::span<Card const> cards,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const cards_vec = ToFbCards(fbb, cards);
        auto const p = fbn::CreateAction_Play(fbb, actor, cards_vec);
        auto const room_off = fbb.CreateString(room);
        auto const m = fbn::CreatePlayerActionMsg(
            fbb, msg_id, room_off, fbn::Action::Action_Play, p.Union());
        return Finish(fbb, fbn::Message::PlayerActionMsg, m.Union());
    }

    auto BuildAction_Pass(std::string const& room,
                          SeatIdxT actor,
                          std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p = fbn::CreateAction_Pass(fbb, actor);
        auto const room_off = fbb.CreateString(room);
        auto const m = fbn::CreatePlayerActionMsg(
            fbb, msg_id, room_off, fbn::Action::Action_Pass, p.Union());
        return Finish(fbb, fbn::Message::PlayerActionMsg, m.Union());
    }

    auto BuildTimerExpired(std::string const& room,
                           std::uint64_t sequence_id,
                           std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const room_off = fbb.CreateString(room);
        auto const t = fbn::CreateTimerExpiredMsg(fbb, msg_id, room_off, sequence_id);
        return Finish(fbb, fbn::Message::TimerExpiredMsg, t.Union());
    }

    // ---------- Decode ----------

    static auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        return fbn::GetEnvelope(data);
    }

    static auto SeatOf(unsigned const raw) -> std::expected<SeatIdxT, ParseError>
    {
        if (raw >= constants::NumSeats) return std::unexpected(ParseError{"seat out of range"});
        return static_cast<SeatIdxT>(raw);
    }

    static auto DecodeAction(fbn::PlayerActionMsg const* pam) -> std::expected<ClientMessage, ParseError>
    {
        // a union tag without its table still verifies
        if (pam == nullptr) return std::unexpected(ParseError{"empty message"});

        DecodedAction out{};
        out.msg_id = pam->msg_id();
        out.room = ToStr(pam->room());

        switch (pam->action_type())
        {
        case fbn::Action::Action_Play:
        {
            auto const* p = pam->action_as_Action_Play();
            if (p == nullptr) return std::unexpected(ParseError{"empty action"});
            auto const seat = SeatOf(p->actor());
            if (!seat) return std::unexpected(seat.error());
            auto cards = FromFbCards(p->cards());
            if (!cards) return std::unexpected(cards.error());

            out.actor = *seat;
            out.action = PlayAction{std::move(*cards)};
            return out;
        }

        case fbn::Action::Action_Pass:
        {
            auto const* p = pam->action_as_Action_Pass();
            if (p == nullptr) return std::unexpected(ParseError{"empty action"});
            auto const seat = SeatOf(p->actor());
            if (!seat) return std::unexpected(seat.error());

            out.actor = *seat;
            out.action = PassAction{};
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown action variant"});
        }
    }

    auto DecodeClientMessage(std::span<std::byte const> bytes)
        -> std::expected<ClientMessage, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        switch ((*env)->message_type())
        {
        case fbn::Message::JoinMsg:
        {
            auto const* j = (*env)->message_as_JoinMsg();
            if (j == nullptr) return std::unexpected(ParseError{"empty message"});
            auto const seat = SeatOf(j->seat());
            if (!seat) return std::unexpected(seat.error());
            return JoinRequest{ToStr(j->room()), *seat, j->msg_id()};
        }
        case fbn::Message::PlayerActionMsg:
            return DecodeAction((*env)->message_as_PlayerActionMsg());
        case fbn::Message::TimerExpiredMsg:
        {
            auto const* t = (*env)->message_as_TimerExpiredMsg();
            if (t == nullptr) return std::unexpected(ParseError{"empty message"});
            return TimerExpiredRequest{ToStr(t->room()), t->sequence_id(), t->msg_id()};
        }
        default:
            return std::unexpected(ParseError{"not a client message"});
        }
    }

    static auto DecodeView(fbn::SeatView const* sv) -> std::expected<SeatView, ParseError>
    {
        if (sv == nullptr) return std::unexpected(ParseError{"snapshot without view"});

        SeatView out{};
        auto const seat = SeatOf(sv->seat());
        if (!seat) return std::unexpected(seat.error());
        auto const turn = SeatOf(sv->current_turn());
        if (!turn) return std::unexpected(turn.error());
        if (std::to_underlying(sv->phase()) > std::to_underlying(fbn::Phase::GameOver))
            return std::unexpected(ParseError{"phase out of range"});

        out.seat = *seat;
        TurnState& s = out.state;
        s.current_turn = *turn;
        s.phase = FromFbPhase(sv->phase());
        s.match_number = sv->match_number();
        s.consecutive_passes = sv->consecutive_passes();
        s.version = sv->version();
        if (sv->last_match_winner() >= 0)
        {
            auto const w = SeatOf(static_cast<unsigned>(sv->last_match_winner()));
            if (!w) return std::unexpected(w.error());
            s.last_match_winner = *w;
        }

        if (auto const* lp = sv->last_play())
        {
            auto const lp_seat = SeatOf(lp->seat());
            if (!lp_seat) return std::unexpected(lp_seat.error());
            auto cards = FromFbCards(lp->cards());
            if (!cards) return std::unexpected(cards.error());
            std::optional<Combo> combo = Classify(*cards);
            if (!combo || ToFbComboType(combo->type) != lp->combo_type())
                return std::unexpected(ParseError{"last play is not the combo it claims"});
            s.last_play = LastPlay{*lp_seat, std::move(*combo)};
        }

        if (auto const* t = sv->timer())
        {
            auto const exempt = SeatOf(t->exempt_seat());
            if (!exempt) return std::unexpected(exempt.error());
            auto cards = FromFbCards(t->triggering_cards());
            if (!cards) return std::unexpected(cards.error());
            std::optional<Combo> combo = Classify(*cards);
            if (!combo) return std::unexpected(ParseError{"timer without a valid triggering combo"});
            s.timer = ActiveTimer{
                .exempt_seat = *exempt,
                .end_timestamp_ms = t->end_timestamp_ms(),
                .server_time_at_creation_ms = t->server_time_at_creation_ms(),
                .sequence_id = t->sequence_id(),
                .triggering_combo = std::move(*combo)
            };
        }

        auto const* counts = sv->hand_counts();
        auto const* totals = sv->totals();
        if (!counts || counts->size() != constants::NumSeats || !totals || totals->size() != constants::NumSeats)
            return std::unexpected(ParseError{"per-seat vectors must have one entry per seat"});
        for (flatbuffers::uoffset_t i{}; i < constants::NumSeats; ++i)
        {
            s.hand_counts[i] = counts->Get(i);
            s.totals[i] = totals->Get(i);
        }

        auto hand = FromFbCards(sv->my_hand());
        if (!hand) return std::unexpected(hand.error());
        auto played = FromFbCards(sv->played());
        if (!played) return std::unexpected(played.error());
        out.my_hand = std::move(*hand);
        out.played = std::move(*played);
        return out;
    }

    auto DecodeServerMessage(std::span<std::byte const> bytes)
        -> std::expected<ServerMessage, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        switch ((*env)->message_type())
        {
        case fbn::Message::SnapshotMsg:
        {
            auto const* sm = (*env)->message_as_SnapshotMsg();
            if (sm == nullptr) return std::unexpected(ParseError{"empty message"});
            auto view = DecodeView(sm->view());
            if (!view) return std::unexpected(view.error());
            return DecodedSnapshot{ToStr(sm->room()), sm->msg_id(), std::move(*view)};
        }
        case fbn::Message::Violation:
        {
            auto const* v = (*env)->message_as_Violation();
            if (v == nullptr) return std::unexpected(ParseError{"empty message"});
            auto const last = std::to_underlying(error::RuleViolationCode::GameNotInProgress);
            if (v->code() < 0 || v->code() > last)
                return std::unexpected(ParseError{"violation code out of range"});

            DecodedViolation out{};
            out.msg_id = v->msg_id();
            out.code = static_cast<error::RuleViolationCode>(v->code());
            out.text = ToStr(v->text());
            if (v->sequence_id() != 0) out.sequence_id = v->sequence_id();
            return out;
        }
        default:
            return std::unexpected(ParseError{"not a server message"});
        }
    }
} // namespace bigtwo::core::net
