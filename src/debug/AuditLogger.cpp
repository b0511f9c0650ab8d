#include "AuditLogger.hpp"

#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace bigtwo::core;

namespace
{

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayAction>)
            {
                return fmt::format("Play[{}]", util::ToString(std::span<Card const>{act.cards}));
            }
            else
            {
                return "Pass";
            }
        },
        a
    );
}

auto s_lead(TurnState const& s) -> std::string
{
    if (!s.last_play) return "--";
    return fmt::format("P{}:{}:{}",
                       static_cast<int>(s.last_play->seat),
                       to_string(s.last_play->combo.type),
                       util::ToString(std::span<Card const>{s.last_play->combo.cards}));
}

auto s_timer(TurnState const& s) -> std::string
{
    ActiveTimer const* t = ActiveOf(s.timer);
    if (t == nullptr) return "none";
    return fmt::format("seq={},exempt=P{},end={}", t->sequence_id, static_cast<int>(t->exempt_seat), t->end_timestamp_ms);
}

auto s_turn_line(SeatView const& v) -> std::string
{
    return fmt::format(
        "Turn match={} actor=P{} phase={} passes={} lead=[{}] timer=[{}] hand={}\n",
        v.state.match_number,
        static_cast<int>(v.seat),
        error::to_string(v.state.phase),
        static_cast<int>(v.state.consecutive_passes),
        s_lead(v.state),
        s_timer(v.state),
        v.my_hand.size()
    );
}

} // anonymous namespace

namespace bigtwo::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Threshold={}\n", game.Cfg().game_over_threshold);
    out_ << fmt::format("AutoPassMs={}\n", game.Cfg().auto_pass_duration.count());
    out_ << fmt::format("Unbeatable={}\n", game.Predicate().Name());
    out_ << fmt::format("Opener=P{}\n", static_cast<int>(game.CurrentTurn()));
    out_.flush();
}

auto AuditLogger::turn(SeatView const& v, PlayerAction const& a) -> void
{
    out_ << s_turn_line(v);
    out_ << fmt::format("Action: {}\n", s_action(a));
}

auto AuditLogger::turn(SeatView const& v) -> void
{
    out_ << s_turn_line(v);
    out_ << "Action: <omitted>\n";
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    std::string_view txt = "Invalid";
    switch (m)
    {
    case MoveOutcome::Invalid: txt = "Invalid"; break;
    case MoveOutcome::Applied: txt = "Applied"; break;
    case MoveOutcome::TrickCleared: txt = "TrickCleared"; break;
    case MoveOutcome::MatchEnded: txt = "MatchEnded"; break;
    case MoveOutcome::GameEnded: txt = "GameEnded"; break;
    }
    out_ << fmt::format("Outcome: {}\n", txt);
}

auto AuditLogger::match(MatchRecord const& rec) -> void
{
    out_ << fmt::format("Match {} winner=P{} left=[{}] score=[{}]\n",
                        rec.match_number,
                        static_cast<int>(rec.winner),
                        fmt::join(rec.ending_hand_sizes, ","),
                        fmt::join(rec.score, ","));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    ScoreArrayT const& totals = game.Totals().Totals();
    out_ << fmt::format("Totals=[{}]\n", fmt::join(totals, ","));
    out_ << fmt::format("Winner=P{}\n", static_cast<int>(FindFinalWinner(totals)));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace bigtwo::core::debug
