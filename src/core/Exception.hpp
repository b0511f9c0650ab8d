//
// Exception.hpp
//

#ifndef BIGTWO_EXCEPTION_HPP
#define BIGTWO_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"
#include "Actions.hpp"
#include "Util.hpp"

namespace bigtwo::core::error
{
    enum class Code : unsigned
    {
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // caller proposed something the engine cannot route
        Network, // transport setup failed
        Assertion // internal assertion failed
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // Raises the error type matching `c`, tagged with the caller's location.
    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location site = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, site);
        case Code::State: throw StateError(std::move(msg), c, site);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, site);
        case Code::Network: throw NetworkError(std::move(msg), c, site);
        case Code::Assertion: throw AssertionError(std::move(msg), c, site);
        }
        throw std::logic_error(msg);
    }

#define BIGTWO_THROW(code_enum, msg) ::bigtwo::core::error::fail((code_enum), (msg))
#define BIGTWO_ASSERT(cond, msg) do { if(!(cond)) ::bigtwo::core::error::fail(::bigtwo::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary, recoverable outcomes reported back to the caller.
    enum class RuleViolationCode : std::uint16_t
    {
        NotYourTurn,
        CardsNotOwned,
        InvalidCombo,
        CannotBeatLastPlay,
        MissingRequiredCard,
        OneCardLeftViolation,
        CannotPassWhileLeading,
        RoomLockConflict,
        StaleTimerSequence,
        GameNotInProgress
    };

    using ErrorKind = RuleViolationCode;

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<SeatIdxT> actor{};
        std::optional<SeatIdxT> turn{}; // seat that actually holds the turn

        std::optional<std::uint8_t> attempted_count{};
        std::optional<std::uint64_t> sequence_id{};

        // e.g. 3D for the opening play, the forced single for One-Card-Left
        std::optional<Card> required_card{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(SeatIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_turn(SeatIdxT s) -> RuleViolation&
        {
            turn = s;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_sequence(std::uint64_t v) -> RuleViolation&
        {
            sequence_id = v;
            return *this;
        }

        auto with_required(Card c) -> RuleViolation&
        {
            required_card = c;
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::NotYourTurn: return "Not your turn";
        case E::CardsNotOwned: return "Play: card not owned by actor";
        case E::InvalidCombo: return "Play: cards do not form a valid combo";
        case E::CannotBeatLastPlay: return "Play: does not beat the last play";
        case E::MissingRequiredCard: return "Play: opening play must include 3D";
        case E::OneCardLeftViolation: return "One card left: must play highest beating single";
        case E::CannotPassWhileLeading: return "Pass: leader cannot pass";
        case E::RoomLockConflict: return "Room busy, retry against fresh state";
        case E::StaleTimerSequence: return "Timer sequence is stale";
        case E::GameNotInProgress: return "Game is over";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::FirstPlay: return "first_play";
        case Phase::Playing: return "playing";
        case Phase::Finished: return "finished";
        case Phase::GameOver: return "game_over";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.phase) s += fmt::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += fmt::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.turn) s += fmt::format(" | turn=P{}", static_cast<int>(*v.turn));
        if (v.attempted_count) s += fmt::format(" | attempted={}", *v.attempted_count);
        if (v.sequence_id) s += fmt::format(" | seq={}", *v.sequence_id);
        if (v.required_card) s += fmt::format(" | required={}", util::ToString(*v.required_card));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //BIGTWO_EXCEPTION_HPP
