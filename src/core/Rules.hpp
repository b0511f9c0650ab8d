//
// Rules.hpp
//

#ifndef BIGTWO_RULES_HPP
#define BIGTWO_RULES_HPP

#include <expected>
#include <optional>

#include "Actions.hpp"
#include "Combo.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace bigtwo::core
{
    //forward declaration
    class GameImpl;

    // A move that passed validation. play is empty for a pass.
    struct ValidatedMove
    {
        SeatIdxT seat{};
        std::optional<Combo> play{};
    };

    class Rules
    {
    public:
        using CheckResult = std::expected<ValidatedMove, error::RuleViolation>;

        virtual ~Rules() = default;

        // Ordinary violations come back as values. Throws only on engine misuse.
        virtual auto Validate(GameImpl const& game, SeatIdxT seat, PlayerAction const& a) const -> CheckResult = 0;

        // Commits a validated move: hand to played pile, lead, pass counter, countdown, turn.
        virtual auto Apply(GameImpl& game, ValidatedMove move) -> void = 0;

        // Match end or trick clear once the move is in.
        virtual auto Advance(GameImpl& game) -> MoveOutcome = 0;
    };
}

#endif //BIGTWO_RULES_HPP
