//
// ClassicRules.hpp
//

#ifndef BIGTWO_CLASSICRULES_HPP
#define BIGTWO_CLASSICRULES_HPP
#include "Rules.hpp"

namespace bigtwo::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, SeatIdxT seat, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameImpl& game, ValidatedMove move) -> void override;
        auto Advance(GameImpl& game) -> MoveOutcome override;
    };
}

#endif //BIGTWO_CLASSICRULES_HPP
