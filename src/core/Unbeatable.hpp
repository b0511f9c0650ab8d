//
// Unbeatable.hpp
//

#ifndef BIGTWO_UNBEATABLE_HPP
#define BIGTWO_UNBEATABLE_HPP

#include <array>
#include <memory>
#include <optional>
#include <string_view>

#include "Combo.hpp"
#include "Util.hpp"

namespace bigtwo::core
{
    struct UnbeatableContext
    {
        SeatIdxT actor{};
        // public pile of this match, not counting the play being judged
        util::CardMask played_before{};
        // every seat's hand after the play left the actor's hand
        std::array<util::CardMask, constants::NumSeats> hands{};
    };

    // Decides whether a play should start the auto-pass countdown.
    class UnbeatablePredicate
    {
    public:
        virtual ~UnbeatablePredicate() = default;

        virtual auto IsUnbeatable(Combo const& play, UnbeatableContext const& ctx) const -> bool = 0;
        virtual auto Name() const -> std::string_view = 0;
    };

    // Public information only: nothing formable from the unplayed cards beats the play.
    // The actor's own remaining cards count as unplayed.
    class HighestRemainingPredicate final : public UnbeatablePredicate
    {
    public:
        auto IsUnbeatable(Combo const& play, UnbeatableContext const& ctx) const -> bool override;
        auto Name() const -> std::string_view override { return "highest-remaining"; }
    };

    // Looks at the other seats' actual hands. Authoritative side only.
    class FullInformationPredicate final : public UnbeatablePredicate
    {
    public:
        auto IsUnbeatable(Combo const& play, UnbeatableContext const& ctx) const -> bool override;
        auto Name() const -> std::string_view override { return "full-information"; }
    };

    // True if some combo made only of cards in pool beats play.
    auto AnyBeaterIn(util::CardMask pool, Combo const& play) -> bool;

    // Strongest key of the given type formable from pool, nullopt if none.
    auto BestKeyIn(util::CardMask pool, ComboType type) -> std::optional<uint16_t>;

    auto MakeDefaultPredicate() -> std::unique_ptr<UnbeatablePredicate>;
}

#endif //BIGTWO_UNBEATABLE_HPP
