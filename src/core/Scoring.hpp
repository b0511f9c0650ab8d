//
// Scoring.hpp
//

#ifndef BIGTWO_SCORING_HPP
#define BIGTWO_SCORING_HPP

#include <array>
#include <vector>

#include "Combo.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    using MatchScore = ScoreArrayT;
    using EndingHandSizesT = std::array<std::size_t, constants::NumSeats>;
    using ComboCountsT = std::array<std::array<uint16_t, ComboTypeCount>, constants::NumSeats>;

    // 1 for 1..4 cards left, 2 for 5..9, 3 for 10..13, 0 for an empty hand.
    auto PointsMultiplier(std::size_t cards_left) noexcept -> uint32_t;

    auto ComputeMatchScore(EndingHandSizesT const& ending_hand_sizes) -> MatchScore;

    auto IsGameOver(ScoreArrayT const& totals,
                    uint32_t threshold = constants::GameOverThreshold) noexcept -> bool;

    // Lowest total wins. On a tie the lowest seat index wins.
    auto FindFinalWinner(ScoreArrayT const& totals) noexcept -> SeatIdxT;

    // 1-based finishing place per seat, same tie-break as FindFinalWinner.
    auto FinishPositions(ScoreArrayT const& totals) -> std::array<uint8_t, constants::NumSeats>;

    struct MatchRecord
    {
        uint32_t match_number{};
        SeatIdxT winner{};
        EndingHandSizesT ending_hand_sizes{};
        MatchScore score{};
        ComboCountsT combos_played{};
    };

    class GameTotals
    {
    public:
        auto Record(MatchRecord rec) -> void;

        [[nodiscard]] auto Totals() const noexcept -> ScoreArrayT const& { return totals_; }
        [[nodiscard]] auto History() const noexcept -> std::vector<MatchRecord> const& { return history_; }
        [[nodiscard]] auto MatchesPlayed() const noexcept -> std::size_t { return history_.size(); }

    private:
        ScoreArrayT totals_{};
        std::vector<MatchRecord> history_;
    };
}

#endif //BIGTWO_SCORING_HPP
