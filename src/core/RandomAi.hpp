//
// RandomAi.hpp
//

#ifndef BIGTWO_RANDOMAI_HPP
#define BIGTWO_RANDOMAI_HPP

#include <random>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bigtwo::core
{
    // Uniform over the legal plays, plus the pass when one is allowed.
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto ChooseMove(std::shared_ptr<SeatView const> view,
                        std::chrono::steady_clock::time_point deadline) -> PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };

    // Sheds the weakest legal play, passes only when nothing is playable.
    class BasicBot final : public Player
    {
    public:
        auto ChooseMove(std::shared_ptr<SeatView const> view,
                        std::chrono::steady_clock::time_point deadline) -> PlayerAction override;
    };
}

#endif //BIGTWO_RANDOMAI_HPP
