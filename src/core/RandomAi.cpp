//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <utility>
#include <vector>

#include "MoveGen.hpp"
#include "Validator.hpp"

namespace bigtwo::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(rng_seed) {}

    auto RandomAI::ChooseMove(std::shared_ptr<SeatView const> view,
                              std::chrono::steady_clock::time_point deadline) -> PlayerAction
    {
        (void)deadline;

        std::vector<PlayerAction> options;
        for (Combo& c : LegalPlays(*view))
        {
            options.emplace_back(PlayAction{std::move(c.cards)});
        }
        if (ValidatePass(view->seat, view->state, view->my_hand).has_value())
        {
            options.emplace_back(PassAction{});
        }

        if (options.empty()) return DefaultAction(*view);
        return options[pick(options)];
    }

    auto BasicBot::ChooseMove(std::shared_ptr<SeatView const> view,
                              std::chrono::steady_clock::time_point deadline) -> PlayerAction
    {
        (void)deadline;

        if (std::optional<Combo> rec = RecommendPlay(*view))
        {
            return PlayAction{std::move(rec->cards)};
        }
        return PassAction{};
    }
}
