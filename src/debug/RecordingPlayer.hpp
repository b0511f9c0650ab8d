//
// RecordingPlayer.hpp
//

#ifndef BIGTWO_RECORDINGPLAYER_HPP
#define BIGTWO_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace bigtwo::core::debug
{
    // What the wrapped bot answered, and the state it answered to.
    struct Decision
    {
        uint32_t match_number{};
        uint64_t version{};
        bool leading{};
        PlayerAction action{PassAction{}};
    };

    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto ChooseMove(std::shared_ptr<SeatView const> view,
                        std::chrono::steady_clock::time_point deadline) -> PlayerAction override
        {
            Decision d{};
            d.match_number = view->state.match_number;
            d.version = view->state.version;
            d.leading = !view->state.last_play.has_value();
            d.action = inner_->ChooseMove(std::move(view), deadline);
            decisions_.push_back(d);
            return d.action;
        }

        auto HasLast() const -> bool { return !decisions_.empty(); }
        auto Last() const -> PlayerAction const& { return decisions_.back().action; }
        auto Decisions() const -> std::vector<Decision> const& { return decisions_; }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<Decision> decisions_;
    };

    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        }

        return out;
    }

    // Only safe if WrapRecording was used at construction
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
}

#endif //BIGTWO_RECORDINGPLAYER_HPP
