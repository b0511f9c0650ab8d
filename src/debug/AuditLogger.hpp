//
// AuditLogger.hpp
//

#ifndef BIGTWO_AUDITLOGGER_HPP
#define BIGTWO_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace bigtwo::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, threshold, opening seat)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Per turn, before the move is submitted
        auto turn(SeatView const& v, PlayerAction const& a) -> void;

        // Per turn, when the action is not observable
        auto turn(SeatView const& v) -> void;

        auto outcome(MoveOutcome m) -> void;

        // After a match ends: the scored record
        auto match(MatchRecord const& rec) -> void;

        // Game end footer (totals and final winner)
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //BIGTWO_AUDITLOGGER_HPP
