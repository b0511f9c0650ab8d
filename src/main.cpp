//
// main.cpp: local self-play driver
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "core/Game.hpp"
#include "core/ClassicRules.hpp"
#include "core/RandomAi.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/RecordingPlayer.hpp"

namespace
{
    struct CliConfig
    {
        std::uint64_t seed{123456789ULL};
        std::uint32_t games{1};
        std::uint32_t threshold{bigtwo::core::constants::GameOverThreshold};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(5)};
        bool all_random{false};
        std::optional<std::string> audit_path{};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--threshold")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.threshold = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turn_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--random")
            {
                cfg.all_random = true;
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
        }
        return cfg;
    }

    // Even seats shed their weakest play, odd seats play at random.
    auto MakePlayers(CliConfig const& cli, std::uint64_t seed) -> std::vector<std::unique_ptr<bigtwo::core::Player>>
    {
        using namespace bigtwo::core;

        std::vector<std::unique_ptr<Player>> players;
        players.reserve(constants::NumSeats);
        for (std::size_t i = 0; i < constants::NumSeats; ++i)
        {
            if (cli.all_random || i % 2 == 1)
            {
                players.emplace_back(std::make_unique<RandomAI>(seed + static_cast<std::uint64_t>(i * 1337u)));
            }
            else
            {
                players.emplace_back(std::make_unique<BasicBot>());
            }
        }
        return debug::WrapRecording(players);
    }
}

int main(int argc, char** argv)
{
    using namespace bigtwo::core;

    CliConfig const cli = ParseArgs(argc, argv);

    std::optional<debug::AuditLogger> audit{};
    if (cli.audit_path)
    {
        audit.emplace(*cli.audit_path);
    }

    std::vector<std::uint32_t> wins(constants::NumSeats, 0);

    for (std::uint32_t g = 0; g < cli.games; ++g)
    {
        std::uint64_t const seed = cli.seed + g;

        Config cfg;
        cfg.seed = seed;
        cfg.game_over_threshold = cli.threshold;
        cfg.turn_timeout = cli.turn_timeout;

        try
        {
            GameImpl game(cfg,
                          std::make_unique<ClassicRules>(),
                          std::make_shared<SystemClock>(),
                          MakeDefaultPredicate(),
                          MakePlayers(cli, seed));

            if (audit) audit->start(game, seed);

            MoveOutcome outcome = MoveOutcome::Applied;
            std::uint64_t steps{};
            while (outcome != MoveOutcome::GameEnded)
            {
                SeatIdxT const actor = game.CurrentTurn();
                std::shared_ptr<SeatView const> const view = game.SnapshotFor(actor);

                outcome = game.Step();
                ++steps;

                if (audit)
                {
                    debug::RecordingPlayer const* rec = debug::AsRecording(game.PlayerAt(actor));
                    if (rec && rec->HasLast()) audit->turn(*view, rec->Last());
                    else audit->turn(*view);
                    audit->outcome(outcome);
                    if (outcome == MoveOutcome::MatchEnded || outcome == MoveOutcome::GameEnded)
                    {
                        audit->match(game.Totals().History().back());
                    }
                }
            }

            ScoreArrayT const& totals = game.Totals().Totals();
            SeatIdxT const winner = FindFinalWinner(totals);
            ++wins[winner];

            fmt::print("[bigtwo] game {} seed {} over after {} matches, {} steps | totals [{}] | winner P{}\n",
                       g, seed, game.Totals().MatchesPlayed(), steps,
                       fmt::join(totals, ", "), static_cast<int>(winner));

            if (audit)
            {
                audit->end(game);
                audit->flush();
            }
        }
        catch (error::AssertionError const& e)
        {
            fmt::print("[bigtwo] game {} aborted: {}\n  at {}\n", g, e.what(), e.location());
            return 1;
        }
    }

    fmt::print("[bigtwo] wins by seat [{}]\n", fmt::join(wins, ", "));
    return 0;
}
