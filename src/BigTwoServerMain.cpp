//
// BigTwoServerMain.cpp: authoritative table server using WebSocket++
//

#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Engine.hpp"
#include "core/RandomAi.hpp"
#include "core/Exception.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::string room{"table-1"};
        std::uint64_t seed{123456789ULL};
        std::uint32_t threshold{bigtwo::core::constants::GameOverThreshold};
        std::chrono::milliseconds auto_pass{bigtwo::core::constants::AutoPassDuration};
        std::chrono::milliseconds poll{std::chrono::milliseconds(50)};
        std::chrono::milliseconds bot_delay{std::chrono::milliseconds(750)};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

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

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--threshold")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.threshold = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--autopass_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.auto_pass = std::chrono::milliseconds(v); }
            }
            else if (arg == "--bot_delay_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.bot_delay = std::chrono::milliseconds(v); }
            }
            else if (arg == "--room")
            {
                if (i + 1 < argc) { cfg.room = argv[++i]; }
            }
        }
        return cfg;
    }

    // Which connection sits in which seat. Seats without one are played by a bot.
    class SeatTable
    {
    public:
        auto Bind(Hdl hdl, bigtwo::core::SeatIdxT seat) -> bool
        {
            std::lock_guard lock(mtx_);
            if (hdls_[seat].has_value()) return false;
            hdls_[seat] = hdl;
            seats_[hdl] = seat;
            return true;
        }

        auto Release(Hdl hdl) -> std::optional<bigtwo::core::SeatIdxT>
        {
            std::lock_guard lock(mtx_);
            auto const it = seats_.find(hdl);
            if (it == seats_.end()) return std::nullopt;
            bigtwo::core::SeatIdxT const seat = it->second;
            seats_.erase(it);
            hdls_[seat].reset();
            return seat;
        }

        auto SeatOf(Hdl hdl) const -> std::optional<bigtwo::core::SeatIdxT>
        {
            std::lock_guard lock(mtx_);
            auto const it = seats_.find(hdl);
            if (it == seats_.end()) return std::nullopt;
            return it->second;
        }

        auto Connected(bigtwo::core::SeatIdxT seat) const -> bool
        {
            std::lock_guard lock(mtx_);
            return hdls_[seat].has_value();
        }

        auto Handles() const -> std::vector<std::pair<bigtwo::core::SeatIdxT, Hdl>>
        {
            std::lock_guard lock(mtx_);
            std::vector<std::pair<bigtwo::core::SeatIdxT, Hdl>> out;
            for (bigtwo::core::SeatIdxT s = 0; s < bigtwo::core::constants::NumSeats; ++s)
            {
                if (hdls_[s]) out.emplace_back(s, *hdls_[s]);
            }
            return out;
        }

    private:
        mutable std::mutex mtx_;
        std::array<std::optional<Hdl>, bigtwo::core::constants::NumSeats> hdls_{};
        std::map<Hdl, bigtwo::core::SeatIdxT, std::owner_less<Hdl>> seats_;
    };

    void SendBuffer(WsServer& ep, Hdl hdl, flatbuffers::DetachedBuffer const& buf)
    {
        websocketpp::lib::error_code ec;
        ep.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            fmt::print("[bigtwod] send failed: {}\n", ec.message());
        }
    }

    void BroadcastSnapshots(WsServer& ep,
                            bigtwo::core::Engine const& engine,
                            std::string const& room,
                            SeatTable const& seats,
                            std::atomic<std::uint64_t>& msg_id)
    {
        for (auto const& [seat, hdl] : seats.Handles())
        {
            std::shared_ptr<bigtwo::core::SeatView const> const view = engine.ViewFor(room, seat);
            SendBuffer(ep, hdl, bigtwo::core::net::BuildSnapshot(room, *view, msg_id++));
        }
    }

    // Binds and starts accepting; failures surface as NetworkError.
    auto Listen(WsServer& ep, std::uint16_t const port) -> void
    {
        websocketpp::lib::error_code ec;
        ep.listen(port, ec);
        if (!ec) ep.start_accept(ec);
        if (ec)
        {
            BIGTWO_THROW(bigtwo::core::error::Code::Network,
                         fmt::format("Cannot listen on port {}: {}", port, ec.message()));
        }
    }
}

int main(int argc, char** argv)
{
    using namespace bigtwo::core;

    ServerConfig const sc = ParseArgs(argc, argv);

    fmt::print("[bigtwod] starting on port {} hosting room '{}'\n", sc.port, sc.room);

    Config cfg;
    cfg.seed = sc.seed;
    cfg.game_over_threshold = sc.threshold;
    cfg.auto_pass_duration = sc.auto_pass;

    Engine engine(std::make_shared<SystemClock>());
    engine.CreateRoom(sc.room, cfg);

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    SeatTable seats;
    std::atomic<std::uint64_t> msg_id{1};
    std::atomic<bool> running{true};

    auto reply_violation = [&](Hdl hdl, error::RuleViolation const& v)
    {
        SendBuffer(*ep, hdl, net::BuildViolation(v, msg_id++));
    };

    ep->set_close_handler([&](Hdl hdl)
    {
        if (auto const seat = seats.Release(hdl))
        {
            fmt::print("[bigtwod] seat {} disconnected, bot takes over\n", static_cast<int>(*seat));
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        auto const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto const parsed = net::DecodeClientMessage(bytes);
        if (!parsed.has_value())
        {
            fmt::print("[bigtwod] parse error: {}\n", parsed.error().message);
            return;
        }

        std::visit([&]<typename T0>(T0 const& m)
        {
            using T = std::decay_t<T0>;

            if (m.room != sc.room)
            {
                fmt::print("[bigtwod] message for unknown room '{}' ignored\n", m.room);
                return;
            }

            if constexpr (std::is_same_v<T, net::JoinRequest>)
            {
                if (!seats.Bind(hdl, m.seat))
                {
                    websocketpp::lib::error_code ec;
                    ep->close(hdl, websocketpp::close::status::try_again_later, "Seat occupied", ec);
                    return;
                }
                fmt::print("[bigtwod] client joined seat {}\n", static_cast<int>(m.seat));
                SendBuffer(*ep, hdl, net::BuildSnapshot(sc.room, *engine.ViewFor(sc.room, m.seat), msg_id++));
            }
            else if constexpr (std::is_same_v<T, net::DecodedAction>)
            {
                // Anti-spoof: actor must be the seat bound to this connection.
                std::optional<SeatIdxT> const seat = seats.SeatOf(hdl);
                if (!seat || *seat != m.actor)
                {
                    fmt::print("[bigtwod] spoofed actor {} rejected\n", static_cast<int>(m.actor));
                    return;
                }

                TransitionResult const res = std::holds_alternative<PlayAction>(m.action)
                    ? engine.Play(sc.room, m.actor, std::get<PlayAction>(m.action).cards)
                    : engine.Pass(sc.room, m.actor);

                if (!res.has_value())
                {
                    reply_violation(hdl, res.error());
                    return;
                }
                BroadcastSnapshots(*ep, engine, sc.room, seats, msg_id);
            }
            else
            {
                // Any client may report an expiry; only a due, live timer runs.
                TurnState const s = engine.GetState(sc.room);
                ActiveTimer const* t = ActiveOf(s.timer);
                if (t == nullptr || t->sequence_id != m.sequence_id)
                {
                    reply_violation(hdl, error::Viol(error::RuleViolationCode::StaleTimerSequence)
                                    .with_sequence(m.sequence_id));
                    return;
                }
                if (engine.OnTimerExpired(sc.room).ran)
                {
                    BroadcastSnapshots(*ep, engine, sc.room, seats, msg_id);
                }
            }
        }, *parsed);
    });

    try
    {
        Listen(*ep, sc.port);
    }
    catch (error::NetworkError const& e)
    {
        fmt::print("[bigtwod] {}\n", e.what());
        return 1;
    }

    std::thread net_thr([ep]
    {
        ep->run();
    });

    // Timer expiry and bot seats are driven from here.
    std::thread poll_thr([&]
    {
        BasicBot bot;
        auto next_bot_move = std::chrono::steady_clock::now() + sc.bot_delay;

        while (running.load())
        {
            std::this_thread::sleep_for(sc.poll);

            if (!engine.ExpireDueTimers().empty())
            {
                BroadcastSnapshots(*ep, engine, sc.room, seats, msg_id);
            }

            TurnState const s = engine.GetState(sc.room);
            if (s.phase == Phase::GameOver)
            {
                SeatIdxT const winner = FindFinalWinner(s.totals);
                fmt::print("[bigtwod] game over | totals [{}] | winner P{}\n",
                           fmt::join(s.totals, ", "), static_cast<int>(winner));
                running.store(false);
                break;
            }

            if (seats.Connected(s.current_turn)) continue;
            if (std::chrono::steady_clock::now() < next_bot_move) continue;

            std::shared_ptr<SeatView const> const view = engine.ViewFor(sc.room, s.current_turn);
            PlayerAction const action = bot.ChooseMove(view, std::chrono::steady_clock::now() + sc.poll);

            TransitionResult const res = std::holds_alternative<PlayAction>(action)
                ? engine.Play(sc.room, s.current_turn, std::get<PlayAction>(action).cards)
                : engine.Pass(sc.room, s.current_turn);

            if (!res.has_value())
            {
                // Lost a race with a client or the cascade; retry on fresh state.
                if (res.error().code != error::RuleViolationCode::RoomLockConflict &&
                    res.error().code != error::RuleViolationCode::NotYourTurn)
                {
                    fmt::print("[bigtwod] bot seat {} rejected: {}\n",
                               static_cast<int>(s.current_turn), error::describe(res.error()));
                }
                continue;
            }

            next_bot_move = std::chrono::steady_clock::now() + sc.bot_delay;
            BroadcastSnapshots(*ep, engine, sc.room, seats, msg_id);
        }
    });

    if (poll_thr.joinable())
    {
        poll_thr.join();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    ep->stop_listening();
    for (auto const& conn : seats.Handles())
    {
        websocketpp::lib::error_code ec;
        ep->close(conn.second, websocketpp::close::status::going_away, "Game over", ec);
    }
    ep->stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return 0;
}
