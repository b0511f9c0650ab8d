//
// Clock.hpp
//

#ifndef BIGTWO_CLOCK_HPP
#define BIGTWO_CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace bigtwo::core
{
    // Authoritative time source. Observers derive their clock offset from it.
    class Clock
    {
    public:
        virtual ~Clock() = default;

        // Milliseconds since the Unix epoch.
        virtual auto NowMs() const -> int64_t = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        auto NowMs() const -> int64_t override
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    };

    // Driven by hand; used by tests and replays.
    class ManualClock final : public Clock
    {
    public:
        explicit ManualClock(int64_t start_ms = 0) : now_ms_{start_ms} {}

        auto NowMs() const -> int64_t override { return now_ms_.load(); }

        auto Set(int64_t ms) -> void { now_ms_.store(ms); }
        auto Advance(std::chrono::milliseconds d) -> void { now_ms_.fetch_add(d.count()); }

    private:
        std::atomic<int64_t> now_ms_;
    };
}

#endif //BIGTWO_CLOCK_HPP
