//
// AutoPass.hpp
//

#ifndef BIGTWO_AUTOPASS_HPP
#define BIGTWO_AUTOPASS_HPP

#include <expected>
#include <functional>
#include <vector>

#include "Exception.hpp"
#include "State.hpp"

namespace bigtwo::core
{
    struct CascadeReport
    {
        bool ran{false}; // false when the call found nothing to do
        uint64_t sequence_id{};
        SeatIdxT exempt_seat{};
        std::vector<SeatIdxT> passed; // seats this cascade passed, in order
        uint32_t swallowed{};         // rejected steps that were logged and skipped
        uint32_t lock_retries{};
        bool completed{false};        // the timer is gone once the cascade returns
    };

    // Reads the committed state of the room at call time.
    using LiveStateFn = std::function<TurnState()>;
    // Passes seat on behalf of the timer with the given sequence_id.
    using CascadePassFn = std::function<std::expected<TurnState, error::RuleViolation>(SeatIdxT, uint64_t)>;

    auto IsExpired(AutoPassTimer const& timer, int64_t now_ms) -> bool;

    // Passes every non-exempt seat in turn order. The seat to pass is taken from
    // live() right before each step, so passes made by anyone else in between are
    // simply skipped. Rejected steps never abort the remaining ones.
    auto RunCascade(LiveStateFn const& live,
                    CascadePassFn const& pass,
                    ActiveTimer const& timer,
                    uint32_t lock_retries) -> CascadeReport;
}

#endif //BIGTWO_AUTOPASS_HPP
