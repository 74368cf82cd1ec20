#include "sequence_clock.hpp"
#include "codec.hpp"
#include "snowflake_exception.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace snowgen {

sequence_clock::sequence_clock(std::int64_t epoch, std::shared_ptr<clock_source> clock)
    : epoch_(epoch), clock_(std::move(clock))
{
    if (!clock_)
        throw std::invalid_argument("sequence_clock requires a clock source");
}


tick sequence_clock::next()
{
    std::lock_guard lock(mutex_);

    std::int64_t elapsed = elapsed_now();

    if (elapsed < 0)
        throw clock_regression_error(
            fmt::format("Current time precedes the epoch by {} ms, refusing to generate an id", -elapsed));

    if (elapsed < last_timestamp_)
        throw clock_regression_error(fmt::format("Clock moved backwards by {} ms since the last generated id, "
                                                 "refusing to generate an id to avoid collisions",
                                                 last_timestamp_ - elapsed));

    if (elapsed > codec::max_timestamp)
        throw timestamp_overflow_error(
            fmt::format("{} ms since the epoch does not fit in {} bits", elapsed, codec::timestamp_bits));

    std::uint16_t sequence = 0;
    if (elapsed == last_timestamp_) {
        sequence = (sequence_ + 1) & codec::max_sequence;

        // sequence exhausted for this millisecond, spin until the next one
        if (sequence == 0) {
            while (elapsed <= last_timestamp_)
                elapsed = elapsed_now();

            if (elapsed > codec::max_timestamp)
                throw timestamp_overflow_error(
                    fmt::format("{} ms since the epoch does not fit in {} bits", elapsed, codec::timestamp_bits));
        }
    }

    sequence_ = sequence;
    last_timestamp_ = elapsed;
    return tick{elapsed, sequence};
}


std::int64_t sequence_clock::last_timestamp() const
{
    std::lock_guard lock(mutex_);
    return last_timestamp_;
}

} // namespace snowgen
