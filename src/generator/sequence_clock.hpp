#pragma once
#include "clock_source.hpp"
#include <cstdint>
#include <memory>
#include <mutex>

namespace snowgen {

// Timestamp/sequence pair reserved for one id
struct tick {
    std::int64_t elapsed; // ms since the generator epoch
    std::uint16_t sequence;
};

// Owns the mutable generation state: the last issued timestamp and the
// per-millisecond sequence counter. next() is serialized internally.
class sequence_clock {
public:
    sequence_clock(std::int64_t epoch, std::shared_ptr<clock_source> clock);

    sequence_clock(const sequence_clock &) = delete;
    sequence_clock &operator=(const sequence_clock &) = delete;

    // Reserves the next (timestamp, sequence) pair. Spins when the sequence
    // wraps within one millisecond.
    // Throws clock_regression_error or timestamp_overflow_error.
    tick next();

    // -1 until the first successful next()
    std::int64_t last_timestamp() const;

private:
    std::int64_t elapsed_now() const { return clock_->now_ms() - epoch_; }

    const std::int64_t epoch_;
    std::shared_ptr<clock_source> clock_;

    mutable std::mutex mutex_;
    std::uint16_t sequence_ = 0;
    std::int64_t last_timestamp_ = -1;
};

} // namespace snowgen
