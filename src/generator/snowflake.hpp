#pragma once
#include "clock_source.hpp"
#include "codec.hpp"
#include "node_id_source.hpp"
#include "sequence_clock.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>

namespace snowgen {

// Twitter epoch, Nov 04 2010 01:42:54.657 UTC
constexpr std::int64_t default_epoch = 1288834974657;

// Largest epoch for which epoch + any 41-bit timestamp stays representable
constexpr std::int64_t max_epoch = std::numeric_limits<std::int64_t>::max() - codec::max_timestamp;

// Generates 64-bit time-ordered ids for one node.
// generate() may be called from several threads; ids stay unique and
// increasing for this instance as long as the clock does not go backwards.
class snowflake {
public:
    // Node id is node_id_override when given, otherwise derived from the
    // host's hardware address, otherwise random.
    // Throws configuration_error for an override outside [0, 1023] or an
    // epoch outside [0, max_epoch].
    explicit snowflake(std::int64_t epoch = default_epoch, std::optional<long long> node_id_override = std::nullopt);

    // Throws configuration_error for an epoch outside [0, max_epoch]
    snowflake(std::int64_t epoch, node_id_source &source,
              std::shared_ptr<clock_source> clock = std::make_shared<system_clock_source>());

    snowflake(const snowflake &) = delete;
    snowflake &operator=(const snowflake &) = delete;

    std::uint16_t node_id() const { return node_id_; }
    std::int64_t epoch() const { return epoch_; }

    // Throws clock_regression_error if the clock moved backwards since the
    // previous id, timestamp_overflow_error past the 41-bit range.
    std::uint64_t generate();

    codec::decoded_id decode(std::uint64_t id) const { return codec::decode(id, epoch_); }

private:
    const std::int64_t epoch_;
    const std::uint16_t node_id_;
    sequence_clock clock_;
};

} // namespace snowgen
