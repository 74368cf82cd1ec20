#pragma once
#include <cstdint>

namespace snowgen::codec {

// Layout, most significant bit first:
//   [63..22] 41 bits  milliseconds since epoch
//   [21..12] 10 bits  node id
//   [11..0]  12 bits  sequence
constexpr unsigned timestamp_bits = 41;
constexpr unsigned node_id_bits = 10;
constexpr unsigned sequence_bits = 12;

constexpr unsigned node_id_shift = sequence_bits;
constexpr unsigned timestamp_shift = sequence_bits + node_id_bits;

constexpr std::int64_t max_timestamp = (std::int64_t{1} << timestamp_bits) - 1;
constexpr std::uint16_t max_node_id = (1u << node_id_bits) - 1;
constexpr std::uint16_t max_sequence = (1u << sequence_bits) - 1;

struct decoded_id {
    std::int64_t timestamp; // absolute, ms since the Unix epoch
    std::uint16_t node_id;
    std::uint16_t sequence;

    bool operator==(const decoded_id &other) const
    {
        return timestamp == other.timestamp && node_id == other.node_id && sequence == other.sequence;
    }
    bool operator!=(const decoded_id &other) const { return !(*this == other); }
};

// Throws std::invalid_argument if a field does not fit its bit width
std::uint64_t encode(std::int64_t elapsed, std::uint16_t node_id, std::uint16_t sequence);

decoded_id decode(std::uint64_t id, std::int64_t epoch);

} // namespace snowgen::codec
