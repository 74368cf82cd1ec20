#include "codec.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace snowgen::codec {

std::uint64_t encode(std::int64_t elapsed, std::uint16_t node_id, std::uint16_t sequence)
{
    if (elapsed < 0 || elapsed > max_timestamp)
        throw std::invalid_argument(fmt::format("timestamp {} does not fit in {} bits", elapsed, timestamp_bits));

    if (node_id > max_node_id)
        throw std::invalid_argument(fmt::format("node id {} does not fit in {} bits", node_id, node_id_bits));

    if (sequence > max_sequence)
        throw std::invalid_argument(fmt::format("sequence {} does not fit in {} bits", sequence, sequence_bits));

    return (static_cast<std::uint64_t>(elapsed) << timestamp_shift) |
           (static_cast<std::uint64_t>(node_id) << node_id_shift) | static_cast<std::uint64_t>(sequence);
}


decoded_id decode(std::uint64_t id, std::int64_t epoch)
{
    const auto elapsed = static_cast<std::int64_t>((id >> timestamp_shift) & static_cast<std::uint64_t>(max_timestamp));
    return decoded_id{
        elapsed + epoch,
        static_cast<std::uint16_t>((id >> node_id_shift) & max_node_id),
        static_cast<std::uint16_t>(id & max_sequence),
    };
}

} // namespace snowgen::codec
