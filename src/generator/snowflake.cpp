#include "snowflake.hpp"
#include "snowflake_exception.hpp"
#include <fmt/core.h>

namespace snowgen {
namespace {

std::int64_t checked_epoch(std::int64_t epoch)
{
    if (epoch < 0 || epoch > max_epoch)
        throw configuration_error(fmt::format("epoch {} out of range (must be between 0 and {})", epoch, max_epoch));
    return epoch;
}

std::uint16_t initial_node_id(std::optional<long long> node_id_override)
{
    if (node_id_override) {
        override_node_id_source source(*node_id_override);
        return resolve_node_id(source);
    }

    hardware_address_node_id_source source;
    return resolve_node_id(source);
}

} // namespace


snowflake::snowflake(std::int64_t epoch, std::optional<long long> node_id_override)
    : epoch_(checked_epoch(epoch)), node_id_(initial_node_id(node_id_override)),
      clock_(epoch, std::make_shared<system_clock_source>())
{ }


snowflake::snowflake(std::int64_t epoch, node_id_source &source, std::shared_ptr<clock_source> clock)
    : epoch_(checked_epoch(epoch)), node_id_(resolve_node_id(source)), clock_(epoch, std::move(clock))
{ }


std::uint64_t snowflake::generate()
{
    const tick t = clock_.next();
    return codec::encode(t.elapsed, node_id_, t.sequence);
}

} // namespace snowgen
