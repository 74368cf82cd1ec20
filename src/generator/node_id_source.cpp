#include "node_id_source.hpp"
#include "codec.hpp"
#include "snowflake_exception.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace snowgen {
namespace {

std::mt19937_64 initialize_rng()
{
    std::random_device rd;
    return std::mt19937_64(rd());
}

thread_local std::mt19937_64 rng = initialize_rng();

} // namespace


override_node_id_source::override_node_id_source(long long node_id)
{
    if (node_id < 0 || node_id > codec::max_node_id)
        throw configuration_error(
            fmt::format("node id override out of range: {} (must be between 0 and {})", node_id, codec::max_node_id));

    node_id_ = static_cast<std::uint16_t>(node_id);
}


std::string override_node_id_source::describe() const
{
    return fmt::format("override ({})", node_id_);
}


hardware_address_node_id_source::hardware_address_node_id_source(enumerator enumerate)
    : enumerate_(std::move(enumerate))
{ }


std::optional<std::uint16_t> hardware_address_node_id_source::resolve()
{
    std::vector<interface_address> interfaces;
    try {
        interfaces = enumerate_();
    } catch (const std::exception &e) {
        spdlog::warn("Hardware address enumeration failed: {}", e.what());
        return std::nullopt;
    }

    for (const auto &iface: interfaces) {
        if (is_zero(iface.address))
            continue;

        const auto node_id = node_id_from_address(iface.address);
        spdlog::debug("Node id {} derived from interface {} ({})", node_id, iface.name, to_string(iface.address));
        return node_id;
    }

    spdlog::warn("No valid hardware address found among {} interface(s)", interfaces.size());
    return std::nullopt;
}


std::uint16_t node_id_from_address(const hardware_address &address)
{
    return static_cast<std::uint16_t>(to_integer(address) % (codec::max_node_id + 1u));
}


std::uint16_t random_node_id()
{
    std::uniform_int_distribution<std::uint16_t> uni(0, codec::max_node_id);
    return uni(rng);
}


std::uint16_t resolve_node_id(node_id_source &source)
{
    if (auto node_id = source.resolve())
        return *node_id;

    const auto node_id = random_node_id();
    spdlog::warn("Could not resolve node id from {}, using random node id {}. Ids generated by different nodes may "
                 "collide.",
                 source.describe(), node_id);
    return node_id;
}

} // namespace snowgen
