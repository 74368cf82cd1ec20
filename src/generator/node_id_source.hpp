#pragma once
#include "hardware_address.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace snowgen {

// Strategy producing the 10-bit node id of a generator
class node_id_source {
public:
    virtual ~node_id_source() = default;

    // std::nullopt when this source has nothing to offer
    virtual std::optional<std::uint16_t> resolve() = 0;

    virtual std::string describe() const = 0;
};


// Explicitly assigned node id
class override_node_id_source : public node_id_source {
public:
    // Throws configuration_error unless node_id is in [0, 1023]
    explicit override_node_id_source(long long node_id);

    std::optional<std::uint16_t> resolve() override { return node_id_; }
    std::string describe() const override;

private:
    std::uint16_t node_id_;
};


// Node id taken from the first non-zero hardware address, modulo 1024
class hardware_address_node_id_source : public node_id_source {
public:
    using enumerator = std::function<std::vector<interface_address>()>;

    explicit hardware_address_node_id_source(enumerator enumerate = list_hardware_addresses);

    // Enumeration errors are logged and reported as std::nullopt
    std::optional<std::uint16_t> resolve() override;
    std::string describe() const override { return "hardware address"; }

private:
    enumerator enumerate_;
};


std::uint16_t node_id_from_address(const hardware_address &address);

// Uniform in [0, 1023]
std::uint16_t random_node_id();

// Resolves through source, falling back to random_node_id() with a warning
std::uint16_t resolve_node_id(node_id_source &source);

} // namespace snowgen
