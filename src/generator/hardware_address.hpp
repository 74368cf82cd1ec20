#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace snowgen {

using hardware_address = std::array<std::uint8_t, 6>;

struct interface_address {
    std::string name;
    hardware_address address;
};

// Link-layer addresses of the host's interfaces, in enumeration order.
// Throws std::runtime_error if the interface list cannot be read.
std::vector<interface_address> list_hardware_addresses();

bool is_zero(const hardware_address &address);

// 6 octets read as a big-endian 48-bit integer
std::uint64_t to_integer(const hardware_address &address);

// "aa:bb:cc:dd:ee:ff" (lowercase)
std::string to_string(const hardware_address &address);

// Accepts ':' or '-' separated hex octets; throws std::invalid_argument
hardware_address parse_hardware_address(const std::string &text);

} // namespace snowgen
