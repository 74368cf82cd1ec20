#include "hardware_address.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <memory>
#include <net/if.h>
#include <stdexcept>
#include <sys/socket.h>

namespace snowgen {

std::vector<interface_address> list_hardware_addresses()
{
    ifaddrs *head = nullptr;
    if (getifaddrs(&head) == -1)
        throw std::runtime_error(fmt::format("getifaddrs() failed: {}", utils::string::str_err(errno)));

    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard(head, &freeifaddrs);

    std::vector<interface_address> result;
    for (const ifaddrs *ifa = head; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET)
            continue;

        const auto *ll = reinterpret_cast<const sockaddr_ll *>(ifa->ifa_addr);
        if (ll->sll_halen != std::tuple_size<hardware_address>::value)
            continue;

        interface_address entry{ifa->ifa_name, {}};
        std::copy(ll->sll_addr, ll->sll_addr + entry.address.size(), entry.address.begin());
        result.push_back(std::move(entry));
    }

    return result;
}


bool is_zero(const hardware_address &address)
{
    return std::all_of(address.begin(), address.end(), [](std::uint8_t octet) { return octet == 0; });
}


std::uint64_t to_integer(const hardware_address &address)
{
    std::uint64_t value = 0;
    for (std::uint8_t octet: address)
        value = (value << 8) | octet;
    return value;
}


std::string to_string(const hardware_address &address)
{
    return fmt::format("{:02x}", fmt::join(address, ":"));
}


hardware_address parse_hardware_address(const std::string &text)
{
    hardware_address address{};
    std::size_t pos = 0;

    for (std::size_t i = 0; i < address.size(); ++i) {
        if (i > 0) {
            if (pos >= text.size() || (text[pos] != ':' && text[pos] != '-'))
                throw std::invalid_argument(fmt::format("Invalid hardware address '{}'", text));
            ++pos;
        }

        if (pos + 2 > text.size() || !std::isxdigit(static_cast<unsigned char>(text[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(text[pos + 1])))
            throw std::invalid_argument(fmt::format("Invalid hardware address '{}'", text));

        address[i] = static_cast<std::uint8_t>(std::stoul(text.substr(pos, 2), nullptr, 16));
        pos += 2;
    }

    if (pos != text.size())
        throw std::invalid_argument(fmt::format("Invalid hardware address '{}' (trailing characters)", text));

    return address;
}

} // namespace snowgen
