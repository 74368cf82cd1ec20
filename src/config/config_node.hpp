#pragma once

#include <fmt/core.h>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace snowgen::config {

enum class NodeType { ROOT, SECTION, VALUE };

// Parsed INI file: ROOT holds SECTION nodes (and stray global VALUE nodes),
// each SECTION holds its key = value pairs in file order
struct ConfigNode {
    std::string key;
    std::string value;
    std::vector<ConfigNode> children;
    NodeType type = NodeType::VALUE;

    const ConfigNode *findChild(const std::string &childKey) const
    {
        if (type == NodeType::VALUE)
            throw std::logic_error(fmt::format("Value node '{}' has no child '{}'", key, childKey));

        for (const auto &child: children)
            if (child.key == childKey)
                return &child;
        return nullptr;
    }

    bool isRoot() const { return type == NodeType::ROOT; }
    bool isSection() const { return type == NodeType::SECTION; }
    bool isValue() const { return type == NodeType::VALUE; }
};

// Strict conversion: optional surrounding whitespace, nothing else ("42abc" is invalid).
// Unsigned targets reject a minus sign instead of wrapping around.
template<typename T> T fromString(const std::string &str)
{
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else {
        std::istringstream iss(str);
        iss >> std::ws;
        if constexpr (std::is_unsigned_v<T>) {
            if (iss.peek() == '-')
                throw std::runtime_error("Negative value for unsigned field: " + str);
        }

        T value;
        iss >> value;
        if (iss.fail())
            throw std::runtime_error("Bad conversion from string: " + str);

        iss >> std::ws;
        if (!iss.eof())
            throw std::runtime_error("Bad conversion (trailing characters) from string: " + str);

        return value;
    }
}

template<typename T> struct is_optional : std::false_type { };

template<typename U> struct is_optional<std::optional<U>> : std::true_type { };

} // namespace snowgen::config
