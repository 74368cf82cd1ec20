#pragma once

#include "deserializer.hpp"
#include "generator/snowflake.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace snowgen::config {

// [general]
struct GeneralSection {
    std::string log_type = "console";
    std::string log_facility = "user";
    std::string log_priority = "info";

    void validate() const
    {
        if (log_type != "console" && log_type != "syslog")
            throw std::invalid_argument("Section 'general' must set log_type to 'console' or 'syslog'");
    }
};

SNOWGEN_REGISTER_SECTION(GeneralSection, field("log_type", &GeneralSection::log_type),
                         field("log_facility", &GeneralSection::log_facility),
                         field("log_priority", &GeneralSection::log_priority))

// [generator]
struct GeneratorSection {
    std::int64_t epoch = default_epoch;
    std::optional<long long> node_id; // unset: derive from hardware address

    void validate() const
    {
        if (epoch < 0 || epoch > max_epoch)
            throw std::invalid_argument(
                fmt::format("Section 'generator' must set epoch between 0 and {}", max_epoch));

        if (node_id && (*node_id < 0 || *node_id > codec::max_node_id))
            throw std::invalid_argument(
                fmt::format("Section 'generator' must set node_id between 0 and {}", codec::max_node_id));
    }
};

SNOWGEN_REGISTER_SECTION(GeneratorSection, field("epoch", &GeneratorSection::epoch),
                         field("node_id", &GeneratorSection::node_id))

struct Config {
    GeneralSection general;
    GeneratorSection generator;
};

template<> struct is_deserializable_struct<Config> : std::true_type { };

template<> Config deserialize<Config>(const ConfigNode &node);

// Reads and validates an INI configuration file
Config load(const std::filesystem::path &filename);

} // namespace snowgen::config
