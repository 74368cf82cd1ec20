#include "config.hpp"
#include "ini_reader.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace snowgen::config {

template<> Config deserialize<Config>(const ConfigNode &node)
{
    if (!node.isRoot())
        throw std::invalid_argument("Config deserializer requires a root ConfigNode");

    Config config{};

    for (const auto &child: node.children) {
        if (!child.isSection())
            throw std::invalid_argument("Global keys are not allowed in configuration; found key: '" + child.key + "'");

        if (child.key == "general")
            config.general = deserialize<GeneralSection>(child);
        else if (child.key == "generator")
            config.generator = deserialize<GeneratorSection>(child);
        else // allow for forward-compatibility
            spdlog::warn("Unknown configuration section '[{}]' ignored", child.key);
    }

    return config;
}


Config load(const std::filesystem::path &filename)
{
    return parse<Config>(parseIniFile(filename));
}

} // namespace snowgen::config
