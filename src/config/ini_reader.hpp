#pragma once

#include "config_node.hpp"
#include <filesystem>

namespace snowgen::config {

[[nodiscard]] ConfigNode parseIniFile(const std::filesystem::path &filename);

} // namespace snowgen::config
