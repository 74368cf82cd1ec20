#include "ini_reader.hpp"
#include <SimpleIni.h>
#include <fmt/core.h>
#include <stdexcept>

namespace snowgen::config {
namespace {

// Keys of one section as VALUE nodes, in the order they appear in the file
std::vector<ConfigNode> orderedValues(const CSimpleIniA &ini, const char *section)
{
    CSimpleIniA::TNamesDepend keys;
    ini.GetAllKeys(section, keys);
    keys.sort(CSimpleIniA::Entry::LoadOrder());

    std::vector<ConfigNode> values;
    for (const auto &key: keys)
        values.push_back(ConfigNode{key.pItem, ini.GetValue(section, key.pItem, ""), {}, NodeType::VALUE});
    return values;
}

} // namespace


ConfigNode parseIniFile(const std::filesystem::path &filename)
{
    CSimpleIniA ini;
    if (SI_Error rc = ini.LoadFile(filename.c_str()); rc != SI_OK)
        throw std::runtime_error(
            fmt::format("Failed to parse INI file '{}' (error code: {})", filename.string(), static_cast<int>(rc)));

    // keys before the first [section] are kept so the deserializer can reject them
    ConfigNode root{"config", "", orderedValues(ini, ""), NodeType::ROOT};

    CSimpleIniA::TNamesDepend sections;
    ini.GetAllSections(sections);
    sections.sort(CSimpleIniA::Entry::LoadOrder());

    for (const auto &section: sections) {
        if (section.pItem[0] == '\0') // global keys, handled above
            continue;
        root.children.push_back(ConfigNode{section.pItem, "", orderedValues(ini, section.pItem), NodeType::SECTION});
    }

    return root;
}

} // namespace snowgen::config
