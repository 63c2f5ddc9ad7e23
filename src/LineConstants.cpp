#include "LineConstants.hpp"
#include <algorithm>
#include <cctype>

bool parse_material(const std::string& text, Material& out) {
    std::string key = text;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "copper" || key == "cu") {
        out = Material::Copper;
        return true;
    }
    if (key == "aluminum" || key == "aluminium" || key == "al") {
        out = Material::Aluminum;
        return true;
    }
    return false;
}
