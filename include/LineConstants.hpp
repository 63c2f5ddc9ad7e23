#ifndef LINE_CONSTANTS_HPP
#define LINE_CONSTANTS_HPP

#include <string>

constexpr double PI = 3.14159265358979323846;
constexpr double MU_0 = 4.0 * PI * 1e-7;      // Permeability of free space (H/m)
constexpr double EPSILON_0 = 8.854e-12;        // Permittivity of free space (F/m)
constexpr double SELF_GMR_FACTOR = 0.7788;     // GMR = 0.7788 * r for a solid round conductor

constexpr double METERS_PER_KM = 1000.0;
constexpr double M2_PER_MM2 = 1e-6;
constexpr double M_PER_MM = 1e-3;

enum class Material {
    Copper,
    Aluminum
};

// Inferred absolute temperature (deg C) of the material's resistance line
inline double temperature_constant(Material material) {
    switch (material) {
        case Material::Copper:   return 234.5;
        case Material::Aluminum: return 228.1;
    }
    return 234.5;
}

// Reference resistivity at 20 deg C (Ohm*m), used when a case omits one
inline double default_resistivity(Material material) {
    switch (material) {
        case Material::Copper:   return 1.724e-8;
        case Material::Aluminum: return 2.82e-8;
    }
    return 1.724e-8;
}

inline std::string to_string(Material material) {
    return material == Material::Copper ? "Copper" : "Aluminum";
}

// Case-insensitive. Returns false for anything that is not copper or aluminum.
bool parse_material(const std::string& text, Material& out);

#endif // LINE_CONSTANTS_HPP
