#include "LineCase.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

constexpr double DEFAULT_LENGTH_KM = 10.0;
constexpr double DEFAULT_AREA_MM2 = 300.0;
constexpr double DEFAULT_T1 = 20.0;
constexpr double DEFAULT_T2 = 50.0;
constexpr double DEFAULT_RADIUS_MM = 10.0;
constexpr double DEFAULT_SPACING_M = 2.0;
constexpr double DEFAULT_HEIGHT_M = 10.0;

LineGeometry default_geometry() {
    return ThreePhase{{0.0, 10.0}, {6.0, 10.0}, {12.0, 10.0}};
}

// Accepts [x, y] or {"x": .., "y": ..}
Point parse_point(const json& item) {
    if (item.is_array()) {
        if (item.size() != 2) {
            throw std::runtime_error("phase coordinate must be [x, y]");
        }
        return Point{item.at(0).get<double>(), item.at(1).get<double>()};
    }
    return Point{item.at("x").get<double>(), item.at("y").get<double>()};
}

LineGeometry parse_geometry(const json& node) {
    std::string type = node.value("type", "three_phase");
    if (type == "single" || type == "single_phase") {
        return SinglePhase{node.value("spacing", DEFAULT_SPACING_M)};
    }
    if (type == "three_phase" || type == "three") {
        if (!node.contains("phases")) {
            return default_geometry();
        }
        const json& phases = node.at("phases");
        if (!phases.is_array() || phases.size() != 3) {
            throw std::runtime_error("three_phase geometry needs exactly 3 phases");
        }
        return ThreePhase{parse_point(phases[0]), parse_point(phases[1]), parse_point(phases[2])};
    }
    throw std::runtime_error("unknown geometry type: " + type);
}

// "gmr_m": 0, "auto", null or a missing key all mean "derive from the radius"
std::optional<double> parse_gmr(const json& section) {
    if (!section.contains("gmr_m")) return std::nullopt;
    const json& gmr = section.at("gmr_m");
    if (gmr.is_null()) return std::nullopt;
    if (gmr.is_string()) {
        if (gmr.get<std::string>() == "auto") return std::nullopt;
        throw std::runtime_error("gmr_m must be a number or \"auto\"");
    }
    double value = gmr.get<double>();
    if (value == 0.0) return std::nullopt;
    return value;
}

} // namespace

bool LineCase::load_from_json(const std::string& filepath) {
    std::ifstream f(filepath);
    if (!f.is_open()) {
        std::cerr << "Failed to open file: " << filepath << std::endl;
        return false;
    }

    json data;
    try {
        data = json::parse(f);
    } catch (const json::parse_error& e) {
        std::cerr << "JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return false;
    }
    if (!load(data)) {
        return false;
    }
    stem = std::filesystem::path(filepath).stem().string();
    return true;
}

bool LineCase::load(const json& data) {
    // Parsed into locals so a rejected document leaves *this untouched
    std::string case_name = "line";
    std::optional<ResistanceInputs> r_in;
    std::optional<InductanceInputs> l_in;
    std::optional<CapacitanceInputs> c_in;

    try {
        case_name = data.value("name", "line");
        double length_km = data.value("length_km", DEFAULT_LENGTH_KM);
        LineGeometry geometry = data.contains("geometry") ? parse_geometry(data.at("geometry"))
                                                          : default_geometry();

        if (data.contains("resistance")) {
            const json& sec = data.at("resistance");
            Material material = Material::Copper;
            std::string material_name = sec.value("material", "copper");
            if (!parse_material(material_name, material)) {
                std::cerr << "Unknown conductor material: " << material_name << std::endl;
                return false;
            }

            ResistanceInputs in;
            in.conductor.material = material;
            in.conductor.resistivity = sec.value("resistivity", default_resistivity(material));
            in.conductor.area = sec.value("area_mm2", DEFAULT_AREA_MM2) * M2_PER_MM2;
            in.conductor.radius = sec.value("radius_mm", DEFAULT_RADIUS_MM) * M_PER_MM;
            in.conditions.t1 = sec.value("t1", DEFAULT_T1);
            in.conditions.t2 = sec.value("t2", DEFAULT_T2);
            in.conditions.length_km = sec.value("length_km", length_km);
            r_in = in;
        }

        if (data.contains("inductance")) {
            const json& sec = data.at("inductance");
            l_in = InductanceInputs{
                sec.value("radius_mm", DEFAULT_RADIUS_MM) * M_PER_MM,
                parse_gmr(sec),
                sec.contains("geometry") ? parse_geometry(sec.at("geometry")) : geometry,
                sec.value("length_km", length_km)};
        }

        if (data.contains("capacitance")) {
            const json& sec = data.at("capacitance");
            c_in = CapacitanceInputs{
                sec.value("radius_mm", DEFAULT_RADIUS_MM) * M_PER_MM,
                sec.value("height_m", DEFAULT_HEIGHT_M),
                sec.contains("geometry") ? parse_geometry(sec.at("geometry")) : geometry,
                sec.value("length_km", length_km)};
        }
    } catch (const json::exception& e) {
        std::cerr << "Invalid line case '" << case_name << "': " << e.what() << std::endl;
        return false;
    } catch (const std::runtime_error& e) {
        std::cerr << "Invalid line case '" << case_name << "': " << e.what() << std::endl;
        return false;
    }

    name = case_name;
    resistance = r_in;
    inductance = l_in;
    capacitance = c_in;
    return true;
}

LineCase LineCase::defaults() {
    LineCase c;
    c.name = "default";

    ResistanceInputs r;
    r.conductor = Conductor{Material::Copper, default_resistivity(Material::Copper),
                            DEFAULT_AREA_MM2 * M2_PER_MM2, DEFAULT_RADIUS_MM * M_PER_MM};
    r.conditions = OperatingConditions{DEFAULT_T1, DEFAULT_T2, DEFAULT_LENGTH_KM};
    c.resistance = r;

    c.inductance = InductanceInputs{DEFAULT_RADIUS_MM * M_PER_MM, std::nullopt,
                                    default_geometry(), DEFAULT_LENGTH_KM};
    c.capacitance = CapacitanceInputs{DEFAULT_RADIUS_MM * M_PER_MM, DEFAULT_HEIGHT_M,
                                      default_geometry(), DEFAULT_LENGTH_KM};
    return c;
}
