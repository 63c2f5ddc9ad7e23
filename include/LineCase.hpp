#ifndef LINE_CASE_HPP
#define LINE_CASE_HPP

#include "LineparParams.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

// Inputs of each calculation group. Every group carries its own length and
// geometry so that no value is shared between groups at computation time.
struct ResistanceInputs {
    Conductor conductor;  // radius is unused by the resistance model
    OperatingConditions conditions;
};

struct InductanceInputs {
    double radius_m;
    std::optional<double> gmr_m; // absent = derive from the radius
    LineGeometry geometry;
    double length_km;
};

struct CapacitanceInputs {
    double radius_m;
    double height_m;
    LineGeometry geometry;
    double length_km;
};

class LineCase {
public:
    std::string name;
    std::string stem; // file name without extension, set by load_from_json
    std::optional<ResistanceInputs> resistance;
    std::optional<InductanceInputs> inductance;
    std::optional<CapacitanceInputs> capacitance;

    bool load_from_json(const std::string& filepath);

    // Fills the case from an already parsed document. Top-level "length_km" and
    // "geometry" act as defaults for the sections; absent sections stay empty.
    bool load(const json& data);

    // Classroom defaults: copper, 300 mm^2, 20/50 C, r = 10 mm, 10 km, 10 m high,
    // phases at (0,10) (6,10) (12,10).
    static LineCase defaults();
};

#endif // LINE_CASE_HPP
