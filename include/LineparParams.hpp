#ifndef LINEPARPARAMS_HPP
#define LINEPARPARAMS_HPP

#include "LineConstants.hpp"
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

// Plain value records passed into and out of the line models.
// Everything is in SI units (m, m^2, Ohm*m) except line length, which is in km.

// The only error the models raise: a violated input precondition.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Rejects NaN and infinities, which pass the "> 0" comparisons below them.
inline void require_finite(double value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw InvalidInput(what + " must be a finite number");
    }
}

struct Conductor {
    Material material = Material::Copper;
    double resistivity;  // rho1 at the reference temperature (Ohm*m)
    double area;         // cross-sectional area (m^2)
    double radius;       // (m)
};

struct Point {
    double x;
    double y; // height above ground
};

struct SinglePhase {
    double spacing; // distance between the two conductors (m)
};

struct ThreePhase {
    Point a;
    Point b;
    Point c;
};

using LineGeometry = std::variant<SinglePhase, ThreePhase>;

struct OperatingConditions {
    double t1;        // reference temperature (deg C)
    double t2;        // operating temperature (deg C)
    double length_km;
};

struct PhaseSpacings {
    double d_ab;
    double d_bc;
    double d_ca;
};

struct ResistanceResult {
    double rho2;    // corrected resistivity (Ohm*m)
    double per_km;  // Ohm/km
    double total;   // Ohm
};

struct InductanceResult {
    double gmr;     // m
    double gmd;     // m
    double per_km;  // H/km
    double total;   // H
    std::optional<PhaseSpacings> spacings; // three-phase only
};

struct CapacitanceResult {
    double gmd;     // m
    std::optional<double> image_distance; // Dp, three-phase only (m)
    double d_eq;    // effective distance (m)
    double per_km;  // F/km
    double total;   // F
    std::optional<PhaseSpacings> spacings; // three-phase only
};

#endif // LINEPARPARAMS_HPP
