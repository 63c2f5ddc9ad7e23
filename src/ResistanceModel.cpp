#include "ResistanceModel.hpp"
#include <sstream>

ResistanceResult compute_resistance(Material material, double rho1, double area_m2,
                                    double t1, double t2, double length_km) {
    require_finite(rho1, "Reference resistivity");
    require_finite(area_m2, "Cross-sectional area");
    require_finite(t1, "Reference temperature T1");
    require_finite(t2, "Operating temperature T2");
    require_finite(length_km, "Line length");

    if (!(area_m2 > 0.0)) {
        std::ostringstream msg;
        msg << "Cross-sectional area must be positive (got " << area_m2 << " m^2)";
        throw InvalidInput(msg.str());
    }
    if (!(rho1 > 0.0)) {
        std::ostringstream msg;
        msg << "Reference resistivity must be positive (got " << rho1 << " Ohm*m)";
        throw InvalidInput(msg.str());
    }
    if (!(length_km > 0.0)) {
        std::ostringstream msg;
        msg << "Line length must be positive (got " << length_km << " km)";
        throw InvalidInput(msg.str());
    }

    const double theta = temperature_constant(material);
    const double denom = t1 + theta;
    if (denom == 0.0) {
        std::ostringstream msg;
        msg << "T1 + theta is zero for " << to_string(material) << " (T1 = " << t1 << " C)";
        throw InvalidInput(msg.str());
    }
    // Below -theta the linear model gives zero or negative resistivity.
    if (denom < 0.0 || t2 + theta <= 0.0) {
        std::ostringstream msg;
        msg << "Temperatures must stay above " << -theta << " C for " << to_string(material)
            << " (T1 = " << t1 << " C, T2 = " << t2 << " C)";
        throw InvalidInput(msg.str());
    }

    ResistanceResult result;
    result.rho2 = rho1 * ((t2 + theta) / denom);
    result.per_km = (result.rho2 / area_m2) * METERS_PER_KM;
    result.total = result.per_km * length_km;
    return result;
}

ResistanceResult compute_resistance(const Conductor& conductor, const OperatingConditions& conditions) {
    return compute_resistance(conductor.material, conductor.resistivity, conductor.area,
                              conditions.t1, conditions.t2, conditions.length_km);
}
