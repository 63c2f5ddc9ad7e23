#include "CapacitanceModel.hpp"
#include "GeometryModel.hpp"
#include <cmath>
#include <sstream>

CapacitanceResult compute_capacitance(double radius_m, double height_m,
                                      const LineGeometry& geometry, double length_km) {
    require_finite(radius_m, "Conductor radius");
    require_finite(height_m, "Conductor height");
    require_finite(length_km, "Line length");

    if (!(radius_m > 0.0)) {
        std::ostringstream msg;
        msg << "Conductor radius must be positive (got " << radius_m << " m)";
        throw InvalidInput(msg.str());
    }
    if (!(height_m > 0.0)) {
        std::ostringstream msg;
        msg << "Conductor height above ground must be positive (got " << height_m << " m)";
        throw InvalidInput(msg.str());
    }
    if (!(length_km > 0.0)) {
        std::ostringstream msg;
        msg << "Line length must be positive (got " << length_km << " km)";
        throw InvalidInput(msg.str());
    }

    CapacitanceResult result;
    if (const auto* single = std::get_if<SinglePhase>(&geometry)) {
        result.gmd = GeometryModel::geometric_mean_distance(geometry);
        result.d_eq = std::sqrt(single->spacing * single->spacing + (2.0 * height_m) * (2.0 * height_m));
    } else {
        const ThreePhase& layout = std::get<ThreePhase>(geometry);
        result.spacings = GeometryModel::pairwise_distances(layout);
        result.gmd = GeometryModel::geometric_mean_distance(*result.spacings);
        result.image_distance = GeometryModel::image_distance(layout);
        result.d_eq = std::sqrt(result.gmd * *result.image_distance);
    }

    if (!(result.d_eq > radius_m)) {
        std::ostringstream msg;
        msg << "Effective distance D_eq (" << result.d_eq << " m) must exceed the conductor radius ("
            << radius_m << " m)";
        throw InvalidInput(msg.str());
    }

    double c_per_m = (2.0 * PI * EPSILON_0) / std::log(result.d_eq / radius_m);
    result.per_km = c_per_m * METERS_PER_KM;
    result.total = result.per_km * length_km;
    return result;
}
