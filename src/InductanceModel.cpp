#include "InductanceModel.hpp"
#include "GeometryModel.hpp"
#include <cmath>
#include <sstream>

InductanceResult compute_inductance(double radius_m, std::optional<double> user_gmr,
                                    const LineGeometry& geometry, double length_km) {
    require_finite(radius_m, "Conductor radius");
    if (user_gmr) require_finite(*user_gmr, "GMR");
    require_finite(length_km, "Line length");

    if (!(radius_m > 0.0)) {
        std::ostringstream msg;
        msg << "Conductor radius must be positive (got " << radius_m << " m)";
        throw InvalidInput(msg.str());
    }
    if (!(length_km > 0.0)) {
        std::ostringstream msg;
        msg << "Line length must be positive (got " << length_km << " km)";
        throw InvalidInput(msg.str());
    }

    InductanceResult result;
    result.gmr = user_gmr ? *user_gmr : SELF_GMR_FACTOR * radius_m;
    if (!(result.gmr > 0.0)) {
        std::ostringstream msg;
        msg << "GMR must be positive (got " << result.gmr << " m)";
        throw InvalidInput(msg.str());
    }

    if (const auto* layout = std::get_if<ThreePhase>(&geometry)) {
        result.spacings = GeometryModel::pairwise_distances(*layout);
        result.gmd = GeometryModel::geometric_mean_distance(*result.spacings);
    } else {
        result.gmd = GeometryModel::geometric_mean_distance(geometry);
    }

    // ln(GMD/GMR) <= 0 would give zero or negative inductance
    if (!(result.gmd > result.gmr)) {
        std::ostringstream msg;
        msg << "GMD (" << result.gmd << " m) must exceed GMR (" << result.gmr << " m)";
        throw InvalidInput(msg.str());
    }

    double l_per_m = (MU_0 / (2.0 * PI)) * std::log(result.gmd / result.gmr);
    result.per_km = l_per_m * METERS_PER_KM;
    result.total = result.per_km * length_km;
    return result;
}
