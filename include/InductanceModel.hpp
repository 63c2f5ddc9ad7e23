#ifndef INDUCTANCE_MODEL_HPP
#define INDUCTANCE_MODEL_HPP

#include "LineparParams.hpp"
#include <optional>

// L per metre = (mu0 / 2pi) * ln(GMD / GMR)
// When user_gmr is absent the GMR is derived as 0.7788 * radius. A supplied GMR is
// used as-is.
InductanceResult compute_inductance(double radius_m, std::optional<double> user_gmr,
                                    const LineGeometry& geometry, double length_km);

#endif // INDUCTANCE_MODEL_HPP
