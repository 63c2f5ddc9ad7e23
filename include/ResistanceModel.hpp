#ifndef RESISTANCE_MODEL_HPP
#define RESISTANCE_MODEL_HPP

#include "LineparParams.hpp"

// Temperature-corrected resistance of a line conductor.
//   rho2 = rho1 * (T2 + theta) / (T1 + theta)
//   R/km = rho2 / area * 1000, R total = R/km * length_km
// Throws InvalidInput for a non-positive area, resistivity or length, and for
// temperatures at or below the material's inferred zero-resistance point.
ResistanceResult compute_resistance(Material material, double rho1, double area_m2,
                                    double t1, double t2, double length_km);

ResistanceResult compute_resistance(const Conductor& conductor, const OperatingConditions& conditions);

#endif // RESISTANCE_MODEL_HPP
