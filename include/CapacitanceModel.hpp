#ifndef CAPACITANCE_MODEL_HPP
#define CAPACITANCE_MODEL_HPP

#include "LineparParams.hpp"

// Line-to-ground capacitance with the ground plane folded in by the method of images.
//
//   Single-phase:  D_eq = sqrt(s^2 + (2h)^2)
//   Three-phase:   Dp   = (2yA * 2yB * 2yC)^(1/3)
//                  D_eq = sqrt(GMD * Dp)
//   C per metre  = 2 pi eps0 / ln(D_eq / r)
//
// height_m is the average conductor height above ground. It is validated in both
// modes; for three-phase lines the phase y coordinates are the heights used.
CapacitanceResult compute_capacitance(double radius_m, double height_m,
                                      const LineGeometry& geometry, double length_km);

#endif // CAPACITANCE_MODEL_HPP
