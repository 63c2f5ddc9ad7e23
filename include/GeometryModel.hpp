#ifndef GEOMETRY_MODEL_HPP
#define GEOMETRY_MODEL_HPP

#include "LineparParams.hpp"
#include <cmath>
#include <sstream>
#include <string>

// Conductor-layout helpers shared by the inductance and capacitance models.
class GeometryModel {
public:
    static void require_finite_point(const Point& p, const std::string& phase) {
        require_finite(p.x, phase + " x coordinate");
        require_finite(p.y, phase + " y coordinate");
    }

    static double distance(const Point& p, const Point& q) {
        return std::hypot(p.x - q.x, p.y - q.y);
    }

    // Distances for the three unordered phase pairs. Coincident phases make the
    // GMD zero and every later logarithm undefined, so they are rejected here.
    static PhaseSpacings pairwise_distances(const Point& a, const Point& b, const Point& c) {
        require_finite_point(a, "Phase A");
        require_finite_point(b, "Phase B");
        require_finite_point(c, "Phase C");
        PhaseSpacings s{distance(a, b), distance(b, c), distance(c, a)};
        if (s.d_ab <= 0.0) throw InvalidInput("Phases A and B coincide");
        if (s.d_bc <= 0.0) throw InvalidInput("Phases B and C coincide");
        if (s.d_ca <= 0.0) throw InvalidInput("Phases C and A coincide");
        return s;
    }

    static PhaseSpacings pairwise_distances(const ThreePhase& layout) {
        return pairwise_distances(layout.a, layout.b, layout.c);
    }

    static double geometric_mean_distance(const PhaseSpacings& s) {
        return std::cbrt(s.d_ab * s.d_bc * s.d_ca);
    }

    // Single-phase: the spacing itself. Three-phase (transposed): (Dab*Dbc*Dca)^(1/3).
    static double geometric_mean_distance(const LineGeometry& geometry) {
        if (const auto* single = std::get_if<SinglePhase>(&geometry)) {
            require_finite(single->spacing, "Conductor spacing");
            if (!(single->spacing > 0.0)) {
                std::ostringstream msg;
                msg << "Conductor spacing must be positive (got " << single->spacing << " m)";
                throw InvalidInput(msg.str());
            }
            return single->spacing;
        }
        return geometric_mean_distance(pairwise_distances(std::get<ThreePhase>(geometry)));
    }

    // Method of images: each conductor sits 2*y above its own mirror image.
    // Returns the geometric mean of the three image distances.
    static double image_distance(const ThreePhase& layout) {
        const Point* phases[3] = {&layout.a, &layout.b, &layout.c};
        const char names[3] = {'A', 'B', 'C'};
        double product = 1.0;
        for (int i = 0; i < 3; i++) {
            require_finite_point(*phases[i], std::string("Phase ") + names[i]);
            if (!(phases[i]->y > 0.0)) {
                std::ostringstream msg;
                msg << "Phase " << names[i] << " must be above ground (y = " << phases[i]->y << " m)";
                throw InvalidInput(msg.str());
            }
            product *= 2.0 * phases[i]->y;
        }
        return std::cbrt(product);
    }
};

#endif // GEOMETRY_MODEL_HPP
